#include <catch2/catch_test_macros.hpp>

#include "call_engine/flow/graph.hpp"

#include <nlohmann/json.hpp>

using namespace call_engine::flow;
using nlohmann::json;

namespace {

json sample_agent() {
    return json::parse(R"({
        "id": "agent-1",
        "name": "Websites",
        "system_prompt": "You are Jake.",
        "call_flow": [
            {"id": "start", "type": "start", "data": {"transitions": [{"condition": "", "nextNode": "greet"}]}},
            {"id": "greet", "type": "conversation", "data": {
                "label": "Greeting", "mode": "script", "script": "Hi {{name}}, got a minute?",
                "goal": "Get permission to pitch",
                "transitions": [
                    {"condition": "caller agrees to talk", "nextNode": "split"},
                    {"condition": "caller is not interested", "nextNode": "bye"}
                ],
                "extract_variables": [
                    {"name": "employed", "description": "employment status", "mandatory": true,
                     "prompt_message": "Are you working at the moment?"}
                ]}},
            {"id": "split", "type": "logic_split", "data": {
                "conditions": [
                    {"variable": "income", "operator": "greater_than", "value": "5000", "nextNode": "pitch"}
                ],
                "default_next_node": "bye"}},
            {"id": "pitch", "type": "conversation", "data": {"mode": "prompt", "content": "Pitch the offer."}},
            {"id": "hook", "type": "function", "data": {
                "webhook_url": "https://hooks.example.com/book", "webhook_method": "post",
                "webhook_timeout": 2.5, "transitions": [{"condition": "", "nextNode": "bye"}]}},
            {"id": "digits", "type": "press_digit", "data": {"digits": "1#"}},
            {"id": "xfer", "type": "call_transfer", "data": {"destination": "+15550100"}},
            {"id": "ask", "type": "collect_input", "data": {"variable_name": "email"}},
            {"id": "bye", "type": "ending", "data": {"script": "Goodbye."}}
        ]
    })");
}

}

TEST_CASE("agent graph parses every node type") {
    const auto graph = FlowGraph::from_json(sample_agent());
    REQUIRE(graph.agent_id() == "agent-1");
    REQUIRE(graph.size() == 9);
    REQUIRE(graph.entry_node().id == "start");

    const auto& greet = graph.at("greet");
    REQUIRE(std::string(greet.type_name()) == "conversation");
    REQUIRE(greet.content == "Hi {{name}}, got a minute?");
    REQUIRE(greet.goal.value() == "Get permission to pitch");
    REQUIRE(greet.transitions.size() == 2);
    REQUIRE(greet.has_mandatory_variables());
    REQUIRE(greet.extract_variables[0].prompt_message == "Are you working at the moment?");

    REQUIRE(graph.at("pitch").content_mode == ContentMode::Prompt);

    const auto* hook = graph.at("hook").as<FunctionCallNode>();
    REQUIRE(hook != nullptr);
    REQUIRE(hook->method == "POST");
    REQUIRE(hook->timeout == std::chrono::milliseconds(2500));
    REQUIRE(hook->response_variable == "webhook_response");

    REQUIRE(graph.at("digits").as<PressDigitNode>()->digits == "1#");
    REQUIRE(graph.at("xfer").as<TransferNode>()->destination == "+15550100");
    REQUIRE_FALSE(graph.at("xfer").content.empty());
    REQUIRE(graph.at("ask").as<CollectInputNode>()->variable == "email");
    REQUIRE(graph.at("split").is_automatic());
    REQUIRE_FALSE(graph.at("greet").is_automatic());
    REQUIRE(graph.find("missing") == nullptr);
}

TEST_CASE("graph validation rejects broken documents") {
    auto agent = sample_agent();
    agent["call_flow"][1]["data"]["transitions"][0]["nextNode"] = "nowhere";
    REQUIRE_THROWS_AS(FlowGraph::from_json(agent), FlowError);

    auto duplicate = sample_agent();
    duplicate["call_flow"][2]["id"] = "greet";
    REQUIRE_THROWS_AS(FlowGraph::from_json(duplicate), FlowError);

    auto unknown = sample_agent();
    unknown["call_flow"][3]["type"] = "teleport";
    REQUIRE_THROWS_AS(FlowGraph::from_json(unknown), FlowError);

    REQUIRE_THROWS_AS(FlowGraph::from_json(json{{"id", "x"}, {"call_flow", json::array()}}), FlowError);
}

TEST_CASE("default transitions are recognised") {
    REQUIRE(Transition{"", "a", {}}.is_default());
    REQUIRE(Transition{"Otherwise", "a", {}}.is_default());
    REQUIRE_FALSE(Transition{"caller agrees", "a", {}}.is_default());
}

TEST_CASE("logic split evaluates rules in order, then the default") {
    LogicSplitNode split;
    split.rules.push_back({"income", SplitOperator::GreaterThan, "5000", "pitch"});
    split.rules.push_back({"state", SplitOperator::Equals, "texas", "local"});
    split.default_target = "bye";

    REQUIRE(evaluate_logic_split(split, {{"income", "$8k"}}) == std::optional<std::string>("pitch"));
    REQUIRE(evaluate_logic_split(split, {{"income", "4,000"}, {"state", "Texas"}}) ==
            std::optional<std::string>("local"));
    REQUIRE(evaluate_logic_split(split, json::object()) == std::optional<std::string>("bye"));

    LogicSplitNode no_default;
    no_default.rules.push_back({"email", SplitOperator::Exists, "", "confirm"});
    REQUIRE(evaluate_logic_split(no_default, {{"email", "a@b.c"}}) == std::optional<std::string>("confirm"));
    REQUIRE_FALSE(evaluate_logic_split(no_default, json::object()).has_value());
}

TEST_CASE("numeric values accept currency and suffixes") {
    REQUIRE(extract_numeric_value(json("$8k")) == 8000.0);
    REQUIRE(extract_numeric_value(json("10,000")) == 10000.0);
    REQUIRE(extract_numeric_value(json("1.5M")) == 1500000.0);
    REQUIRE(extract_numeric_value(json(42)) == 42.0);
    REQUIRE_FALSE(extract_numeric_value(json("plenty")).has_value());
    REQUIRE(parse_split_operator("Greater_Than") == SplitOperator::GreaterThan);
    REQUIRE_THROWS_AS(parse_split_operator("roughly"), FlowError);
}

#include <catch2/catch_test_macros.hpp>

#include "call_engine/flow/transition_evaluator.hpp"
#include "fakes.hpp"

#include <chrono>
#include <memory>

using namespace call_engine;
using namespace call_engine::flow;
using call_engine::testing::FakeLlm;

namespace {

TransitionEvaluatorOptions evaluator_options() {
    TransitionEvaluatorOptions options;
    options.model_timeout = std::chrono::milliseconds(200);
    options.affirmative_prefixes = {"yes", "yeah", "sure", "absolutely", "okay"};
    options.negative_prefixes = {"no", "nope", "not interested", "no thanks"};
    return options;
}

FlowNode interest_node() {
    FlowNode node;
    node.id = "pitch";
    node.body = ConversationNode{};
    node.transitions.push_back({"caller agrees to hear more", "details", {}});
    node.transitions.push_back({"caller is not interested", "goodbye", {}});
    return node;
}

}

TEST_CASE("clear yes and no answers skip the model") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"1"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    const auto node = interest_node();

    for (const auto* utterance : {"yes", "yeah sure", "Yes, what's this about?"}) {
        const auto decision = evaluator.evaluate(node, utterance, nlohmann::json::object(), {});
        REQUIRE(decision.source == DecisionSource::FastPath);
        REQUIRE(decision.target_node_id == std::optional<std::string>("details"));
    }
    const auto refusal = evaluator.evaluate(node, "No thanks, I'm busy", nlohmann::json::object(), {});
    REQUIRE(refusal.target_node_id == std::optional<std::string>("goodbye"));
    REQUIRE(llm->calls() == 0);
}

TEST_CASE("ambiguous answers go to the model and are cached") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"Option 1"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    const auto node = interest_node();

    const auto first = evaluator.evaluate(node, "I'm not sure", nlohmann::json::object(), {});
    REQUIRE(first.source == DecisionSource::Model);
    REQUIRE(first.target_node_id == std::optional<std::string>("goodbye"));
    REQUIRE(llm->calls() == 1);

    const auto second = evaluator.evaluate(node, "i'm NOT sure!", nlohmann::json::object(), {});
    REQUIRE(second.source == DecisionSource::Cache);
    REQUIRE(second.target_node_id == first.target_node_id);
    REQUIRE(llm->calls() == 1);
    REQUIRE(evaluator.cache_size() == 1);
}

TEST_CASE("cached decisions follow the target, not the option number") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"1"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    FlowNode node;
    node.id = "followup";
    node.body = ConversationNode{};
    node.transitions.push_back({"caller confirms the email on file", "confirm_email", {"email"}});
    node.transitions.push_back({"caller wants a callback", "schedule", {"phone"}});
    node.transitions.push_back({"caller asks about pricing", "pricing", {}});
    const auto* utterance = "what happens next then";

    const auto first = evaluator.evaluate(
        node, utterance, nlohmann::json{{"email", "a@b.co"}, {"phone", "555"}}, {});
    REQUIRE(first.source == DecisionSource::Model);
    REQUIRE(first.target_node_id == std::optional<std::string>("schedule"));

    // Without an email the option list shifts; the cached target still applies.
    const auto shifted = evaluator.evaluate(node, utterance, nlohmann::json{{"phone", "555"}}, {});
    REQUIRE(shifted.source == DecisionSource::Cache);
    REQUIRE(shifted.target_node_id == std::optional<std::string>("schedule"));
    REQUIRE(llm->calls() == 1);

    // The cached target is not reachable here, so the model decides again.
    const auto unreachable = evaluator.evaluate(node, utterance, nlohmann::json{{"email", "a@b.co"}}, {});
    REQUIRE(unreachable.source == DecisionSource::Model);
    REQUIRE(unreachable.target_node_id == std::optional<std::string>("pricing"));
    REQUIRE(llm->calls() == 2);
}

TEST_CASE("a negation after an affirmative prefix goes to the model") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"1"});
    auto options = evaluator_options();
    options.affirmative_prefixes.push_back("i am");
    options.affirmative_prefixes.push_back("i do");
    TransitionEvaluator evaluator(llm, options);
    const auto node = interest_node();

    for (const auto* utterance : {"I do not want any of this", "I am not interested",
                                  "I am never buying this"}) {
        const auto decision = evaluator.evaluate(node, utterance, nlohmann::json::object(), {});
        REQUIRE(decision.source == DecisionSource::Model);
        REQUIRE(decision.target_node_id == std::optional<std::string>("goodbye"));
    }
    REQUIRE(llm->calls() == 3);

    const auto agreed = evaluator.evaluate(node, "I am interested, go on", nlohmann::json::object(), {});
    REQUIRE(agreed.source == DecisionSource::FastPath);
    REQUIRE(agreed.target_node_id == std::optional<std::string>("details"));
}

TEST_CASE("the model prompt lists every option with the utterance") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"0"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    const std::vector<ChatMessage> history = {{"assistant", "Do you own a business?"}};
    evaluator.evaluate(interest_node(), "depends what you mean", nlohmann::json{{"name", "Sam"}},
                       history);
    const auto requests = llm->requests();
    REQUIRE(requests.size() == 1);
    const auto& prompt = requests[0].messages.back().content;
    REQUIRE(prompt.find("Option 0: caller agrees to hear more") != std::string::npos);
    REQUIRE(prompt.find("Option 1: caller is not interested") != std::string::npos);
    REQUIRE(prompt.find("depends what you mean") != std::string::npos);
    REQUIRE(prompt.find("Do you own a business?") != std::string::npos);
    REQUIRE(prompt.find("\"Sam\"") != std::string::npos);
}

TEST_CASE("transitions with missing required variables are not candidates") {
    auto llm = std::make_shared<FakeLlm>();
    TransitionEvaluator evaluator(llm, evaluator_options());
    auto node = interest_node();
    node.transitions[0].required_variables = {"email"};

    const auto without = evaluator.evaluate(node, "whatever", nlohmann::json::object(), {});
    REQUIRE(without.source == DecisionSource::SingleTransition);
    REQUIRE(without.target_node_id == std::optional<std::string>("goodbye"));

    node.transitions[1].required_variables = {"phone"};
    const auto none = evaluator.evaluate(node, "whatever", nlohmann::json::object(), {});
    REQUIRE(none.source == DecisionSource::NoCandidates);
    REQUIRE(none.stay());
    REQUIRE(llm->calls() == 0);
}

TEST_CASE("a slow model falls back within the deadline") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"1"});
    llm->set_delay(std::chrono::milliseconds(1000));
    TransitionEvaluator evaluator(llm, evaluator_options());

    const auto started = std::chrono::steady_clock::now();
    const auto decision = evaluator.evaluate(interest_node(), "hmm let me think",
                                             nlohmann::json::object(), {});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::milliseconds(600));
    REQUIRE(decision.source == DecisionSource::TimeoutFallback);
    REQUIRE(decision.target_node_id == std::optional<std::string>("details"));
}

TEST_CASE("a node with a goal stays when nothing matches") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"-1"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    auto node = interest_node();
    node.goal = "Find out whether the caller runs a business";

    const auto decision = evaluator.evaluate(node, "what's the weather like", nlohmann::json::object(), {});
    REQUIRE(decision.stay());
    REQUIRE(decision.regenerate_for_goal);

    llm->set_failing(true);
    const auto failed = evaluator.evaluate(node, "tell me a joke", nlohmann::json::object(), {});
    REQUIRE(failed.source == DecisionSource::ErrorFallback);
    REQUIRE(failed.stay());
}

TEST_CASE("no match picks the default transition") {
    auto llm = std::make_shared<FakeLlm>(std::vector<std::string>{"-1"});
    TransitionEvaluator evaluator(llm, evaluator_options());
    auto node = interest_node();
    node.transitions.push_back({"otherwise", "clarify", {}});

    const auto decision = evaluator.evaluate(node, "purple elephants", nlohmann::json::object(), {});
    REQUIRE(decision.source == DecisionSource::DefaultTransition);
    REQUIRE(decision.target_node_id == std::optional<std::string>("clarify"));
}

TEST_CASE("parse_choice reads the first integer") {
    REQUIRE(parse_choice("2") == std::optional<int>(2));
    REQUIRE(parse_choice("Option 1.") == std::optional<int>(1));
    REQUIRE(parse_choice("-1") == std::optional<int>(-1));
    REQUIRE_FALSE(parse_choice("none").has_value());
}

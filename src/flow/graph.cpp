#include "call_engine/flow/graph.hpp"

#include <algorithm>
#include <cctype>

#include "call_engine/utils/text.hpp"

namespace call_engine::flow {

namespace {

using nlohmann::json;

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string string_field(const json& object, const char* key, const std::string& fallback = {}) {
    if (!object.is_object() || !object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return fallback;
    }
    return value.dump();
}

std::string as_plain_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

std::vector<Transition> parse_transitions(const json& data) {
    std::vector<Transition> transitions;
    if (!data.contains("transitions") || !data.at("transitions").is_array()) {
        return transitions;
    }
    for (const auto& item : data.at("transitions")) {
        Transition transition;
        transition.condition = string_field(item, "condition");
        transition.target_node_id = string_field(item, "nextNode",
                                                 string_field(item, "target_node_id"));
        if (item.contains("check_variables") && item.at("check_variables").is_array()) {
            for (const auto& name : item.at("check_variables")) {
                if (name.is_string()) {
                    transition.required_variables.push_back(name.get<std::string>());
                }
            }
        }
        if (transition.target_node_id.empty()) {
            throw FlowError("Transition without target: " + transition.condition);
        }
        transitions.push_back(std::move(transition));
    }
    return transitions;
}

std::vector<VariableSpec> parse_variables(const json& data) {
    std::vector<VariableSpec> variables;
    if (!data.contains("extract_variables") || !data.at("extract_variables").is_array()) {
        return variables;
    }
    for (const auto& item : data.at("extract_variables")) {
        VariableSpec spec;
        spec.name = string_field(item, "name");
        spec.description = string_field(item, "description");
        spec.mandatory = item.contains("mandatory") && item.at("mandatory").is_boolean() &&
                         item.at("mandatory").get<bool>();
        spec.allow_update = item.contains("allow_update") && item.at("allow_update").is_boolean() &&
                            item.at("allow_update").get<bool>();
        spec.prompt_message = string_field(item, "prompt_message");
        if (spec.name.empty()) {
            throw FlowError("Variable without name");
        }
        variables.push_back(std::move(spec));
    }
    return variables;
}

NodeBody parse_body(const std::string& type, const json& data) {
    if (type == "conversation") {
        return ConversationNode{};
    }
    if (type == "collect_input") {
        CollectInputNode node;
        node.variable = string_field(data, "variable_name", "user_input");
        return node;
    }
    if (type == "extract_variable") {
        return ExtractVariableNode{};
    }
    if (type == "function") {
        FunctionCallNode node;
        node.url = string_field(data, "webhook_url");
        node.method = string_field(data, "webhook_method", "POST");
        std::transform(node.method.begin(), node.method.end(), node.method.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        const double seconds = data.value("webhook_timeout", 5.0);
        node.timeout = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
        node.response_variable = string_field(data, "response_variable", "webhook_response");
        if (node.url.empty()) {
            throw FlowError("Function node without webhook_url");
        }
        return node;
    }
    if (type == "logic_split") {
        LogicSplitNode node;
        if (data.contains("conditions") && data.at("conditions").is_array()) {
            for (const auto& item : data.at("conditions")) {
                SplitRule rule;
                rule.variable = string_field(item, "variable");
                rule.op = parse_split_operator(string_field(item, "operator", "equals"));
                rule.value = string_field(item, "value");
                rule.target_node_id = string_field(item, "nextNode");
                node.rules.push_back(std::move(rule));
            }
        }
        node.default_target = string_field(data, "default_next_node");
        return node;
    }
    if (type == "press_digit") {
        PressDigitNode node;
        node.digits = string_field(data, "digits");
        if (node.digits.empty()) {
            throw FlowError("Press digit node without digits");
        }
        return node;
    }
    if (type == "call_transfer" || type == "agent_transfer" || type == "transfer") {
        TransferNode node;
        node.destination = string_field(data, "destination");
        node.transfer_type = string_field(data, "transfer_type", "cold");
        if (node.destination.empty()) {
            throw FlowError("Transfer node without destination");
        }
        return node;
    }
    if (type == "ending") {
        return EndingNode{};
    }
    if (type == "start") {
        return StartNode{};
    }
    throw FlowError("Unknown node type: " + type);
}

}

bool Transition::is_default() const {
    const auto normalized = utils::normalize_utterance(condition);
    return normalized.empty() || normalized == "default" || normalized == "otherwise" ||
           normalized == "else";
}

const char* FlowNode::type_name() const {
    struct Visitor {
        const char* operator()(const ConversationNode&) const { return "conversation"; }
        const char* operator()(const CollectInputNode&) const { return "collect_input"; }
        const char* operator()(const ExtractVariableNode&) const { return "extract_variable"; }
        const char* operator()(const FunctionCallNode&) const { return "function"; }
        const char* operator()(const LogicSplitNode&) const { return "logic_split"; }
        const char* operator()(const PressDigitNode&) const { return "press_digit"; }
        const char* operator()(const TransferNode&) const { return "transfer"; }
        const char* operator()(const EndingNode&) const { return "ending"; }
        const char* operator()(const StartNode&) const { return "start"; }
    };
    return std::visit(Visitor{}, body);
}

bool FlowNode::is_automatic() const {
    return std::holds_alternative<StartNode>(body) ||
           std::holds_alternative<LogicSplitNode>(body) ||
           std::holds_alternative<FunctionCallNode>(body) ||
           std::holds_alternative<PressDigitNode>(body);
}

bool FlowNode::has_mandatory_variables() const {
    return std::any_of(extract_variables.begin(), extract_variables.end(),
                       [](const VariableSpec& spec) { return spec.mandatory; });
}

FlowGraph FlowGraph::from_json(const json& agent) {
    if (!agent.is_object()) {
        throw FlowError("Agent document must be an object");
    }
    FlowGraph graph;
    graph.agent_id_ = string_field(agent, "id");
    graph.name_ = string_field(agent, "name");
    graph.system_prompt_ = string_field(agent, "system_prompt");

    const json* nodes = nullptr;
    if (agent.contains("call_flow") && agent.at("call_flow").is_array()) {
        nodes = &agent.at("call_flow");
    } else if (agent.contains("nodes") && agent.at("nodes").is_array()) {
        nodes = &agent.at("nodes");
    }
    if (!nodes || nodes->empty()) {
        throw FlowError("Agent has no call flow");
    }

    for (const auto& item : *nodes) {
        const json data = item.contains("data") && item.at("data").is_object()
                              ? item.at("data")
                              : json::object();
        FlowNode node;
        node.id = string_field(item, "id");
        if (node.id.empty()) {
            throw FlowError("Node without id");
        }
        if (graph.index_.count(node.id) != 0) {
            throw FlowError("Duplicate node id: " + node.id);
        }
        const auto type = lower(string_field(item, "type", "conversation"));
        node.label = string_field(data, "label", string_field(item, "label", node.id));

        const auto mode = lower(string_field(data, "mode", string_field(data, "promptType", "script")));
        node.content_mode = mode == "prompt" ? ContentMode::Prompt : ContentMode::Script;
        node.content = node.content_mode == ContentMode::Script
                           ? string_field(data, "script", string_field(data, "content"))
                           : string_field(data, "content", string_field(data, "script"));
        if (type == "call_transfer" || type == "agent_transfer" || type == "transfer") {
            if (node.content.empty()) {
                node.content = string_field(data, "transfer_message",
                                            "Please hold while I transfer your call.");
            }
        }
        const auto goal = string_field(data, "goal");
        if (!goal.empty()) {
            node.goal = goal;
        }
        node.transitions = parse_transitions(data);
        node.extract_variables = parse_variables(data);
        try {
            node.body = parse_body(type, data);
        } catch (const json::exception& ex) {
            throw FlowError("Malformed " + type + " node " + node.id + ": " + ex.what());
        }

        graph.index_.emplace(node.id, graph.nodes_.size());
        graph.nodes_.push_back(std::move(node));
    }

    for (const auto& node : graph.nodes_) {
        for (const auto& transition : node.transitions) {
            if (graph.index_.count(transition.target_node_id) == 0) {
                throw FlowError("Node " + node.id + " points to unknown node " +
                                transition.target_node_id);
            }
        }
        if (const auto* split = node.as<LogicSplitNode>()) {
            for (const auto& rule : split->rules) {
                if (!rule.target_node_id.empty() && graph.index_.count(rule.target_node_id) == 0) {
                    throw FlowError("Logic split " + node.id + " points to unknown node " +
                                    rule.target_node_id);
                }
            }
            if (!split->default_target.empty() && graph.index_.count(split->default_target) == 0) {
                throw FlowError("Logic split " + node.id + " has unknown default " +
                                split->default_target);
            }
        }
    }
    return graph;
}

const FlowNode* FlowGraph::find(const std::string& node_id) const {
    const auto it = index_.find(node_id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

const FlowNode& FlowGraph::at(const std::string& node_id) const {
    const auto* node = find(node_id);
    if (!node) {
        throw FlowError("Unknown node: " + node_id);
    }
    return *node;
}

const FlowNode& FlowGraph::entry_node() const {
    for (const auto& node : nodes_) {
        if (node.as<StartNode>()) {
            return node;
        }
    }
    return nodes_.front();
}

SplitOperator parse_split_operator(const std::string& name) {
    static const std::unordered_map<std::string, SplitOperator> operators = {
        {"equals", SplitOperator::Equals},
        {"not_equals", SplitOperator::NotEquals},
        {"contains", SplitOperator::Contains},
        {"greater_than", SplitOperator::GreaterThan},
        {"less_than", SplitOperator::LessThan},
        {"greater_than_or_equal", SplitOperator::GreaterOrEqual},
        {"less_than_or_equal", SplitOperator::LessOrEqual},
        {"exists", SplitOperator::Exists},
        {"not_exists", SplitOperator::NotExists},
        {"starts_with", SplitOperator::StartsWith},
        {"ends_with", SplitOperator::EndsWith},
    };
    const auto it = operators.find(lower(name));
    if (it == operators.end()) {
        throw FlowError("Unknown logic split operator: " + name);
    }
    return it->second;
}

std::optional<double> extract_numeric_value(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    std::string text;
    for (unsigned char ch : lower(value.get<std::string>())) {
        if (ch != '$' && ch != ',' && !std::isspace(ch)) {
            text.push_back(static_cast<char>(ch));
        }
    }
    const auto start = text.find_first_of("0123456789");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(text.substr(start), &consumed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    const auto suffix_pos = start + consumed;
    if (suffix_pos < text.size()) {
        if (text[suffix_pos] == 'k') {
            number *= 1000.0;
        } else if (text[suffix_pos] == 'm') {
            number *= 1000000.0;
        }
    }
    return number;
}

std::optional<std::string> evaluate_logic_split(const LogicSplitNode& node,
                                                const json& variables) {
    for (const auto& rule : node.rules) {
        const bool present = variables.is_object() && variables.contains(rule.variable);
        const json value = present ? variables.at(rule.variable) : json();
        const auto text = lower(as_plain_string(value));
        const auto expected = lower(rule.value);
        const bool empty = text.empty() || text == "undefined";

        bool matched = false;
        switch (rule.op) {
            case SplitOperator::Equals:
                matched = text == expected;
                break;
            case SplitOperator::NotEquals:
                matched = text != expected;
                break;
            case SplitOperator::Contains:
                matched = text.find(expected) != std::string::npos;
                break;
            case SplitOperator::StartsWith:
                matched = text.rfind(expected, 0) == 0;
                break;
            case SplitOperator::EndsWith:
                matched = text.size() >= expected.size() &&
                          text.compare(text.size() - expected.size(), expected.size(), expected) == 0;
                break;
            case SplitOperator::Exists:
                matched = present && !empty;
                break;
            case SplitOperator::NotExists:
                matched = !present || empty;
                break;
            case SplitOperator::GreaterThan:
            case SplitOperator::LessThan:
            case SplitOperator::GreaterOrEqual:
            case SplitOperator::LessOrEqual: {
                const auto lhs = extract_numeric_value(value);
                const auto rhs = extract_numeric_value(json(rule.value));
                if (!lhs || !rhs) {
                    break;
                }
                if (rule.op == SplitOperator::GreaterThan) {
                    matched = *lhs > *rhs;
                } else if (rule.op == SplitOperator::LessThan) {
                    matched = *lhs < *rhs;
                } else if (rule.op == SplitOperator::GreaterOrEqual) {
                    matched = *lhs >= *rhs;
                } else {
                    matched = *lhs <= *rhs;
                }
                break;
            }
        }
        if (matched && !rule.target_node_id.empty()) {
            return rule.target_node_id;
        }
    }
    if (!node.default_target.empty()) {
        return node.default_target;
    }
    return std::nullopt;
}

}

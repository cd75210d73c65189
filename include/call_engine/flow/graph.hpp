#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace call_engine::flow {

class FlowError : public std::runtime_error {
public:
    explicit FlowError(const std::string& message) : std::runtime_error(message) {}
};

enum class ContentMode { Script, Prompt };

struct VariableSpec {
    std::string name;
    std::string description;
    bool mandatory = false;
    // Re-extract even when a value is already known.
    bool allow_update = false;
    // Asked when a mandatory value is still missing.
    std::string prompt_message;
};

struct Transition {
    std::string condition;
    std::string target_node_id;
    std::vector<std::string> required_variables;

    // Empty, "default", "otherwise" or "else".
    bool is_default() const;
};

struct ConversationNode {};

struct CollectInputNode {
    std::string variable;
};

struct ExtractVariableNode {};

struct FunctionCallNode {
    std::string url;
    std::string method = "POST";
    std::chrono::milliseconds timeout{5000};
    std::string response_variable;
};

enum class SplitOperator {
    Equals,
    NotEquals,
    Contains,
    GreaterThan,
    LessThan,
    GreaterOrEqual,
    LessOrEqual,
    Exists,
    NotExists,
    StartsWith,
    EndsWith,
};

struct SplitRule {
    std::string variable;
    SplitOperator op = SplitOperator::Equals;
    std::string value;
    std::string target_node_id;
};

struct LogicSplitNode {
    std::vector<SplitRule> rules;
    std::string default_target;
};

struct PressDigitNode {
    std::string digits;
};

struct TransferNode {
    std::string destination;
    std::string transfer_type = "cold";
};

struct EndingNode {};

struct StartNode {};

using NodeBody = std::variant<ConversationNode,
                              CollectInputNode,
                              ExtractVariableNode,
                              FunctionCallNode,
                              LogicSplitNode,
                              PressDigitNode,
                              TransferNode,
                              EndingNode,
                              StartNode>;

struct FlowNode {
    std::string id;
    std::string label;
    ContentMode content_mode = ContentMode::Script;
    std::string content;
    std::optional<std::string> goal;
    std::vector<Transition> transitions;
    std::vector<VariableSpec> extract_variables;
    NodeBody body;

    const char* type_name() const;
    // Nodes that advance without waiting for the caller.
    bool is_automatic() const;
    bool has_mandatory_variables() const;

    template <typename T>
    const T* as() const {
        return std::get_if<T>(&body);
    }
};

class FlowGraph {
public:
    // Parses an agent document: {"id", "name", "system_prompt",
    // "call_flow": [{"id", "type", "data": {...}}, ...]}.
    static FlowGraph from_json(const nlohmann::json& agent);

    const FlowNode* find(const std::string& node_id) const;
    const FlowNode& at(const std::string& node_id) const;
    // The start node if present, the first node otherwise.
    const FlowNode& entry_node() const;

    const std::string& agent_id() const { return agent_id_; }
    const std::string& name() const { return name_; }
    const std::string& system_prompt() const { return system_prompt_; }
    size_t size() const { return nodes_.size(); }

private:
    std::string agent_id_;
    std::string name_;
    std::string system_prompt_;
    std::vector<FlowNode> nodes_;
    std::unordered_map<std::string, size_t> index_;
};

SplitOperator parse_split_operator(const std::string& name);

// First matching rule's target, then the default target. Comparisons are
// case-insensitive; numeric operators accept "$8k", "10,000" and "1.5M".
std::optional<std::string> evaluate_logic_split(const LogicSplitNode& node,
                                                const nlohmann::json& variables);

std::optional<double> extract_numeric_value(const nlohmann::json& value);

}

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_engine/flow/graph.hpp"
#include "call_engine/llm/client.hpp"

namespace call_engine::flow {

enum class DecisionSource {
    NoCandidates,
    SingleTransition,
    FastPath,
    Cache,
    Model,
    DefaultTransition,
    TimeoutFallback,
    ErrorFallback,
    NoMatchFallback,
};

const char* to_string(DecisionSource source);

struct TransitionDecision {
    // Empty when the conversation stays on the current node.
    std::optional<std::string> target_node_id;
    DecisionSource source = DecisionSource::NoCandidates;
    // Staying on a node with a goal: content should be regenerated toward it.
    bool regenerate_for_goal = false;

    bool stay() const { return !target_node_id.has_value(); }
};

struct TransitionEvaluatorOptions {
    std::chrono::milliseconds model_timeout{1500};
    std::vector<std::string> affirmative_prefixes;
    std::vector<std::string> negative_prefixes;
    size_t history_turns = 10;
    size_t cache_capacity = 1024;
};

// Decides the next node for one agent graph. Shared by every call of that
// agent; the decision cache is keyed by node and normalized utterance.
class TransitionEvaluator {
public:
    TransitionEvaluator(std::shared_ptr<LlmClient> llm, TransitionEvaluatorOptions options);

    TransitionDecision evaluate(const FlowNode& node,
                                const std::string& utterance,
                                const nlohmann::json& variables,
                                const std::vector<ChatMessage>& history);

    size_t cache_size() const;

private:
    enum class Polarity { None, Affirmative, Negative };

    Polarity utterance_polarity(const std::string& normalized) const;
    static Polarity condition_polarity(const std::string& condition);
    ChatRequest build_request(const std::vector<const Transition*>& candidates,
                              const std::string& utterance,
                              const nlohmann::json& variables,
                              const std::vector<ChatMessage>& history) const;
    TransitionDecision fallback(const FlowNode& node,
                                const std::vector<const Transition*>& candidates,
                                DecisionSource source) const;
    TransitionDecision resolve_index(const FlowNode& node,
                                     const std::vector<const Transition*>& candidates,
                                     int index,
                                     DecisionSource source) const;
    // Cached values are target node ids; an empty id records a -1 reply.
    std::optional<std::string> cached(const std::string& key) const;
    void remember(const std::string& key, const std::string& target);

    std::shared_ptr<LlmClient> llm_;
    TransitionEvaluatorOptions options_;
    std::vector<std::string> affirmatives_;
    std::vector<std::string> negatives_;
    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, std::string> cache_;
};

// Parses the first integer in a model reply; "-1" stays -1.
std::optional<int> parse_choice(const std::string& reply);

}

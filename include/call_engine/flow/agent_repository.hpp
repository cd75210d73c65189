#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "call_engine/backend/client.hpp"
#include "call_engine/flow/graph.hpp"
#include "call_engine/flow/transition_evaluator.hpp"
#include "call_engine/llm/client.hpp"

namespace call_engine::flow {

// Everything calls of one agent share: the parsed graph and its evaluator
// (with the decision cache).
struct AgentRuntime {
    FlowGraph graph;
    std::shared_ptr<TransitionEvaluator> evaluator;
};

// Loads agent definitions once from the backend (GET /agents/{id}) and
// keeps them for the life of the process.
class AgentRepository {
public:
    AgentRepository(std::shared_ptr<BackendClient> backend,
                    std::shared_ptr<LlmClient> llm,
                    TransitionEvaluatorOptions evaluator_options);

    // Throws BackendError when the fetch fails, FlowError for a bad graph.
    std::shared_ptr<const AgentRuntime> get(const std::string& agent_id);
    std::shared_ptr<const AgentRuntime> add(const nlohmann::json& agent);

    size_t size() const;

private:
    std::shared_ptr<const AgentRuntime> build(const nlohmann::json& agent) const;

    std::shared_ptr<BackendClient> backend_;
    std::shared_ptr<LlmClient> llm_;
    TransitionEvaluatorOptions evaluator_options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const AgentRuntime>> agents_;
};

}

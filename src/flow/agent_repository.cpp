#include "call_engine/flow/agent_repository.hpp"

#include "call_engine/logging.hpp"
#include "call_engine/utils/http.hpp"

namespace call_engine::flow {

AgentRepository::AgentRepository(std::shared_ptr<BackendClient> backend,
                                 std::shared_ptr<LlmClient> llm,
                                 TransitionEvaluatorOptions evaluator_options)
    : backend_(std::move(backend)),
      llm_(std::move(llm)),
      evaluator_options_(std::move(evaluator_options)) {}

std::shared_ptr<const AgentRuntime> AgentRepository::get(const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = agents_.find(agent_id);
        if (it != agents_.end()) {
            return it->second;
        }
    }
    if (!backend_) {
        throw BackendError("Unknown agent " + agent_id);
    }

    auto document = backend_->get_json("/agents/" + utils::url_encode(agent_id));
    if (document.contains("agent") && document["agent"].is_object()) {
        document = document["agent"];
    }
    if (!document.contains("id")) {
        document["id"] = agent_id;
    }
    auto runtime = build(document);
    info("Agent loaded", {kv("agent_id", agent_id),
                          kv("nodes", runtime->graph.size())});

    std::lock_guard<std::mutex> lock(mutex_);
    // A concurrent loader may have won; keep the first so evaluators stay shared.
    auto inserted = agents_.emplace(agent_id, runtime);
    return inserted.first->second;
}

std::shared_ptr<const AgentRuntime> AgentRepository::add(const nlohmann::json& agent) {
    auto runtime = build(agent);
    std::lock_guard<std::mutex> lock(mutex_);
    agents_[runtime->graph.agent_id()] = runtime;
    return runtime;
}

size_t AgentRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

std::shared_ptr<const AgentRuntime> AgentRepository::build(const nlohmann::json& agent) const {
    auto runtime = std::make_shared<AgentRuntime>();
    runtime->graph = FlowGraph::from_json(agent);
    runtime->evaluator = std::make_shared<TransitionEvaluator>(llm_, evaluator_options_);
    return runtime;
}

}

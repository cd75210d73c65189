#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_engine/flow/graph.hpp"
#include "call_engine/llm/client.hpp"

namespace call_engine::flow {

struct ExtractionResult {
    // Only non-null values the model found.
    nlohmann::json values = nlohmann::json::object();
    std::vector<const VariableSpec*> missing_mandatory;
    bool timed_out = false;

    bool complete() const { return missing_mandatory.empty(); }
};

class VariableExtractor {
public:
    using ValuesHandler = std::function<void(const nlohmann::json&)>;

    VariableExtractor(std::shared_ptr<LlmClient> llm, std::chrono::milliseconds timeout);

    // Blocks up to the extraction deadline.
    ExtractionResult extract(const std::vector<VariableSpec>& specs,
                             const std::string& utterance,
                             const nlohmann::json& known,
                             const std::vector<ChatMessage>& history) const;

    // Fire-and-forget; on_values runs on a worker thread with whatever was found.
    void extract_async(std::vector<VariableSpec> specs,
                       std::string utterance,
                       nlohmann::json known,
                       std::vector<ChatMessage> history,
                       ValuesHandler on_values) const;

    // Names of specs that still need a model call given the known values.
    static std::vector<const VariableSpec*> pending(const std::vector<VariableSpec>& specs,
                                                    const nlohmann::json& known);

private:
    std::shared_ptr<LlmClient> llm_;
    std::chrono::milliseconds timeout_;
};

// Pulls the first JSON object out of a model reply (tolerates code fences).
nlohmann::json parse_json_object(const std::string& reply);

}

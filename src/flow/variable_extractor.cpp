#include "call_engine/flow/variable_extractor.hpp"

#include <sstream>
#include <utility>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/async.hpp"

namespace call_engine::flow {

namespace {

bool has_value(const nlohmann::json& values, const std::string& name) {
    if (!values.is_object() || !values.contains(name)) {
        return false;
    }
    const auto& value = values.at(name);
    return !value.is_null() && !(value.is_string() && value.get<std::string>().empty());
}

ChatRequest build_request(const std::vector<VariableSpec>& specs,
                          const std::string& utterance,
                          const nlohmann::json& known,
                          const std::vector<ChatMessage>& history) {
    std::ostringstream prompt;
    prompt << "Extract the following information from the conversation:\n";
    for (const auto& spec : specs) {
        prompt << "- " << spec.name << ": " << spec.description << "\n";
    }
    if (known.is_object() && !known.empty()) {
        prompt << "\nEXISTING VARIABLES:\n" << known.dump() << "\n";
    }
    prompt << "\nRecent conversation:\n";
    const size_t first = history.size() > 10 ? history.size() - 10 : 0;
    for (size_t i = first; i < history.size(); ++i) {
        prompt << (history[i].role == "user" ? "User" : "Assistant") << ": "
               << history[i].content << "\n";
    }
    prompt << "Current user message: " << utterance << "\n\n"
           << "Only extract values the user explicitly stated or confirmed. "
              "A short confirmation accepts the value the assistant just proposed. "
              "Return numbers without currency symbols or separators. "
              "Return ONLY a JSON object with one key per variable, null when unknown.";

    ChatRequest request;
    request.temperature = 0.0;
    request.max_tokens = 500;
    request.json_response = true;
    request.messages.push_back({"user", prompt.str()});
    return request;
}

std::vector<VariableSpec> copy_specs(const std::vector<const VariableSpec*>& specs) {
    std::vector<VariableSpec> copies;
    copies.reserve(specs.size());
    for (const auto* spec : specs) {
        copies.push_back(*spec);
    }
    return copies;
}

// Runs on detached workers, so everything is owned by value.
nlohmann::json run_extraction(const std::shared_ptr<LlmClient>& llm,
                              std::chrono::milliseconds timeout,
                              const std::vector<VariableSpec>& specs,
                              const std::string& utterance,
                              const nlohmann::json& known,
                              const std::vector<ChatMessage>& history) {
    const auto reply = llm->complete(build_request(specs, utterance, known, history), timeout);
    const auto parsed = parse_json_object(reply);
    nlohmann::json values = nlohmann::json::object();
    for (const auto& spec : specs) {
        if (has_value(parsed, spec.name)) {
            values[spec.name] = parsed.at(spec.name);
        }
    }
    return values;
}

}

nlohmann::json parse_json_object(const std::string& reply) {
    const auto open = reply.find('{');
    const auto close = reply.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return nlohmann::json::object();
    }
    const auto parsed = nlohmann::json::parse(reply.substr(open, close - open + 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

VariableExtractor::VariableExtractor(std::shared_ptr<LlmClient> llm,
                                     std::chrono::milliseconds timeout)
    : llm_(std::move(llm)), timeout_(timeout) {}

std::vector<const VariableSpec*> VariableExtractor::pending(const std::vector<VariableSpec>& specs,
                                                            const nlohmann::json& known) {
    std::vector<const VariableSpec*> result;
    for (const auto& spec : specs) {
        if (spec.allow_update || !has_value(known, spec.name)) {
            result.push_back(&spec);
        }
    }
    return result;
}

ExtractionResult VariableExtractor::extract(const std::vector<VariableSpec>& specs,
                                            const std::string& utterance,
                                            const nlohmann::json& known,
                                            const std::vector<ChatMessage>& history) const {
    ExtractionResult result;
    const auto todo = pending(specs, known);
    if (!todo.empty() && llm_) {
        const auto started = std::chrono::steady_clock::now();
        try {
            auto values = utils::call_with_deadline<nlohmann::json>(
                [llm = llm_, timeout = timeout_, todo = copy_specs(todo), utterance, known,
                 history]() {
                    return run_extraction(llm, timeout, todo, utterance, known, history);
                },
                timeout_);
            if (values) {
                result.values = std::move(*values);
            } else {
                result.timed_out = true;
                warn("Variable extraction timed out", {kv("timeout_ms", timeout_.count())});
            }
        } catch (const std::exception& ex) {
            warn("Variable extraction failed", {kv("error", ex.what())});
        }
        Metrics::instance().observe_latency(
            "extract",
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    }

    for (const auto& spec : specs) {
        if (spec.mandatory && !has_value(result.values, spec.name) && !has_value(known, spec.name)) {
            result.missing_mandatory.push_back(&spec);
        }
    }
    return result;
}

void VariableExtractor::extract_async(std::vector<VariableSpec> specs,
                                      std::string utterance,
                                      nlohmann::json known,
                                      std::vector<ChatMessage> history,
                                      ValuesHandler on_values) const {
    if (!llm_ || pending(specs, known).empty()) {
        return;
    }
    auto llm = llm_;
    auto timeout = timeout_;
    utils::run_async([llm, timeout, specs = std::move(specs), utterance = std::move(utterance),
                      known = std::move(known), history = std::move(history),
                      on_values = std::move(on_values)]() {
        try {
            const auto todo = copy_specs(pending(specs, known));
            const auto values = run_extraction(llm, timeout, todo, utterance, known, history);
            if (!values.empty()) {
                on_values(values);
            }
        } catch (const std::exception& ex) {
            warn("Background variable extraction failed", {kv("error", ex.what())});
        }
    });
}

}

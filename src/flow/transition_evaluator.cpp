#include "call_engine/flow/transition_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/async.hpp"
#include "call_engine/utils/text.hpp"

namespace call_engine::flow {

namespace {

constexpr const char* kTransitionSystemPrompt =
    "You match what a phone caller just said to the conversation branch whose "
    "condition it satisfies. A refusal, deflection or unrelated answer satisfies "
    "no condition.";

const std::vector<std::string>& negative_condition_markers() {
    static const std::vector<std::string> markers = {
        "not", "no", "doesn't", "does not", "don't", "do not", "declines", "decline",
        "refuses", "refuse", "rejects", "reject", "busy", "negative", "disagrees",
        "unwilling", "never"};
    return markers;
}

const std::vector<std::string>& affirmative_condition_markers() {
    static const std::vector<std::string> markers = {
        "agrees", "agree", "yes", "accepts", "accept", "confirms", "confirm",
        "interested", "positive", "affirmative", "willing", "wants", "okay", "ok"};
    return markers;
}

bool negated_after(const std::string& normalized, const std::string& prefix) {
    std::istringstream rest(normalized.substr(std::min(prefix.size(), normalized.size())));
    std::string word;
    if (!(rest >> word)) {
        return false;
    }
    const bool contracted = word.size() > 3 && word.compare(word.size() - 3, 3, "n't") == 0;
    return word == "not" || word == "never" || contracted;
}

std::vector<std::string> normalize_all(const std::vector<std::string>& phrases) {
    std::vector<std::string> normalized;
    normalized.reserve(phrases.size());
    for (const auto& phrase : phrases) {
        auto value = utils::normalize_utterance(phrase);
        if (!value.empty()) {
            normalized.push_back(std::move(value));
        }
    }
    return normalized;
}

}

const char* to_string(DecisionSource source) {
    switch (source) {
        case DecisionSource::NoCandidates: return "no_candidates";
        case DecisionSource::SingleTransition: return "single_transition";
        case DecisionSource::FastPath: return "fast_path";
        case DecisionSource::Cache: return "cache";
        case DecisionSource::Model: return "model";
        case DecisionSource::DefaultTransition: return "default_transition";
        case DecisionSource::TimeoutFallback: return "timeout_fallback";
        case DecisionSource::ErrorFallback: return "error_fallback";
        case DecisionSource::NoMatchFallback: return "no_match_fallback";
    }
    return "unknown";
}

std::optional<int> parse_choice(const std::string& reply) {
    for (size_t i = 0; i < reply.size(); ++i) {
        const auto ch = static_cast<unsigned char>(reply[i]);
        const bool negative = reply[i] == '-' && i + 1 < reply.size() &&
                              std::isdigit(static_cast<unsigned char>(reply[i + 1]));
        if (!std::isdigit(ch) && !negative) {
            continue;
        }
        size_t end = i + (negative ? 1 : 0);
        while (end < reply.size() && std::isdigit(static_cast<unsigned char>(reply[end]))) {
            ++end;
        }
        try {
            return std::stoi(reply.substr(i, end - i));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

TransitionEvaluator::TransitionEvaluator(std::shared_ptr<LlmClient> llm,
                                         TransitionEvaluatorOptions options)
    : llm_(std::move(llm)),
      options_(std::move(options)),
      affirmatives_(normalize_all(options_.affirmative_prefixes)),
      negatives_(normalize_all(options_.negative_prefixes)) {}

TransitionDecision TransitionEvaluator::evaluate(const FlowNode& node,
                                                 const std::string& utterance,
                                                 const nlohmann::json& variables,
                                                 const std::vector<ChatMessage>& history) {
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&](TransitionDecision decision) {
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started).count();
        auto& metrics = Metrics::instance();
        metrics.observe_latency("transition", elapsed);
        metrics.increment("transition_decisions", to_string(decision.source));
        debug("Transition decided",
              {kv("node_id", node.id),
               kv("source", to_string(decision.source)),
               kv("target", decision.target_node_id.value_or("stay")),
               kv("elapsed_ms", static_cast<int>(elapsed * 1000))});
        return decision;
    };

    std::vector<const Transition*> candidates;
    for (const auto& transition : node.transitions) {
        const bool satisfied = std::all_of(
            transition.required_variables.begin(), transition.required_variables.end(),
            [&variables](const std::string& name) {
                return variables.is_object() && variables.contains(name) &&
                       !variables.at(name).is_null();
            });
        if (satisfied) {
            candidates.push_back(&transition);
        }
    }

    if (candidates.empty()) {
        TransitionDecision decision;
        decision.source = DecisionSource::NoCandidates;
        decision.regenerate_for_goal = node.goal.has_value();
        return finish(decision);
    }
    if (candidates.size() == 1) {
        return finish({candidates.front()->target_node_id, DecisionSource::SingleTransition, false});
    }

    const auto normalized = utils::normalize_utterance(utterance);
    const auto polarity = utterance_polarity(normalized);
    if (polarity != Polarity::None) {
        for (const auto* candidate : candidates) {
            if (condition_polarity(candidate->condition) == polarity) {
                return finish({candidate->target_node_id, DecisionSource::FastPath, false});
            }
        }
    }

    const auto cache_key = node.id + "\n" + normalized;
    if (const auto target = cached(cache_key)) {
        if (target->empty()) {
            auto decision = resolve_index(node, candidates, -1, DecisionSource::Cache);
            decision.source = DecisionSource::Cache;
            return finish(decision);
        }
        // Another call may have had a different set of candidates.
        const auto match = std::find_if(candidates.begin(), candidates.end(),
                                        [&](const Transition* candidate) {
                                            return candidate->target_node_id == *target;
                                        });
        if (match != candidates.end()) {
            return finish({*target, DecisionSource::Cache, false});
        }
    }

    if (!llm_) {
        return finish(fallback(node, candidates, DecisionSource::ErrorFallback));
    }

    const auto request = build_request(candidates, utterance, variables, history);
    const auto timeout = options_.model_timeout;
    auto llm = llm_;
    std::optional<std::string> reply;
    try {
        reply = utils::call_with_deadline<std::string>(
            [llm, request, timeout]() { return llm->complete(request, timeout); }, timeout);
    } catch (const std::exception& ex) {
        warn("Transition model call failed", {kv("node_id", node.id), kv("error", ex.what())});
        return finish(fallback(node, candidates, DecisionSource::ErrorFallback));
    }
    if (!reply) {
        warn("Transition model call timed out",
             {kv("node_id", node.id), kv("timeout_ms", timeout.count())});
        return finish(fallback(node, candidates, DecisionSource::TimeoutFallback));
    }

    const auto choice = parse_choice(*reply);
    if (!choice) {
        warn("Transition model reply unparseable", {kv("node_id", node.id), kv("reply", *reply)});
        return finish(fallback(node, candidates, DecisionSource::NoMatchFallback));
    }
    const bool in_range = *choice >= 0 && static_cast<size_t>(*choice) < candidates.size();
    remember(cache_key,
             in_range ? candidates[static_cast<size_t>(*choice)]->target_node_id : std::string());
    return finish(resolve_index(node, candidates, *choice, DecisionSource::Model));
}

TransitionDecision TransitionEvaluator::resolve_index(
    const FlowNode& node,
    const std::vector<const Transition*>& candidates,
    int index,
    DecisionSource source) const {
    if (index >= 0 && static_cast<size_t>(index) < candidates.size()) {
        return {candidates[static_cast<size_t>(index)]->target_node_id, source, false};
    }
    for (const auto* candidate : candidates) {
        if (candidate->is_default()) {
            return {candidate->target_node_id, DecisionSource::DefaultTransition, false};
        }
    }
    return fallback(node, candidates, DecisionSource::NoMatchFallback);
}

TransitionDecision TransitionEvaluator::fallback(const FlowNode& node,
                                                 const std::vector<const Transition*>& candidates,
                                                 DecisionSource source) const {
    TransitionDecision decision;
    decision.source = source;
    if (node.goal) {
        decision.regenerate_for_goal = true;
        return decision;
    }
    if (!candidates.empty()) {
        decision.target_node_id = candidates.front()->target_node_id;
    }
    return decision;
}

TransitionEvaluator::Polarity TransitionEvaluator::utterance_polarity(
    const std::string& normalized) const {
    if (normalized.empty()) {
        return Polarity::None;
    }
    for (const auto& phrase : negatives_) {
        if (utils::starts_with_phrase(normalized, phrase)) {
            return Polarity::Negative;
        }
    }
    for (const auto& phrase : affirmatives_) {
        if (utils::starts_with_phrase(normalized, phrase)) {
            // "i do not ..." or "i am never ..." is for the model to judge.
            return negated_after(normalized, phrase) ? Polarity::None : Polarity::Affirmative;
        }
    }
    return Polarity::None;
}

TransitionEvaluator::Polarity TransitionEvaluator::condition_polarity(const std::string& condition) {
    const auto normalized = utils::normalize_utterance(condition);
    for (const auto& marker : negative_condition_markers()) {
        if (utils::contains_phrase(normalized, marker)) {
            return Polarity::Negative;
        }
    }
    for (const auto& marker : affirmative_condition_markers()) {
        if (utils::contains_phrase(normalized, marker)) {
            return Polarity::Affirmative;
        }
    }
    return Polarity::None;
}

ChatRequest TransitionEvaluator::build_request(const std::vector<const Transition*>& candidates,
                                               const std::string& utterance,
                                               const nlohmann::json& variables,
                                               const std::vector<ChatMessage>& history) const {
    std::ostringstream prompt;
    prompt << "CONVERSATION HISTORY:\n";
    const size_t first = history.size() > options_.history_turns
                             ? history.size() - options_.history_turns
                             : 0;
    for (size_t i = first; i < history.size(); ++i) {
        prompt << history[i].role << ": " << history[i].content << "\n";
    }
    prompt << "\nCALLER JUST SAID: " << utterance << "\n";
    if (variables.is_object() && !variables.empty()) {
        prompt << "\nKNOWN VARIABLES: " << variables.dump() << "\n";
    }
    prompt << "\nTRANSITION OPTIONS:\n";
    for (size_t i = 0; i < candidates.size(); ++i) {
        prompt << "Option " << i << ": " << candidates[i]->condition << "\n";
    }
    prompt << "\nRespond with ONLY the number of the option whose condition the caller's "
              "response satisfies, or -1 if none does.";

    ChatRequest request;
    request.temperature = 0.0;
    request.max_tokens = 10;
    request.messages.push_back({"system", kTransitionSystemPrompt});
    request.messages.push_back({"user", prompt.str()});
    return request;
}

std::optional<std::string> TransitionEvaluator::cached(const std::string& key) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    const auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TransitionEvaluator::remember(const std::string& key, const std::string& target) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_.size() >= options_.cache_capacity) {
        cache_.clear();
    }
    cache_[key] = target;
}

size_t TransitionEvaluator::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

}

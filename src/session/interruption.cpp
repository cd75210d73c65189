#include "call_engine/session/interruption.hpp"

#include <algorithm>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/text.hpp"

namespace call_engine::session {

namespace {

constexpr size_t kMaxAcknowledgementWords = 2;

}

const char* to_string(UtteranceClass value) {
    switch (value) {
        case UtteranceClass::Discard: return "discard";
        case UtteranceClass::Echo: return "echo";
        case UtteranceClass::Genuine: return "genuine";
    }
    return "unknown";
}

InterruptionController::InterruptionController(InterruptionOptions options)
    : options_(std::move(options)) {
    for (const auto& word : options_.acknowledgement_words) {
        const auto normalized = utils::normalize_utterance(word);
        if (normalized.empty()) {
            continue;
        }
        if (normalized.find(' ') == std::string::npos) {
            acknowledgement_words_.insert(normalized);
        } else {
            acknowledgement_phrases_.push_back(normalized);
        }
    }
    for (const auto& phrase : options_.hold_on_phrases) {
        const auto normalized = utils::normalize_utterance(phrase);
        if (!normalized.empty()) {
            hold_on_phrases_.push_back(normalized);
        }
    }
}

bool InterruptionController::is_acknowledgement(const std::string& utterance) const {
    const auto normalized = utils::normalize_utterance(utterance);
    const auto words = utils::split_words(normalized);
    if (words.empty() || words.size() > kMaxAcknowledgementWords) {
        return false;
    }
    if (std::find(acknowledgement_phrases_.begin(), acknowledgement_phrases_.end(), normalized) !=
        acknowledgement_phrases_.end()) {
        return true;
    }
    return std::any_of(words.begin(), words.end(), [this](const std::string& word) {
        return acknowledgement_words_.count(word) != 0;
    });
}

bool InterruptionController::is_hold_on(const std::string& utterance) const {
    const auto normalized = utils::normalize_utterance(utterance);
    return std::any_of(hold_on_phrases_.begin(), hold_on_phrases_.end(),
                       [&normalized](const std::string& phrase) {
                           return utils::contains_phrase(normalized, phrase);
                       });
}

bool InterruptionController::is_echo(const std::string& utterance,
                                     const std::string& agent_text) const {
    const auto heard = utils::normalize_utterance(utterance);
    const auto spoken = utils::normalize_utterance(agent_text);
    if (heard.empty() || spoken.empty()) {
        return false;
    }
    if (utils::contains_phrase(spoken, heard)) {
        return true;
    }

    const auto heard_trigrams = utils::word_trigrams(utils::split_words(heard));
    const auto spoken_trigrams = utils::word_trigrams(utils::split_words(spoken));
    for (const auto& trigram : heard_trigrams) {
        if (spoken_trigrams.count(trigram) != 0) {
            return true;
        }
    }

    const auto heard_tokens = utils::content_tokens(heard);
    const auto spoken_tokens = utils::content_tokens(spoken);
    if (heard_tokens.size() < 2) {
        return false;
    }
    size_t shared = 0;
    for (const auto& token : heard_tokens) {
        shared += spoken_tokens.count(token);
    }
    const double overlap = static_cast<double>(shared) / static_cast<double>(heard_tokens.size());
    return shared >= 2 && overlap >= options_.echo_overlap_threshold;
}

UtteranceClass InterruptionController::classify(const std::string& utterance,
                                                const SessionSnapshot& state,
                                                TimePoint now) const {
    const auto words = utils::split_words(utterance);
    if (words.empty()) {
        return UtteranceClass::Discard;
    }

    const bool agent_busy = state.agent_speaking || state.generating_response;
    const bool in_echo_tail = state.last_agent_audio_at &&
                              now - *state.last_agent_audio_at <= options_.echo_tail;
    if ((agent_busy || in_echo_tail) && is_echo(utterance, state.last_agent_text)) {
        return UtteranceClass::Echo;
    }

    if (agent_busy && static_cast<int>(words.size()) < options_.min_words) {
        // A generating agent that has produced no audio for a while counts as quiet.
        bool quiet_long_enough = false;
        if (!state.agent_speaking) {
            quiet_long_enough = !state.last_agent_audio_at ||
                                now - *state.last_agent_audio_at > options_.grace_period;
        }
        if (!quiet_long_enough) {
            return UtteranceClass::Discard;
        }
    }
    return UtteranceClass::Genuine;
}

InterruptAction InterruptionController::handle(UtteranceClass cls,
                                               TimePoint utterance_at,
                                               CallSession& session,
                                               const std::function<void()>& cancel_playback) const {
    if (cls != UtteranceClass::Genuine || session.active_playback_count() == 0) {
        return InterruptAction::None;
    }

    const auto started_at = session.current_unit_started_at();
    if (started_at && utterance_at < *started_at &&
        *started_at - utterance_at < options_.start_buffer) {
        session.mark_content_dispatched(session.current_node_id());
        info("Barge-in suppressed, utterance predates playback start",
             {kv("call_id", session.call_id()),
              kv("lead_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                *started_at - utterance_at).count())});
        Metrics::instance().increment("interruptions", "suppressed");
        return InterruptAction::SuppressedByTiming;
    }

    cancel_playback();
    Metrics::instance().increment("interruptions", "cancelled");
    info("Barge-in cancelled playback", {kv("call_id", session.call_id())});
    return InterruptAction::Cancelled;
}

std::optional<std::string> InterruptionController::rambling_interjection(
    const std::string& partial,
    CallSession& session) {
    if (!options_.rambling_guard_enabled || options_.rambling_phrases.empty()) {
        return std::nullopt;
    }
    if (static_cast<int>(utils::count_words(partial)) <= options_.rambling_word_threshold) {
        return std::nullopt;
    }
    const auto state = session.snapshot();
    if (state.agent_speaking || state.generating_response) {
        return std::nullopt;
    }
    if (!session.try_mark_interjected()) {
        return std::nullopt;
    }
    const auto index = next_rambling_phrase_++ % options_.rambling_phrases.size();
    Metrics::instance().increment("interruptions", "rambling");
    return options_.rambling_phrases[index];
}

}

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "call_engine/session/call_session.hpp"

namespace call_engine::session {

enum class UtteranceClass { Discard, Echo, Genuine };

const char* to_string(UtteranceClass value);

enum class InterruptAction {
    None,
    Cancelled,
    // Utterance predates the unit start; playback continues.
    SuppressedByTiming,
};

struct InterruptionOptions {
    int min_words = 2;
    std::chrono::milliseconds grace_period{1500};
    std::chrono::milliseconds start_buffer{400};
    double echo_overlap_threshold = 0.3;
    std::chrono::milliseconds echo_tail{1500};
    std::vector<std::string> acknowledgement_words;
    std::vector<std::string> hold_on_phrases;
    bool rambling_guard_enabled = false;
    int rambling_word_threshold = 60;
    std::vector<std::string> rambling_phrases;
};

class InterruptionController {
public:
    explicit InterruptionController(InterruptionOptions options);

    UtteranceClass classify(const std::string& utterance,
                            const SessionSnapshot& state,
                            TimePoint now) const;

    // Applies barge-in for a Genuine utterance. cancel_playback runs only
    // when playback is really interrupted.
    InterruptAction handle(UtteranceClass cls,
                           TimePoint utterance_at,
                           CallSession& session,
                           const std::function<void()>& cancel_playback) const;

    // Short reply made of acknowledgement words only ("yeah", "okay sure").
    bool is_acknowledgement(const std::string& utterance) const;
    bool is_hold_on(const std::string& utterance) const;
    bool is_echo(const std::string& utterance, const std::string& agent_text) const;

    // Interjection to speak over a long partial transcript, at most once per
    // user turn and only while the agent is silent.
    std::optional<std::string> rambling_interjection(const std::string& partial,
                                                     CallSession& session);

private:
    InterruptionOptions options_;
    std::set<std::string> acknowledgement_words_;
    std::vector<std::string> acknowledgement_phrases_;
    std::vector<std::string> hold_on_phrases_;
    std::atomic<size_t> next_rambling_phrase_{0};
};

}

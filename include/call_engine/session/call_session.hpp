#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_engine/llm/client.hpp"

namespace call_engine::session {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct SessionSnapshot {
    std::string call_id;
    std::string agent_id;
    std::string current_node_id;
    nlohmann::json variables = nlohmann::json::object();
    bool agent_speaking = false;
    bool user_speaking = false;
    bool generating_response = false;
    std::optional<TimePoint> silence_started_at;
    int checkin_count = 0;
    bool last_utterance_was_checkin = false;
    bool hold_on_detected = false;
    std::optional<TimePoint> last_checkin_at;
    std::optional<TimePoint> max_checkins_reached_at;
    TimePoint call_started_at;
    bool should_end_call = false;
    int active_playback_count = 0;
    std::optional<TimePoint> expected_playback_end;
    std::optional<TimePoint> last_agent_audio_at;
    std::optional<TimePoint> last_user_utterance_at;
    std::string last_agent_text;
    std::optional<std::string> content_dispatched_node_id;
};

// State of one live call. Every accessor takes the session lock; callers
// never hold it across external calls.
class CallSession {
public:
    CallSession(std::string call_id,
                std::string agent_id,
                std::string initial_node_id,
                TimePoint call_started_at,
                size_t history_window);

    const std::string& call_id() const { return call_id_; }
    const std::string& agent_id() const { return agent_id_; }

    SessionSnapshot snapshot() const;
    // Plain data for the shared store descriptor.
    nlohmann::json descriptor() const;

    std::string current_node_id() const;
    void set_current_node(const std::string& node_id);

    nlohmann::json variables() const;
    void set_variable(const std::string& name, const nlohmann::json& value);
    void merge_variables(const nlohmann::json& values);

    void append_history(const std::string& role, const std::string& content);
    std::vector<ChatMessage> history() const;

    // Playback accounting; the count is the size of the in-flight unit set.
    bool begin_playback(const std::string& unit_id, TimePoint expected_end);
    bool confirm_playback_started(const std::string& unit_id, TimePoint at);
    // False for units that are unknown or already ended.
    bool end_playback(const std::string& unit_id, TimePoint now);
    std::vector<std::string> clear_playback(TimePoint now);
    bool is_playing(const std::string& unit_id) const;
    int active_playback_count() const;
    bool agent_speaking() const;
    // Confirmed start of the earliest unit still playing.
    std::optional<TimePoint> current_unit_started_at() const;

    void set_user_speaking(bool speaking, TimePoint now);
    void set_generating(bool generating, TimePoint now);
    std::optional<TimePoint> silence_started_at() const;

    void set_last_agent_text(const std::string& text);

    // Final user utterance. Keeps checkin_count only for an acknowledgement
    // answering the check-in that was just issued.
    void register_user_reply(bool acknowledgement, bool hold_on, TimePoint now);
    // Returns the new checkin_count.
    int record_checkin(TimePoint now);
    void mark_max_checkins_reached(TimePoint now);
    // Rebuilding from the store on another worker.
    void restore_checkin_state(int count, bool last_utterance_was_checkin);
    // Starts the silence timer if both channels are quiet and it is not running.
    void start_silence(TimePoint now);

    void mark_content_dispatched(const std::string& node_id);
    // Consumes the marker when it matches node_id.
    bool take_content_dispatched(const std::string& node_id);
    void clear_content_dispatched();

    void request_end();
    bool should_end_call() const;

    // Per-user-turn guard for the rambling interjection.
    bool try_mark_interjected();

private:
    struct PlaybackEntry {
        TimePoint expected_end;
        std::optional<TimePoint> started_at;
    };

    bool quiet_locked() const;
    void refresh_silence_locked(TimePoint now, bool restart);
    void update_expected_end_locked();

    const std::string call_id_;
    const std::string agent_id_;
    const size_t history_window_;
    mutable std::mutex mutex_;
    std::string current_node_id_;
    nlohmann::json variables_ = nlohmann::json::object();
    std::deque<ChatMessage> history_;
    std::map<std::string, PlaybackEntry> playing_;
    bool user_speaking_ = false;
    bool generating_response_ = false;
    std::optional<TimePoint> silence_started_at_;
    int checkin_count_ = 0;
    bool last_utterance_was_checkin_ = false;
    bool hold_on_detected_ = false;
    std::optional<TimePoint> last_checkin_at_;
    std::optional<TimePoint> max_checkins_reached_at_;
    TimePoint call_started_at_;
    bool should_end_call_ = false;
    std::optional<TimePoint> expected_playback_end_;
    std::optional<TimePoint> last_agent_audio_at_;
    std::optional<TimePoint> last_user_utterance_at_;
    std::string last_agent_text_;
    std::optional<std::string> content_dispatched_node_id_;
    bool interjected_this_turn_ = false;
};

int64_t to_epoch_ms(TimePoint time);
TimePoint from_epoch_ms(int64_t epoch_ms);

}

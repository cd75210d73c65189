#include "call_engine/session/call_session.hpp"

#include <algorithm>
#include <utility>

namespace call_engine::session {

int64_t to_epoch_ms(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t epoch_ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(epoch_ms)));
}

CallSession::CallSession(std::string call_id,
                         std::string agent_id,
                         std::string initial_node_id,
                         TimePoint call_started_at,
                         size_t history_window)
    : call_id_(std::move(call_id)),
      agent_id_(std::move(agent_id)),
      history_window_(std::max<size_t>(history_window, 1)),
      current_node_id_(std::move(initial_node_id)),
      call_started_at_(call_started_at) {}

SessionSnapshot CallSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snapshot;
    snapshot.call_id = call_id_;
    snapshot.agent_id = agent_id_;
    snapshot.current_node_id = current_node_id_;
    snapshot.variables = variables_;
    snapshot.agent_speaking = !playing_.empty();
    snapshot.user_speaking = user_speaking_;
    snapshot.generating_response = generating_response_;
    snapshot.silence_started_at = silence_started_at_;
    snapshot.checkin_count = checkin_count_;
    snapshot.last_utterance_was_checkin = last_utterance_was_checkin_;
    snapshot.hold_on_detected = hold_on_detected_;
    snapshot.last_checkin_at = last_checkin_at_;
    snapshot.max_checkins_reached_at = max_checkins_reached_at_;
    snapshot.call_started_at = call_started_at_;
    snapshot.should_end_call = should_end_call_;
    snapshot.active_playback_count = static_cast<int>(playing_.size());
    snapshot.expected_playback_end = expected_playback_end_;
    snapshot.last_agent_audio_at = last_agent_audio_at_;
    snapshot.last_user_utterance_at = last_user_utterance_at_;
    snapshot.last_agent_text = last_agent_text_;
    snapshot.content_dispatched_node_id = content_dispatched_node_id_;
    return snapshot;
}

nlohmann::json CallSession::descriptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"agent_id", agent_id_},
        {"current_node_id", current_node_id_},
        {"variables", variables_},
        {"call_started_at_ms", to_epoch_ms(call_started_at_)},
        {"checkin_count", checkin_count_},
        {"last_utterance_was_checkin", last_utterance_was_checkin_},
    };
}

std::string CallSession::current_node_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_node_id_;
}

void CallSession::set_current_node(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_node_id_ = node_id;
}

nlohmann::json CallSession::variables() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return variables_;
}

void CallSession::set_variable(const std::string& name, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    variables_[name] = value;
}

void CallSession::merge_variables(const nlohmann::json& values) {
    if (!values.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : values.items()) {
        if (!item.value().is_null()) {
            variables_[item.key()] = item.value();
        }
    }
}

void CallSession::append_history(const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back({role, content});
    while (history_.size() > history_window_) {
        history_.pop_front();
    }
}

std::vector<ChatMessage> CallSession::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

bool CallSession::begin_playback(const std::string& unit_id, TimePoint expected_end) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto inserted = playing_.emplace(unit_id, PlaybackEntry{expected_end, std::nullopt}).second;
    if (inserted) {
        silence_started_at_.reset();
        update_expected_end_locked();
    }
    return inserted;
}

bool CallSession::confirm_playback_started(const std::string& unit_id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = playing_.find(unit_id);
    if (it == playing_.end()) {
        return false;
    }
    if (!it->second.started_at) {
        // Re-anchor the estimate on the confirmed start.
        const auto estimated = it->second.expected_end;
        it->second.started_at = at;
        if (estimated < at) {
            it->second.expected_end = at;
        }
        update_expected_end_locked();
    }
    last_agent_audio_at_ = at;
    return true;
}

bool CallSession::end_playback(const std::string& unit_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playing_.erase(unit_id) == 0) {
        return false;
    }
    last_agent_audio_at_ = now;
    update_expected_end_locked();
    refresh_silence_locked(now, true);
    return true;
}

std::vector<std::string> CallSession::clear_playback(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed;
    removed.reserve(playing_.size());
    for (const auto& item : playing_) {
        removed.push_back(item.first);
    }
    playing_.clear();
    if (!removed.empty()) {
        last_agent_audio_at_ = now;
        expected_playback_end_.reset();
        refresh_silence_locked(now, true);
    }
    return removed;
}

bool CallSession::is_playing(const std::string& unit_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return playing_.count(unit_id) != 0;
}

int CallSession::active_playback_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(playing_.size());
}

bool CallSession::agent_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !playing_.empty();
}

std::optional<TimePoint> CallSession::current_unit_started_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<TimePoint> earliest;
    for (const auto& item : playing_) {
        if (item.second.started_at && (!earliest || *item.second.started_at < *earliest)) {
            earliest = item.second.started_at;
        }
    }
    return earliest;
}

void CallSession::set_user_speaking(bool speaking, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (user_speaking_ == speaking) {
        return;
    }
    user_speaking_ = speaking;
    refresh_silence_locked(now, true);
}

void CallSession::set_generating(bool generating, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generating_response_ == generating) {
        return;
    }
    generating_response_ = generating;
    refresh_silence_locked(now, true);
}

std::optional<TimePoint> CallSession::silence_started_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return silence_started_at_;
}

void CallSession::set_last_agent_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_agent_text_ = text;
}

void CallSession::register_user_reply(bool acknowledgement, bool hold_on, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool answered_checkin = last_utterance_was_checkin_ && acknowledgement;
    if (!answered_checkin) {
        checkin_count_ = 0;
        max_checkins_reached_at_.reset();
    }
    hold_on_detected_ = hold_on;
    last_utterance_was_checkin_ = false;
    last_user_utterance_at_ = now;
    interjected_this_turn_ = false;
    user_speaking_ = false;
    refresh_silence_locked(now, true);
}

int CallSession::record_checkin(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++checkin_count_;
    last_checkin_at_ = now;
    last_utterance_was_checkin_ = true;
    return checkin_count_;
}

void CallSession::mark_max_checkins_reached(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!max_checkins_reached_at_) {
        max_checkins_reached_at_ = now;
    }
}

void CallSession::restore_checkin_state(int count, bool last_utterance_was_checkin) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkin_count_ = std::max(0, count);
    last_utterance_was_checkin_ = last_utterance_was_checkin && checkin_count_ > 0;
}

void CallSession::start_silence(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_silence_locked(now, false);
}

void CallSession::mark_content_dispatched(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    content_dispatched_node_id_ = node_id;
}

bool CallSession::take_content_dispatched(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (content_dispatched_node_id_ && *content_dispatched_node_id_ == node_id) {
        content_dispatched_node_id_.reset();
        return true;
    }
    return false;
}

void CallSession::clear_content_dispatched() {
    std::lock_guard<std::mutex> lock(mutex_);
    content_dispatched_node_id_.reset();
}

void CallSession::request_end() {
    std::lock_guard<std::mutex> lock(mutex_);
    should_end_call_ = true;
}

bool CallSession::should_end_call() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return should_end_call_;
}

bool CallSession::try_mark_interjected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interjected_this_turn_) {
        return false;
    }
    interjected_this_turn_ = true;
    return true;
}

bool CallSession::quiet_locked() const {
    return playing_.empty() && !generating_response_ && !user_speaking_;
}

void CallSession::refresh_silence_locked(TimePoint now, bool restart) {
    if (!quiet_locked()) {
        silence_started_at_.reset();
        return;
    }
    if (restart || !silence_started_at_) {
        silence_started_at_ = now;
    }
}

void CallSession::update_expected_end_locked() {
    expected_playback_end_.reset();
    for (const auto& item : playing_) {
        if (!expected_playback_end_ || item.second.expected_end > *expected_playback_end_) {
            expected_playback_end_ = item.second.expected_end;
        }
    }
}

}

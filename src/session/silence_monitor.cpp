#include "call_engine/session/silence_monitor.hpp"

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"

namespace call_engine::session {

std::string to_string(SilenceState state) {
    switch (state) {
        case SilenceState::Quiet:
            return "quiet";
        case SilenceState::CheckinPending:
            return "checkin_pending";
        case SilenceState::Terminated:
            return "terminated";
    }
    return "unknown";
}

SilenceMonitor::SilenceMonitor(std::shared_ptr<CallSession> session,
                               std::shared_ptr<SharedSessionStore> store,
                               SilenceOptions options)
    : session_(std::move(session)), store_(std::move(store)), options_(options) {}

SilenceMonitor::~SilenceMonitor() {
    stop();
}

SilenceState SilenceMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SilenceDecision SilenceMonitor::tick(TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SilenceState::Terminated) {
            return {};
        }
    }

    auto snapshot = session_->snapshot();
    if (now - snapshot.call_started_at >= options_.max_call_duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SilenceState::Terminated;
        Metrics::instance().increment("terminations", "max_duration");
        info("Max call duration reached", {kv("call_id", snapshot.call_id)});
        return {SilenceDecision::Action::Terminate, 0, "max_duration"};
    }

    if (snapshot.active_playback_count > 0) {
        reconcile_playback(now);
        snapshot = session_->snapshot();
    }

    if (!snapshot.silence_started_at) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = snapshot.checkin_count > 0 ? SilenceState::CheckinPending : SilenceState::Quiet;
        return {};
    }

    const auto timeout =
        snapshot.hold_on_detected ? options_.hold_on_timeout : options_.silence_timeout;
    if (now - *snapshot.silence_started_at < timeout) {
        return {};
    }

    if (snapshot.checkin_count >= options_.max_checkins) {
        // One more full silence interval has passed since the last check-in.
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SilenceState::Terminated;
        Metrics::instance().increment("terminations", "silence");
        info("Silence after final check-in", {kv("call_id", snapshot.call_id),
                                              kv("checkins", snapshot.checkin_count)});
        return {SilenceDecision::Action::Terminate, snapshot.checkin_count, "max_checkins"};
    }

    if (snapshot.last_checkin_at && now - *snapshot.last_checkin_at < options_.checkin_min_gap) {
        return {};
    }
    if (!claim_checkin()) {
        return {};
    }

    const int number = session_->record_checkin(now);
    if (number >= options_.max_checkins) {
        session_->mark_max_checkins_reached(now);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SilenceState::CheckinPending;
    }
    Metrics::instance().increment("checkins", std::to_string(number));
    info("Silence check-in", {kv("call_id", snapshot.call_id), kv("checkin", number)});
    return {SilenceDecision::Action::Checkin, number, snapshot.hold_on_detected ? "hold_on" : "silence"};
}

void SilenceMonitor::reconcile_playback(TimePoint now) {
    const auto& call_id = session_->call_id();
    try {
        const bool done_elsewhere = store_->get_flag(call_id, flags::kAgentDoneSpeaking);
        const auto snapshot = session_->snapshot();
        const bool stale = snapshot.expected_playback_end &&
                           now > *snapshot.expected_playback_end + options_.stale_grace;
        if (!done_elsewhere && !stale) {
            return;
        }
        if (store_->counter(call_id, counters::kActivePlaybackCount) != 0) {
            return;
        }
        const auto removed = session_->clear_playback(now);
        if (!removed.empty()) {
            Metrics::instance().increment("playback_reconciled", stale ? "stale" : "remote");
            warn("Cleared local playback", {kv("call_id", call_id),
                                            kv("units", removed.size()),
                                            kv("reason", stale ? "stale" : "agent_done_speaking")});
        }
    } catch (const StoreError& ex) {
        warn("Playback reconcile failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
}

bool SilenceMonitor::claim_checkin() {
    try {
        return store_->set_flag_if_absent(session_->call_id(), flags::kCheckinInProgress,
                                          options_.flag_ttl);
    } catch (const StoreError& ex) {
        warn("Check-in guard unavailable", {kv("call_id", session_->call_id()),
                                            kv("error", ex.what())});
        return true;
    }
}

void SilenceMonitor::start(TickHandler handler) {
    if (running_->exchange(true)) {
        return;
    }
    worker_ = std::thread([this, running = running_, handler = std::move(handler)]() {
        run_loop(running, handler);
    });
}

void SilenceMonitor::stop() {
    if (!running_->exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
    }
    loop_cv_.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

void SilenceMonitor::run_loop(std::shared_ptr<std::atomic<bool>> running, TickHandler handler) {
    const auto call_id = session_->call_id();
    while (*running) {
        {
            std::unique_lock<std::mutex> lock(loop_mutex_);
            loop_cv_.wait_for(lock, options_.tick_interval, [&running]() { return !*running; });
        }
        if (!*running) {
            break;
        }
        try {
            handler(Clock::now());
        } catch (const std::exception& ex) {
            error("Silence tick failed", {kv("call_id", call_id), kv("error", ex.what())});
        }
    }
}

}

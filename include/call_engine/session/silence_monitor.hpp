#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "call_engine/session/call_session.hpp"
#include "call_engine/session/shared_store.hpp"

namespace call_engine::session {

enum class SilenceState { Quiet, CheckinPending, Terminated };

std::string to_string(SilenceState state);

struct SilenceOptions {
    std::chrono::milliseconds silence_timeout{7000};
    std::chrono::milliseconds hold_on_timeout{25000};
    int max_checkins = 2;
    std::chrono::milliseconds checkin_min_gap{3000};
    std::chrono::milliseconds max_call_duration{1500000};
    std::chrono::milliseconds tick_interval{500};
    std::chrono::milliseconds stale_grace{5000};
    std::chrono::seconds flag_ttl{30};
};

struct SilenceDecision {
    enum class Action { None, Checkin, Terminate };

    Action action = Action::None;
    int checkin_number = 0;
    std::string reason;
};

// Escalates silence to check-ins and finally termination. tick() only
// decides and records; the owner speaks the check-in or tears the call down.
class SilenceMonitor {
public:
    using TickHandler = std::function<void(TimePoint now)>;

    SilenceMonitor(std::shared_ptr<CallSession> session,
                   std::shared_ptr<SharedSessionStore> store,
                   SilenceOptions options);
    ~SilenceMonitor();

    SilenceDecision tick(TimePoint now);

    // Calls handler every tick_interval on a dedicated thread until stop().
    void start(TickHandler handler);
    void stop();

    SilenceState state() const;

private:
    void run_loop(std::shared_ptr<std::atomic<bool>> running, TickHandler handler);
    void reconcile_playback(TimePoint now);
    bool claim_checkin();

    std::shared_ptr<CallSession> session_;
    std::shared_ptr<SharedSessionStore> store_;
    SilenceOptions options_;

    mutable std::mutex mutex_;
    SilenceState state_ = SilenceState::Quiet;

    // Shared with the worker, which may outlive this object when the last
    // owner is released from inside a tick.
    std::shared_ptr<std::atomic<bool>> running_ = std::make_shared<std::atomic<bool>>(false);
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread worker_;
};

}

#include <catch2/catch_test_macros.hpp>

#include "call_engine/session/silence_monitor.hpp"

#include <atomic>
#include <memory>
#include <thread>

using namespace call_engine::session;
using Action = SilenceDecision::Action;

namespace {

TimePoint at_ms(int64_t ms) {
    return from_epoch_ms(1700000000000 + ms);
}

struct Fixture {
    std::shared_ptr<CallSession> session =
        std::make_shared<CallSession>("call-1", "agent-1", "greet", at_ms(0), 20);
    std::shared_ptr<MemorySessionStore> store = std::make_shared<MemorySessionStore>();
    SilenceMonitor monitor{session, store, SilenceOptions{}};

    // What the orchestrator does after speaking a check-in.
    void finish_checkin(int64_t spoke_at_ms) {
        session->begin_playback("checkin", at_ms(spoke_at_ms + 1500));
        session->end_playback("checkin", at_ms(spoke_at_ms + 1500));
        store->clear_flag(session->call_id(), flags::kCheckinInProgress);
    }
};

}

TEST_CASE("silence escalates through check-ins to termination") {
    Fixture f;
    f.session->start_silence(at_ms(0));

    REQUIRE(f.monitor.tick(at_ms(6900)).action == Action::None);

    const auto first = f.monitor.tick(at_ms(7000));
    REQUIRE(first.action == Action::Checkin);
    REQUIRE(first.checkin_number == 1);
    REQUIRE(f.monitor.state() == SilenceState::CheckinPending);
    f.finish_checkin(7000);

    // "yeah" answering the check-in keeps the count.
    f.session->register_user_reply(true, false, at_ms(10000));
    REQUIRE(f.session->snapshot().checkin_count == 1);

    REQUIRE(f.monitor.tick(at_ms(16000)).action == Action::None);
    const auto second = f.monitor.tick(at_ms(17000));
    REQUIRE(second.action == Action::Checkin);
    REQUIRE(second.checkin_number == 2);
    REQUIRE(f.session->snapshot().max_checkins_reached_at.has_value());
    f.finish_checkin(17000);

    // "okay" keeps it as well.
    f.session->register_user_reply(true, false, at_ms(20000));
    REQUIRE(f.session->snapshot().checkin_count == 2);

    const auto last = f.monitor.tick(at_ms(27000));
    REQUIRE(last.action == Action::Terminate);
    REQUIRE(last.reason == "max_checkins");
    REQUIRE(f.monitor.state() == SilenceState::Terminated);
    REQUIRE(f.monitor.tick(at_ms(40000)).action == Action::None);
}

TEST_CASE("a substantive reply resets the escalation") {
    Fixture f;
    f.session->start_silence(at_ms(0));
    REQUIRE(f.monitor.tick(at_ms(7000)).checkin_number == 1);
    f.finish_checkin(7000);

    f.session->register_user_reply(false, false, at_ms(9000));
    REQUIRE(f.session->snapshot().checkin_count == 0);
    REQUIRE(f.monitor.tick(at_ms(16000)).checkin_number == 1);
}

TEST_CASE("only one worker claims a check-in") {
    Fixture f;
    f.session->start_silence(at_ms(0));
    REQUIRE(f.store->set_flag_if_absent("call-1", flags::kCheckinInProgress, std::chrono::seconds(30)));
    REQUIRE(f.monitor.tick(at_ms(8000)).action == Action::None);
    REQUIRE(f.session->snapshot().checkin_count == 0);

    f.store->clear_flag("call-1", flags::kCheckinInProgress);
    REQUIRE(f.monitor.tick(at_ms(8500)).action == Action::Checkin);
}

TEST_CASE("hold on stretches the silence timeout") {
    Fixture f;
    f.session->register_user_reply(false, true, at_ms(1000));
    REQUIRE(f.monitor.tick(at_ms(9000)).action == Action::None);
    REQUIRE(f.monitor.tick(at_ms(25900)).action == Action::None);
    const auto decision = f.monitor.tick(at_ms(26000));
    REQUIRE(decision.action == Action::Checkin);
    REQUIRE(decision.reason == "hold_on");
}

TEST_CASE("no silence is measured while the agent or caller is active") {
    Fixture f;
    f.session->begin_playback("unit", at_ms(60000));
    REQUIRE(f.monitor.tick(at_ms(20000)).action == Action::None);
    f.session->set_user_speaking(true, at_ms(20000));
    REQUIRE(f.monitor.tick(at_ms(40000)).action == Action::None);
    REQUIRE(f.session->snapshot().checkin_count == 0);
}

TEST_CASE("the call ends at the maximum duration") {
    Fixture f;
    f.session->begin_playback("unit", at_ms(2000000));
    const auto decision = f.monitor.tick(at_ms(1500000));
    REQUIRE(decision.action == Action::Terminate);
    REQUIRE(decision.reason == "max_duration");
}

TEST_CASE("playback finished on another worker is reconciled") {
    Fixture f;
    f.session->begin_playback("unit", at_ms(3000));
    f.store->set_flag("call-1", flags::kAgentDoneSpeaking, std::chrono::seconds(30));

    REQUIRE(f.monitor.tick(at_ms(1000)).action == Action::None);
    REQUIRE(f.session->active_playback_count() == 0);
    REQUIRE(f.session->silence_started_at() == at_ms(1000));
}

TEST_CASE("stale playback is cleared only once the shared count is zero") {
    Fixture f;
    f.session->begin_playback("unit", at_ms(3000));
    f.store->atomic_increment("call-1", counters::kActivePlaybackCount);

    f.monitor.tick(at_ms(9000));
    REQUIRE(f.session->active_playback_count() == 1);

    f.store->atomic_decrement("call-1", counters::kActivePlaybackCount);
    f.monitor.tick(at_ms(9000));
    REQUIRE(f.session->active_playback_count() == 0);
}

TEST_CASE("the background loop ticks until stopped") {
    auto session = std::make_shared<CallSession>("call-2", "agent-1", "greet", Clock::now(), 20);
    SilenceOptions options;
    options.tick_interval = std::chrono::milliseconds(10);
    SilenceMonitor monitor(session, std::make_shared<MemorySessionStore>(), options);

    std::atomic<int> ticks{0};
    monitor.start([&ticks](TimePoint) { ++ticks; });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    monitor.stop();
    const int seen = ticks.load();
    REQUIRE(seen > 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(ticks.load() == seen);
}

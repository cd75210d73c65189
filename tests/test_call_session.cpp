#include <catch2/catch_test_macros.hpp>

#include "call_engine/session/call_session.hpp"

using namespace call_engine::session;
using std::chrono::milliseconds;

namespace {

TimePoint at_ms(int64_t ms) {
    return from_epoch_ms(1700000000000 + ms);
}

}

TEST_CASE("playback count tracks the set of units in flight") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    REQUIRE(session.begin_playback("a", at_ms(2000)));
    REQUIRE(session.begin_playback("b", at_ms(4000)));
    REQUIRE_FALSE(session.begin_playback("a", at_ms(9000)));
    REQUIRE(session.active_playback_count() == 2);
    REQUIRE(session.snapshot().expected_playback_end == at_ms(4000));

    REQUIRE(session.end_playback("a", at_ms(2100)));
    REQUIRE_FALSE(session.is_playing("a"));
    REQUIRE(session.is_playing("b"));
    REQUIRE_FALSE(session.end_playback("a", at_ms(2200)));
    REQUIRE_FALSE(session.end_playback("never-started", at_ms(2200)));
    REQUIRE(session.active_playback_count() == 1);
    REQUIRE(session.agent_speaking());
    REQUIRE_FALSE(session.silence_started_at().has_value());

    REQUIRE(session.end_playback("b", at_ms(4100)));
    REQUIRE(session.active_playback_count() == 0);
    REQUIRE(session.silence_started_at() == at_ms(4100));
    REQUIRE(session.snapshot().last_agent_audio_at == at_ms(4100));
}

TEST_CASE("clear_playback returns every removed unit") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.begin_playback("a", at_ms(2000));
    session.begin_playback("b", at_ms(3000));
    const auto removed = session.clear_playback(at_ms(500));
    REQUIRE(removed.size() == 2);
    REQUIRE(session.active_playback_count() == 0);
    REQUIRE_FALSE(session.snapshot().expected_playback_end.has_value());
    REQUIRE(session.clear_playback(at_ms(600)).empty());
}

TEST_CASE("confirmed start re-anchors the unit") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.begin_playback("a", at_ms(1000));
    REQUIRE(session.confirm_playback_started("a", at_ms(1500)));
    REQUIRE(session.current_unit_started_at() == at_ms(1500));
    REQUIRE(session.snapshot().expected_playback_end == at_ms(1500));
    REQUIRE_FALSE(session.confirm_playback_started("zzz", at_ms(1600)));
}

TEST_CASE("silence runs only while every channel is quiet") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    REQUIRE_FALSE(session.silence_started_at().has_value());
    session.start_silence(at_ms(10));
    REQUIRE(session.silence_started_at() == at_ms(10));
    session.start_silence(at_ms(50));
    REQUIRE(session.silence_started_at() == at_ms(10));

    session.set_user_speaking(true, at_ms(100));
    REQUIRE_FALSE(session.silence_started_at().has_value());
    session.set_user_speaking(false, at_ms(200));
    REQUIRE(session.silence_started_at() == at_ms(200));

    session.set_generating(true, at_ms(300));
    REQUIRE_FALSE(session.silence_started_at().has_value());
    session.set_generating(false, at_ms(400));
    REQUIRE(session.silence_started_at() == at_ms(400));
}

TEST_CASE("check-in count survives only an acknowledgement of the check-in") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    REQUIRE(session.record_checkin(at_ms(7000)) == 1);
    session.register_user_reply(true, false, at_ms(8000));
    REQUIRE(session.snapshot().checkin_count == 1);

    REQUIRE(session.record_checkin(at_ms(16000)) == 2);
    session.mark_max_checkins_reached(at_ms(16000));
    session.register_user_reply(false, false, at_ms(17000));
    const auto state = session.snapshot();
    REQUIRE(state.checkin_count == 0);
    REQUIRE_FALSE(state.max_checkins_reached_at.has_value());
    REQUIRE_FALSE(state.last_utterance_was_checkin);

    // An acknowledgement that does not answer a check-in still resets.
    session.record_checkin(at_ms(25000));
    session.register_user_reply(false, false, at_ms(25500));
    session.register_user_reply(true, false, at_ms(26000));
    REQUIRE(session.snapshot().checkin_count == 0);
}

TEST_CASE("hold-on is remembered until the next reply") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.register_user_reply(false, true, at_ms(100));
    REQUIRE(session.snapshot().hold_on_detected);
    session.register_user_reply(false, false, at_ms(200));
    REQUIRE_FALSE(session.snapshot().hold_on_detected);
}

TEST_CASE("history keeps only the newest messages") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 3);
    for (int i = 0; i < 5; ++i) {
        session.append_history("user", "message " + std::to_string(i));
    }
    const auto history = session.history();
    REQUIRE(history.size() == 3);
    REQUIRE(history.front().content == "message 2");
    REQUIRE(history.back().content == "message 4");
}

TEST_CASE("variables merge without nulls and appear in the descriptor") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.set_variable("name", "Sam");
    session.merge_variables({{"city", "Austin"}, {"name", nullptr}});
    session.set_current_node("pitch");
    session.restore_checkin_state(2, true);

    const auto descriptor = session.descriptor();
    REQUIRE(descriptor.at("agent_id") == "agent-1");
    REQUIRE(descriptor.at("current_node_id") == "pitch");
    REQUIRE(descriptor.at("variables") == nlohmann::json{{"name", "Sam"}, {"city", "Austin"}});
    REQUIRE(descriptor.at("call_started_at_ms") == 1700000000000);
    REQUIRE(descriptor.at("checkin_count") == 2);
    REQUIRE(descriptor.at("last_utterance_was_checkin") == true);
}

TEST_CASE("a restored check-in still lets an acknowledgement keep the count") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.restore_checkin_state(2, true);
    session.register_user_reply(true, false, at_ms(1000));
    REQUIRE(session.snapshot().checkin_count == 2);

    CallSession fresh("call-2", "agent-1", "greet", at_ms(0), 20);
    fresh.restore_checkin_state(0, true);
    REQUIRE_FALSE(fresh.snapshot().last_utterance_was_checkin);
}

TEST_CASE("content dispatch marker is consumed once") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    session.mark_content_dispatched("greet");
    REQUIRE_FALSE(session.take_content_dispatched("pitch"));
    REQUIRE(session.take_content_dispatched("greet"));
    REQUIRE_FALSE(session.take_content_dispatched("greet"));
}

TEST_CASE("end request and interjection guard") {
    CallSession session("call-1", "agent-1", "greet", at_ms(0), 20);
    REQUIRE_FALSE(session.should_end_call());
    session.request_end();
    REQUIRE(session.should_end_call());
    REQUIRE(session.try_mark_interjected());
    REQUIRE_FALSE(session.try_mark_interjected());
}

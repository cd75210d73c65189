#include <catch2/catch_test_macros.hpp>

#include "call_engine/app.hpp"
#include "call_engine/audio/stream_coordinator.hpp"
#include "call_engine/utils/base64.hpp"
#include "fakes.hpp"

#include <chrono>
#include <functional>
#include <thread>

using namespace call_engine;
using call_engine::testing::FakeLlm;
using call_engine::testing::FakeProvider;
using call_engine::testing::FakeSynthesizer;
using nlohmann::json;

namespace {

json sales_agent() {
    return json::parse(R"({
        "id": "sales",
        "call_flow": [
            {"id": "greet", "type": "conversation", "data": {
                "script": "Hi, this is Jake. Got a minute?",
                "transitions": [
                    {"condition": "caller agrees to talk", "nextNode": "pitch"},
                    {"condition": "caller is not interested", "nextNode": "bye"}
                ]}},
            {"id": "pitch", "type": "conversation", "data": {"script": "We build websites."}},
            {"id": "bye", "type": "ending", "data": {"script": "No problem. Goodbye."}}
        ]
    })");
}

json webhook(const std::string& id,
             const std::string& type,
             const std::string& call_id,
             const json& extra = json::object()) {
    json payload = {{"call_control_id", call_id}};
    for (const auto& item : extra.items()) {
        payload[item.key()] = item.value();
    }
    return {{"data", {{"id", id}, {"event_type", type}, {"payload", payload}}}};
}

bool wait_until(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

struct AppHarness {
    std::shared_ptr<FakeLlm> llm = std::make_shared<FakeLlm>();
    std::shared_ptr<session::MemorySessionStore> store = std::make_shared<session::MemorySessionStore>();
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::unique_ptr<EngineApp> app;

    AppHarness() {
        Config config;
        config.session_ready_wait_ms = 100;
        config.affirmative_prefixes = {"yes", "yeah", "sure"};
        config.negative_prefixes = {"no", "not interested"};
        config.acknowledgement_words = {"yeah", "yes", "okay"};

        EngineServices services;
        services.llm = llm;
        services.store = store;
        services.provider = provider;
        services.agents = std::make_shared<flow::AgentRepository>(
            nullptr, llm, EngineApp::evaluator_options(config));
        services.agents->add(sales_agent());
        services.synthesizer_factory = [](const std::string&) {
            return std::make_shared<FakeSynthesizer>();
        };
        app = std::make_unique<EngineApp>(config, services);
    }

    RestResponse answer(const std::string& call_id, const json& extra = {{"agent_id", "sales"}}) {
        return app->handle_webhook(webhook("answered-" + call_id, "call.answered", call_id, extra));
    }

    void end_all_playback(const std::string& call_id) {
        int n = 0;
        for (const auto& action : provider->actions_named("playback_start")) {
            if (action.call_id != call_id) {
                continue;
            }
            app->handle_webhook(webhook("ended-" + std::to_string(n++) + "-" + action.unit_id,
                                        "call.playback.ended", call_id,
                                        {{"client_state", utils::base64_encode(action.unit_id)}}));
        }
    }
};

}

TEST_CASE("malformed webhooks are rejected") {
    AppHarness h;
    REQUIRE(h.app->handle_webhook(json{{"nope", 1}}).status == 400);
    REQUIRE(h.app->handle_webhook(json{{"data", {{"event_type", "call.answered"}}}}).status == 400);
}

TEST_CASE("an answered call starts its session once") {
    AppHarness h;
    const auto first = h.answer("call-1");
    REQUIRE(first.status == 200);
    REQUIRE(first.body.at("message") == "ok");
    REQUIRE(h.app->find_session("call-1") != nullptr);
    REQUIRE(wait_until([&] { return h.provider->count("playback_start") == 2; }));

    const auto retry = h.answer("call-1");
    REQUIRE(retry.body.at("message") == "duplicate");
    REQUIRE(h.app->active_sessions() == 1);
    REQUIRE(h.store->get_flag("call-1", session::flags::kSessionReady));
}

TEST_CASE("the agent comes from client_state or the configured default") {
    AppHarness h;
    h.answer("call-2", {{"client_state", utils::base64_encode(R"({"agent_id": "sales"})")}});
    REQUIRE(h.app->find_session("call-2") != nullptr);

    h.answer("call-3", json::object());
    REQUIRE(h.app->find_session("call-3") == nullptr);
    REQUIRE(h.provider->count("hangup") == 1);
    REQUIRE(h.provider->actions_named("speak").at(0).call_id == "call-3");

    h.answer("call-4", {{"agent_id", "ghost"}});
    REQUIRE(h.app->find_session("call-4") == nullptr);
    REQUIRE(h.provider->count("hangup") == 2);
}

TEST_CASE("transcripts drive the flow and playback webhooks finish it") {
    AppHarness h;
    h.answer("call-1");
    REQUIRE(wait_until([&] { return h.provider->count("playback_start") == 2; }));

    const auto response = h.app->handle_transcript("call-1", {{"text", "No thanks"}});
    REQUIRE(response.status == 200);
    const auto orchestrator = h.app->find_session("call-1");
    REQUIRE(orchestrator->session()->current_node_id() == "bye");
    REQUIRE(h.provider->count("hangup") == 0);

    h.end_all_playback("call-1");
    REQUIRE(h.provider->count("hangup") == 1);
    REQUIRE(orchestrator->finished());

    h.app->handle_webhook(webhook("hangup-1", "call.hangup", "call-1"));
    REQUIRE(h.app->find_session("call-1") == nullptr);
    REQUIRE_FALSE(h.store->get("call-1").has_value());
}

TEST_CASE("a transcript arriving after hangup is ignored") {
    AppHarness h;
    h.answer("call-5");
    REQUIRE(wait_until([&] { return h.provider->count("playback_start") == 2; }));
    h.app->handle_webhook(webhook("hangup-5", "call.hangup", "call-5"));
    REQUIRE(h.store->get_flag("call-5", session::flags::kCallEnded));

    const auto response = h.app->handle_transcript("call-5", {{"text", "hello, are you there?"}});
    REQUIRE(response.status == 200);
    REQUIRE(response.body.at("message") == "ignored");
    REQUIRE(h.app->find_session("call-5") == nullptr);
    REQUIRE(h.provider->count("speak") == 0);
    REQUIRE(h.provider->count("hangup") == 0);
}

TEST_CASE("transcript validation") {
    AppHarness h;
    REQUIRE(h.app->handle_transcript("call-1", json::object()).status == 400);
    REQUIRE(h.app->handle_transcript("call-1", {{"text", 5}}).status == 400);
    const auto ignored = h.app->handle_transcript("call-1", {{"text", " ... "}});
    REQUIRE(ignored.status == 200);
    REQUIRE(ignored.body.at("message") == "ignored");
}

TEST_CASE("a call unknown to every worker is abandoned") {
    AppHarness h;
    const auto response = h.app->handle_transcript("call-x", {{"text", "hello?"}});
    REQUIRE(response.status == 404);
    REQUIRE(h.provider->actions_named("speak").at(0).detail == "Thanks for your time. Goodbye.");
    REQUIRE(h.provider->count("hangup") == 1);
}

TEST_CASE("a session published by another worker is rebuilt from the store") {
    AppHarness h;
    const auto started_ms = session::to_epoch_ms(session::Clock::now()) - 30000;
    h.store->set("call-9",
                 {{"agent_id", "sales"},
                  {"current_node_id", "greet"},
                  {"call_started_at_ms", started_ms},
                  {"variables", {{"name", "Sam"}}},
                  {"checkin_count", 1}},
                 std::chrono::seconds(60));
    h.store->set_flag("call-9", session::flags::kSessionReady, std::chrono::seconds(60));

    const auto response = h.app->handle_transcript("call-9", {{"text", "Yes sure"}});
    REQUIRE(response.status == 200);
    const auto orchestrator = h.app->find_session("call-9");
    REQUIRE(orchestrator != nullptr);
    const auto state = orchestrator->session()->snapshot();
    REQUIRE(state.current_node_id == "pitch");
    REQUIRE(state.variables.at("name") == "Sam");
    REQUIRE(session::to_epoch_ms(state.call_started_at) == started_ms);
    REQUIRE(h.store->get("call-9")->at("current_node_id") == "pitch");
}

TEST_CASE("a check-in issued on another worker survives the rebuild") {
    AppHarness h;
    h.store->set("call-6",
                 {{"agent_id", "sales"},
                  {"current_node_id", "greet"},
                  {"call_started_at_ms", session::to_epoch_ms(session::Clock::now())},
                  {"checkin_count", 2},
                  {"last_utterance_was_checkin", true}},
                 std::chrono::seconds(60));
    h.store->set_flag("call-6", session::flags::kSessionReady, std::chrono::seconds(60));

    REQUIRE(h.app->handle_transcript("call-6", {{"text", "yeah"}}).status == 200);
    const auto orchestrator = h.app->find_session("call-6");
    REQUIRE(orchestrator != nullptr);
    REQUIRE(orchestrator->session()->snapshot().checkin_count == 2);
    REQUIRE(h.store->get("call-6")->at("last_utterance_was_checkin") == false);
}

TEST_CASE("an incomplete descriptor abandons the call") {
    AppHarness h;
    h.store->set("call-8", {{"current_node_id", "greet"}}, std::chrono::seconds(60));
    h.store->set_flag("call-8", session::flags::kSessionReady, std::chrono::seconds(60));

    REQUIRE(h.app->handle_transcript("call-8", {{"text", "hello"}}).status == 404);
    REQUIRE(h.app->find_session("call-8") == nullptr);
    REQUIRE(h.provider->count("hangup") == 1);
}

TEST_CASE("playback ended for a call owned elsewhere only updates the store") {
    AppHarness h;
    h.store->atomic_increment("call-7", session::counters::kActivePlaybackCount);
    const json state = {{"client_state", utils::base64_encode("unit-a")}};

    h.app->handle_webhook(webhook("e1", "call.playback.ended", "call-7", state));
    REQUIRE(h.store->counter("call-7", session::counters::kActivePlaybackCount) == 0);
    REQUIRE(h.store->get_flag("call-7", session::flags::kAgentDoneSpeaking));
    REQUIRE(h.store->get_flag("call-7", audio::playback_ended_flag("unit-a")));

    // Same unit under a new event id is still counted once.
    h.store->atomic_increment("call-7", session::counters::kActivePlaybackCount);
    h.app->handle_webhook(webhook("e2", "call.playback.ended", "call-7", state));
    REQUIRE(h.store->counter("call-7", session::counters::kActivePlaybackCount) == 1);
    REQUIRE(h.app->find_session("call-7") == nullptr);
}

TEST_CASE("other event types are acknowledged and ignored") {
    AppHarness h;
    const auto response = h.app->handle_webhook(webhook("d1", "call.dtmf.received", "call-1"));
    REQUIRE(response.status == 200);
    REQUIRE(h.app->active_sessions() == 0);
}

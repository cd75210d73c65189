#include <catch2/catch_test_macros.hpp>

#include "call_engine/session/orchestrator.hpp"
#include "fakes.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

using namespace call_engine;
using namespace call_engine::session;
using call_engine::testing::FakeLlm;
using call_engine::testing::FakeProvider;
using call_engine::testing::FakeSynthesizer;
using nlohmann::json;

namespace {

json sales_agent() {
    return json::parse(R"({
        "id": "sales",
        "system_prompt": "You are Jake from Example Websites.",
        "call_flow": [
            {"id": "start", "type": "start", "data": {"transitions": [{"condition": "", "nextNode": "greet"}]}},
            {"id": "greet", "type": "conversation", "data": {
                "script": "Hi {{name}}, thanks for picking up. Do you have a minute?",
                "transitions": [
                    {"condition": "caller agrees to talk", "nextNode": "pitch"},
                    {"condition": "caller is not interested", "nextNode": "bye"}
                ]}},
            {"id": "pitch", "type": "conversation", "data": {
                "script": "Great. We build websites for local businesses.",
                "goal": "Get the caller to book a call",
                "transitions": [
                    {"condition": "caller wants to book a call", "nextNode": "bye"},
                    {"condition": "caller is not interested", "nextNode": "bye"}
                ]}},
            {"id": "bye", "type": "ending", "data": {"script": "No problem. Goodbye."}}
        ]
    })");
}

OrchestratorOptions test_options() {
    OrchestratorOptions options;
    options.run_silence_thread = false;
    options.interruption.acknowledgement_words = {"yeah", "yes", "okay", "ok", "sure", "mhm"};
    options.interruption.hold_on_phrases = {"hold on", "one second"};
    options.extraction_timeout = std::chrono::milliseconds(500);
    return options;
}

flow::TransitionEvaluatorOptions evaluator_options() {
    flow::TransitionEvaluatorOptions options;
    options.model_timeout = std::chrono::milliseconds(500);
    options.affirmative_prefixes = {"yes", "yeah", "sure", "okay"};
    options.negative_prefixes = {"no", "nope", "not interested"};
    return options;
}

struct Harness {
    std::shared_ptr<FakeLlm> llm;
    std::shared_ptr<MemorySessionStore> store = std::make_shared<MemorySessionStore>();
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>();
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::shared_ptr<CallSession> session;
    std::shared_ptr<SessionOrchestrator> orchestrator;

    Harness(const json& agent, std::vector<std::string> replies = {})
        : llm(std::make_shared<FakeLlm>(std::move(replies))) {
        flow::AgentRepository repository(nullptr, llm, evaluator_options());
        auto runtime = repository.add(agent);
        session = std::make_shared<CallSession>("call-1", runtime->graph.agent_id(),
                                                runtime->graph.entry_node().id, Clock::now(), 20);
        OrchestratorDeps deps{runtime, llm, store, synthesizer, provider};
        orchestrator = std::make_shared<SessionOrchestrator>(session, deps, test_options());
    }

    ~Harness() { orchestrator->stop(); }

    std::vector<std::string> played() const {
        std::vector<std::string> texts;
        for (const auto& action : provider->actions_named("playback_start")) {
            texts.push_back(action.detail);
        }
        return texts;
    }

    bool played_text(const std::string& text) const {
        const auto texts = played();
        return std::find(texts.begin(), texts.end(), text) != texts.end();
    }

    // Playback-ended webhook for every unit handed off so far.
    void drain() {
        for (const auto& action : provider->actions_named("playback_start")) {
            orchestrator->on_playback_event(action.unit_id, true, Clock::now());
        }
    }

    void say(const std::string& text) { orchestrator->on_transcript(text, true, Clock::now()); }
};

}

TEST_CASE("greeting plays the entry conversation with variables") {
    Harness h(sales_agent());
    h.session->set_variable("name", "Sam");
    h.orchestrator->start(true);

    REQUIRE(h.played() ==
            std::vector<std::string>{"Hi Sam, thanks for picking up.", "Do you have a minute?"});
    REQUIRE(h.session->current_node_id() == "greet");
    REQUIRE(h.session->agent_speaking());
    REQUIRE(h.store->get_flag("call-1", flags::kSessionReady));
    const auto descriptor = h.store->get("call-1");
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->at("current_node_id") == "greet");
    REQUIRE(descriptor->at("variables").at("name") == "Sam");
}

TEST_CASE("a clear yes moves to the next node without the model") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    h.drain();

    h.say("Yes, go ahead");
    REQUIRE(h.session->current_node_id() == "pitch");
    REQUIRE(h.played_text("We build websites for local businesses."));
    REQUIRE(h.llm->calls() == 0);

    const auto history = h.session->history();
    REQUIRE(history.size() == 3);
    REQUIRE(history[1].role == "user");
    REQUIRE(history[1].content == "Yes, go ahead");
    REQUIRE(history[2].role == "assistant");
}

TEST_CASE("an ending node hangs up once its playback has ended") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    h.drain();

    h.say("No thanks");
    REQUIRE(h.session->current_node_id() == "bye");
    REQUIRE(h.played_text("No problem."));
    REQUIRE(h.session->should_end_call());
    REQUIRE(h.provider->count("hangup") == 0);
    REQUIRE_FALSE(h.orchestrator->finished());

    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
    REQUIRE(h.orchestrator->finished());

    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
}

TEST_CASE("backchannels during playback are ignored and real speech barges in") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    const auto before = h.played().size();

    h.say("yeah");
    REQUIRE(h.session->current_node_id() == "greet");
    REQUIRE(h.played().size() == before);
    REQUIRE(h.session->agent_speaking());

    h.orchestrator->on_transcript("wait who is this", false, Clock::now());
    REQUIRE(h.provider->count("playback_stop") == 1);
    REQUIRE_FALSE(h.session->agent_speaking());
    REQUIRE(h.store->counter("call-1", counters::kActivePlaybackCount) == 0);
}

TEST_CASE("the node's goal is pursued when the answer fits no transition") {
    Harness h(sales_agent(), {"-1", "It's free to start. Want to book a quick call?"});
    h.orchestrator->start(true);
    h.drain();
    h.say("Yes");
    h.drain();

    h.say("what does it cost");
    REQUIRE(h.session->current_node_id() == "pitch");
    REQUIRE(h.played_text("It's free to start."));
    REQUIRE(h.played_text("Want to book a quick call?"));

    const auto requests = h.llm->requests();
    REQUIRE(requests.size() == 2);
    const auto& system = requests[1].messages.front();
    REQUIRE(system.role == "system");
    REQUIRE(system.content.find("You are Jake") != std::string::npos);
    REQUIRE(system.content.find("Goal of this step: Get the caller to book a call") !=
            std::string::npos);
    REQUIRE(requests[1].messages.back().content == "what does it cost");
}

TEST_CASE("an empty generation falls back to a canned reply") {
    Harness h(sales_agent(), {"-1", ""});
    h.orchestrator->start(true);
    h.drain();
    h.say("Yes");
    h.drain();
    h.say("hmm how does that work");
    REQUIRE(h.played_text("Sorry, could you say that one more time?"));
}

TEST_CASE("a missing mandatory value is asked for before moving on") {
    const auto agent = json::parse(R"({
        "id": "survey",
        "call_flow": [
            {"id": "ask", "type": "conversation", "data": {
                "script": "Are you currently employed?",
                "extract_variables": [{"name": "employed", "description": "employment status",
                                       "mandatory": true,
                                       "prompt_message": "Are you working at the moment?"}],
                "transitions": [{"condition": "caller answered", "nextNode": "done"}]}},
            {"id": "done", "type": "ending", "data": {"script": "Thanks, that's all."}}
        ]
    })");
    Harness h(agent, {"{}", R"({"employed": "yes"})"});
    h.orchestrator->start(true);
    h.drain();

    h.say("hmm let me think about it");
    REQUIRE(h.session->current_node_id() == "ask");
    REQUIRE(h.played_text("Are you working at the moment?"));
    h.drain();

    h.say("I work at a bakery downtown");
    REQUIRE(h.session->variables().at("employed") == "yes");
    REQUIRE(h.session->current_node_id() == "done");
    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
}

TEST_CASE("silence is checked in on and finally ends the call") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    h.drain();
    const auto base = Clock::now();

    h.orchestrator->on_silence_tick(base + std::chrono::seconds(3));
    REQUIRE(h.provider->count("playback_start") == 2);

    h.orchestrator->on_silence_tick(base + std::chrono::seconds(8));
    REQUIRE(h.played_text("Are you still there?"));
    REQUIRE(h.session->snapshot().checkin_count == 1);
    REQUIRE_FALSE(h.store->get_flag("call-1", flags::kCheckinInProgress));
    h.drain();

    h.orchestrator->on_silence_tick(base + std::chrono::seconds(16));
    REQUIRE(h.session->snapshot().checkin_count == 2);
    h.drain();

    h.orchestrator->on_silence_tick(base + std::chrono::seconds(24));
    REQUIRE(h.orchestrator->silence_state() == SilenceState::Terminated);
    REQUIRE(h.played_text("Thanks for your time."));
    REQUIRE(h.provider->count("hangup") == 0);
    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
}

TEST_CASE("an acknowledgement keeps the check-in count") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    h.drain();
    const auto base = Clock::now();

    h.orchestrator->on_silence_tick(base + std::chrono::seconds(8));
    REQUIRE(h.session->snapshot().checkin_count == 1);
    h.drain();
    h.say("yeah");
    REQUIRE(h.session->snapshot().checkin_count == 1);

    h.drain();
    h.say("Actually, tell me more about the pricing");
    REQUIRE(h.session->snapshot().checkin_count == 0);
}

TEST_CASE("automatic nodes chain through digits, webhook and logic split") {
    httplib::Server server;
    json received;
    server.Post("/book", [&received](const httplib::Request& request, httplib::Response& response) {
        received = json::parse(request.body);
        response.set_content(R"({"slot": "Tuesday at 3"})", "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    std::thread listener([&server]() { server.listen_after_bind(); });

    auto agent = json::parse(R"({
        "id": "booking",
        "call_flow": [
            {"id": "start", "type": "start", "data": {"transitions": [{"condition": "", "nextNode": "menu"}]}},
            {"id": "menu", "type": "press_digit", "data": {"digits": "1#",
                "transitions": [{"condition": "", "nextNode": "hook"}]}},
            {"id": "hook", "type": "function", "data": {"webhook_url": "", "webhook_method": "POST",
                "transitions": [{"condition": "", "nextNode": "split"}]}},
            {"id": "split", "type": "logic_split", "data": {
                "conditions": [{"variable": "slot", "operator": "exists", "nextNode": "done"}],
                "default_next_node": "sorry"}},
            {"id": "done", "type": "ending", "data": {"script": "Booked for {{slot}}."}},
            {"id": "sorry", "type": "ending", "data": {"script": "Sorry, nothing is free."}}
        ]
    })");
    agent["call_flow"][2]["data"]["webhook_url"] =
        "http://127.0.0.1:" + std::to_string(port) + "/book";

    {
        Harness h(agent);
        h.orchestrator->start(true);

        REQUIRE(h.provider->actions_named("send_dtmf").at(0).detail == "1#");
        REQUIRE(received.at("call_id") == "call-1");
        REQUIRE(received.at("user_message") == "");
        REQUIRE(received.at("conversation_history").is_array());
        REQUIRE(received.at("variables").is_object());
        REQUIRE(h.session->variables().at("webhook_response").at("slot") == "Tuesday at 3");
        REQUIRE(h.session->current_node_id() == "done");
        REQUIRE(h.played() == std::vector<std::string>{"Booked for Tuesday at 3."});
        h.drain();
        REQUIRE(h.provider->count("hangup") == 1);
    }

    server.stop();
    listener.join();
}

TEST_CASE("a transfer node transfers instead of hanging up") {
    const auto agent = json::parse(R"({
        "id": "support",
        "call_flow": [
            {"id": "greet", "type": "conversation", "data": {"script": "Hello.",
                "transitions": [{"condition": "", "nextNode": "xfer"}]}},
            {"id": "xfer", "type": "call_transfer", "data": {"destination": "+15550100"}}
        ]
    })");
    Harness h(agent);
    h.orchestrator->start(true);
    h.drain();
    h.say("I need to talk to a person");
    REQUIRE(h.played_text("Please hold while I transfer your call."));
    h.drain();
    REQUIRE(h.provider->actions_named("transfer").at(0).detail == "+15550100");
    REQUIRE(h.provider->count("hangup") == 0);
}

TEST_CASE("end_call speaks the closing line and hangs up") {
    Harness h(sales_agent());
    h.orchestrator->start(true);
    h.orchestrator->end_call("operator");
    REQUIRE(h.provider->count("playback_stop") == 1);
    REQUIRE(h.played_text("Thanks for your time."));
    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
    h.say("wait, one more thing");
    REQUIRE(h.session->current_node_id() == "greet");
}

TEST_CASE("a content marker left from an earlier node never silences the next one") {
    Harness h(sales_agent(), {"-1", "Sure, the first month is free."});
    h.orchestrator->start(true);
    h.drain();

    h.session->mark_content_dispatched("pitch");
    h.say("Yes");
    REQUIRE(h.session->current_node_id() == "pitch");
    REQUIRE_FALSE(h.session->snapshot().content_dispatched_node_id.has_value());
    h.drain();

    h.say("what does it cost");
    REQUIRE(h.session->current_node_id() == "pitch");
    REQUIRE(h.played_text("Sure, the first month is free."));
}

TEST_CASE("end_call during a turn waits for it and speaks nothing from it") {
    Harness h(sales_agent(), {"-1", "It's free to start. Want to book a quick call?"});
    h.orchestrator->start(true);
    h.drain();
    h.say("Yes");
    h.drain();
    const auto before = h.played().size();

    h.llm->set_delay(std::chrono::milliseconds(300));
    std::thread turn([&h]() { h.say("what does it cost"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    h.orchestrator->end_call("operator");
    turn.join();

    const auto texts = h.played();
    REQUIRE(texts.size() == before + 2);
    REQUIRE(texts[before] == "Thanks for your time.");
    REQUIRE(texts[before + 1] == "Goodbye.");
    REQUIRE_FALSE(h.played_text("It's free to start."));
    h.drain();
    REQUIRE(h.provider->count("hangup") == 1);
}

#include "call_engine/app.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "call_engine/audio/stream_coordinator.hpp"
#include "call_engine/backend/client.hpp"
#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/async.hpp"
#include "call_engine/utils/text.hpp"

namespace call_engine {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

std::string event_flag(const std::string& event_id) {
    return "event:" + event_id;
}

}

std::atomic<bool> EngineApp::stop_requested_{false};

EngineApp::EngineApp(Config config)
    : EngineApp(config, make_services(config)) {}

EngineApp::EngineApp(Config config, EngineServices services)
    : config_(std::move(config)),
      services_(std::move(services)),
      orchestrator_options_(orchestrator_options(config_)) {}

EngineApp::~EngineApp() {
    stop();
}

const Config& EngineApp::config() const {
    return config_;
}

EngineServices EngineApp::make_services(const Config& config) {
    EngineServices services;
    services.llm = std::make_shared<HttpLlmClient>(
        LlmClientOptions{config.llm_url, config.llm_api_key, config.llm_model});

    if (config.store_url.empty()) {
        warn("STORE_URL not set, using in-process session store");
        services.store = std::make_shared<session::MemorySessionStore>();
    } else {
        session::WebdisStoreOptions store_options;
        store_options.url = config.store_url;
        store_options.counter_ttl = std::chrono::seconds(config.store_ttl_sec);
        services.store = std::make_shared<session::WebdisSessionStore>(store_options);
    }

    telephony::HttpTelephonyOptions telephony_options;
    telephony_options.api_url = config.telephony_api_url;
    telephony_options.api_key = config.telephony_api_key;
    telephony_options.max_retries = config.provider_max_retries;
    telephony_options.timeout = std::chrono::milliseconds(config.provider_timeout_ms);
    services.provider = std::make_shared<telephony::HttpTelephonyProvider>(telephony_options);

    auto backend = std::make_shared<BackendClient>(
        config.backend_url, config.authorization_token,
        BackendRequestOptions{seconds_to_ms(config.backend_request_timeout),
                              seconds_to_ms(config.backend_connect_timeout),
                              seconds_to_ms(config.backend_sock_read_timeout)});
    services.agents = std::make_shared<flow::AgentRepository>(backend, services.llm,
                                                              evaluator_options(config));

    services.synthesizer_factory = [url = config.tts_ws_url,
                                    voice = config.tts_voice](const std::string& call_id) {
        tts::SynthesisOptions options;
        options.url = url;
        options.voice = voice;
        options.call_id = call_id;
        return std::make_shared<tts::WsSynthesisClient>(options);
    };
    return services;
}

flow::TransitionEvaluatorOptions EngineApp::evaluator_options(const Config& config) {
    flow::TransitionEvaluatorOptions options;
    options.model_timeout = std::chrono::milliseconds(config.transition_timeout_ms);
    options.affirmative_prefixes = config.affirmative_prefixes;
    options.negative_prefixes = config.negative_prefixes;
    options.history_turns = static_cast<size_t>(std::max(1, config.history_window / 2));
    return options;
}

session::OrchestratorOptions EngineApp::orchestrator_options(const Config& config) {
    session::OrchestratorOptions options;

    auto& interruption = options.interruption;
    interruption.min_words = config.interrupt_min_words;
    interruption.grace_period = std::chrono::milliseconds(config.interrupt_grace_ms);
    interruption.start_buffer = std::chrono::milliseconds(config.playback_start_buffer_ms);
    interruption.echo_overlap_threshold = config.echo_overlap_threshold;
    interruption.echo_tail = std::chrono::milliseconds(config.echo_tail_ms);
    interruption.acknowledgement_words = config.acknowledgement_words;
    interruption.hold_on_phrases = config.hold_on_phrases;
    interruption.rambling_guard_enabled = config.rambling_guard_enabled;
    interruption.rambling_word_threshold = config.rambling_word_threshold;
    interruption.rambling_phrases = config.rambling_phrases;

    auto& silence = options.silence;
    silence.silence_timeout = seconds_to_ms(config.silence_timeout_sec);
    silence.hold_on_timeout = seconds_to_ms(config.hold_on_silence_timeout_sec);
    silence.max_checkins = config.max_checkins;
    silence.checkin_min_gap = seconds_to_ms(config.checkin_min_gap_sec);
    silence.max_call_duration = seconds_to_ms(config.max_call_duration_sec);
    silence.tick_interval = std::chrono::milliseconds(config.silence_tick_ms);
    silence.stale_grace = std::chrono::milliseconds(config.playback_stale_grace_ms);
    silence.flag_ttl = std::chrono::seconds(config.flag_ttl_sec);

    auto& stream = options.stream;
    stream.max_fragment_chars = static_cast<size_t>(config.max_fragment_chars);
    stream.max_inflight = config.tts_max_inflight;
    stream.synthesis_timeout = std::chrono::milliseconds(config.tts_timeout_ms);
    stream.words_per_second = config.words_per_second;
    stream.flag_ttl = std::chrono::seconds(config.flag_ttl_sec);

    options.extraction_timeout = std::chrono::milliseconds(config.extraction_timeout_ms);
    options.generation_timeout = std::chrono::milliseconds(config.generation_timeout_ms);
    options.max_node_hops = config.max_node_hops;
    options.checkin_message = config.checkin_message;
    options.closing_line = config.closing_line;
    options.fallback_reply = config.fallback_reply;
    options.store_ttl = std::chrono::seconds(config.store_ttl_sec);
    return options;
}

void EngineApp::init() {
    rest_server_ = std::make_unique<RestServer>(
        config_,
        [this](const nlohmann::json& body) { return handle_webhook(body); },
        [this](const std::string& call_id, const nlohmann::json& body) {
            return handle_transcript(call_id, body);
        });
    rest_server_->start();
}

void EngineApp::run() {
    while (!quitting_ && !stop_requested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void EngineApp::request_stop() {
    stop_requested_ = true;
}

void EngineApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    std::unordered_map<std::string, std::shared_ptr<session::SessionOrchestrator>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& item : sessions) {
        item.second->stop();
    }
    info("Engine stopped", {kv("sessions", sessions.size())});
}

std::shared_ptr<session::SessionOrchestrator> EngineApp::find_session(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(call_id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t EngineApp::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

RestResponse EngineApp::handle_webhook(const nlohmann::json& body) {
    const auto event = telephony::parse_event(body, session::Clock::now());
    if (!event) {
        Metrics::instance().increment("webhooks", "invalid");
        return {400, {{"message", "invalid event"}}};
    }

    bool first_delivery = true;
    try {
        first_delivery = services_.store->set_flag_if_absent(
            event->call_id, event_flag(event->event_id),
            std::chrono::seconds(config_.store_ttl_sec));
    } catch (const session::StoreError& ex) {
        warn("Webhook dedup unavailable", {kv("call_id", event->call_id),
                                           kv("error", ex.what())});
    }
    if (!first_delivery) {
        Metrics::instance().increment("webhooks", "duplicate");
        debug("Duplicate webhook", {kv("call_id", event->call_id),
                                    kv("event_id", event->event_id),
                                    kv("type", event->type_name)});
        return {200, {{"message", "duplicate"}}};
    }
    Metrics::instance().increment("webhooks", event->type_name.empty() ? "unknown" : event->type_name);

    switch (event->type) {
        case telephony::EventType::CallAnswered:
            on_call_answered(*event);
            break;
        case telephony::EventType::PlaybackStarted:
        case telephony::EventType::PlaybackEnded:
            on_playback(*event);
            break;
        case telephony::EventType::CallHangup:
            on_hangup(*event);
            break;
        case telephony::EventType::Other:
            debug("Webhook ignored", {kv("call_id", event->call_id), kv("type", event->type_name)});
            break;
    }
    return {200, {{"message", "ok"}}};
}

RestResponse EngineApp::handle_transcript(const std::string& call_id, const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("text") || !body.at("text").is_string()) {
        return {400, {{"message", "text is required"}}};
    }
    const auto text = body.at("text").get<std::string>();
    if (utils::normalize_utterance(text).empty()) {
        Metrics::instance().increment("transcripts", "empty");
        return {200, {{"message", "ignored"}}};
    }
    const bool is_final = body.value("is_final", true);
    auto at = session::Clock::now();
    if (body.contains("timestamp_ms") && body.at("timestamp_ms").is_number()) {
        at = session::from_epoch_ms(body.at("timestamp_ms").get<int64_t>());
    }

    auto orchestrator = find_session(call_id);
    if (!orchestrator && call_ended(call_id)) {
        debug("Transcript after hangup", {kv("call_id", call_id)});
        return {200, {{"message", "ignored"}}};
    }
    if (!orchestrator) {
        orchestrator = restore_session(call_id);
    }
    if (!orchestrator) {
        return {404, {{"message", "unknown call"}}};
    }
    Metrics::instance().increment("transcripts", is_final ? "final" : "partial");
    orchestrator->on_transcript(text, is_final, at);
    return {200, {{"message", "ok"}}};
}

void EngineApp::on_call_answered(const telephony::TelephonyEvent& event) {
    if (find_session(event.call_id)) {
        return;
    }
    const auto agent_id = resolve_agent_id(event);
    if (agent_id.empty()) {
        error("No agent for call", {kv("call_id", event.call_id)});
        abandon_call(event.call_id, "no_agent");
        return;
    }

    std::shared_ptr<const flow::AgentRuntime> agent;
    try {
        agent = services_.agents->get(agent_id);
    } catch (const std::exception& ex) {
        error("Agent load failed", {kv("call_id", event.call_id),
                                    kv("agent_id", agent_id),
                                    kv("error", ex.what())});
        abandon_call(event.call_id, "agent_unavailable");
        return;
    }

    auto session = std::make_shared<session::CallSession>(
        event.call_id, agent_id, agent->graph.entry_node().id, event.occurred_at,
        static_cast<size_t>(config_.history_window));
    bool inserted = false;
    auto orchestrator =
        register_session(event.call_id, create_orchestrator(session, agent), inserted);
    if (!inserted) {
        return;
    }
    info("Call answered", {kv("call_id", event.call_id), kv("agent_id", agent_id)});
    utils::run_async([orchestrator]() {
        try {
            orchestrator->start(true);
        } catch (const std::exception& ex) {
            error("Session start failed", {kv("call_id", orchestrator->session()->call_id()),
                                           kv("error", ex.what())});
            orchestrator->end_call("start_error");
        }
    });
}

void EngineApp::on_playback(const telephony::TelephonyEvent& event) {
    if (!event.unit_id) {
        debug("Playback event without unit", {kv("call_id", event.call_id)});
        return;
    }
    const bool ended = event.type == telephony::EventType::PlaybackEnded;
    if (auto orchestrator = find_session(event.call_id)) {
        orchestrator->on_playback_event(*event.unit_id, ended, event.occurred_at);
        return;
    }
    if (!ended) {
        return;
    }
    // The owning worker learns about it through agentDoneSpeaking.
    try {
        const auto remaining = audio::record_playback_ended(
            *services_.store, event.call_id, *event.unit_id,
            std::chrono::seconds(config_.flag_ttl_sec));
        debug("Remote playback end recorded", {kv("call_id", event.call_id),
                                               kv("unit_id", *event.unit_id),
                                               kv("duplicate", !remaining)});
    } catch (const session::StoreError& ex) {
        warn("Remote playback end failed", {kv("call_id", event.call_id),
                                            kv("error", ex.what())});
    }
}

void EngineApp::on_hangup(const telephony::TelephonyEvent& event) {
    std::shared_ptr<session::SessionOrchestrator> orchestrator;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        const auto it = sessions_.find(event.call_id);
        if (it != sessions_.end()) {
            orchestrator = it->second;
            sessions_.erase(it);
        }
    }
    if (orchestrator) {
        orchestrator->stop();
    }
    try {
        services_.store->expire(event.call_id);
        services_.store->set_flag(event.call_id, session::flags::kCallEnded,
                                  std::chrono::seconds(config_.store_ttl_sec));
    } catch (const session::StoreError& ex) {
        warn("Session expire failed", {kv("call_id", event.call_id), kv("error", ex.what())});
    }
    info("Call hung up", {kv("call_id", event.call_id), kv("local", orchestrator != nullptr)});
}

bool EngineApp::call_ended(const std::string& call_id) {
    try {
        return services_.store->get_flag(call_id, session::flags::kCallEnded);
    } catch (const session::StoreError& ex) {
        warn("Ended flag lookup failed", {kv("call_id", call_id), kv("error", ex.what())});
        return false;
    }
}

std::shared_ptr<session::SessionOrchestrator> EngineApp::restore_session(const std::string& call_id) {
    std::optional<nlohmann::json> descriptor;
    try {
        if (!services_.store->wait_for_flag(call_id, session::flags::kSessionReady,
                                            std::chrono::milliseconds(config_.session_ready_wait_ms))) {
            warn("Session not ready", {kv("call_id", call_id)});
            abandon_call(call_id, "session_not_ready");
            return nullptr;
        }
        descriptor = services_.store->get(call_id);
    } catch (const session::StoreError& ex) {
        error("Session lookup failed", {kv("call_id", call_id), kv("error", ex.what())});
        abandon_call(call_id, "store_unavailable");
        return nullptr;
    }

    const auto has_string = [&](const char* key) {
        return descriptor && descriptor->contains(key) && descriptor->at(key).is_string() &&
               !descriptor->at(key).get<std::string>().empty();
    };
    if (!has_string("agent_id") || !has_string("current_node_id") ||
        !descriptor->contains("call_started_at_ms") ||
        !descriptor->at("call_started_at_ms").is_number()) {
        warn("Session descriptor incomplete", {kv("call_id", call_id)});
        abandon_call(call_id, "descriptor_incomplete");
        return nullptr;
    }

    const auto agent_id = descriptor->at("agent_id").get<std::string>();
    const auto node_id = descriptor->at("current_node_id").get<std::string>();
    std::shared_ptr<const flow::AgentRuntime> agent;
    try {
        agent = services_.agents->get(agent_id);
    } catch (const std::exception& ex) {
        error("Agent load failed", {kv("call_id", call_id),
                                    kv("agent_id", agent_id),
                                    kv("error", ex.what())});
        abandon_call(call_id, "agent_unavailable");
        return nullptr;
    }
    if (!agent->graph.find(node_id)) {
        warn("Stored node missing from graph", {kv("call_id", call_id), kv("node", node_id)});
        abandon_call(call_id, "descriptor_incomplete");
        return nullptr;
    }

    auto session = std::make_shared<session::CallSession>(
        call_id, agent_id, node_id,
        session::from_epoch_ms(descriptor->at("call_started_at_ms").get<int64_t>()),
        static_cast<size_t>(config_.history_window));
    if (descriptor->contains("variables")) {
        session->merge_variables(descriptor->at("variables"));
    }
    session->restore_checkin_state(descriptor->value("checkin_count", 0),
                                   descriptor->value("last_utterance_was_checkin", false));

    bool inserted = false;
    auto orchestrator = register_session(call_id, create_orchestrator(session, agent), inserted);
    if (inserted) {
        info("Session rebuilt from store", {kv("call_id", call_id), kv("node", node_id)});
        orchestrator->start(false);
    }
    return orchestrator;
}

std::shared_ptr<session::SessionOrchestrator> EngineApp::create_orchestrator(
    std::shared_ptr<session::CallSession> session,
    std::shared_ptr<const flow::AgentRuntime> agent) {
    session::OrchestratorDeps deps;
    deps.agent = std::move(agent);
    deps.llm = services_.llm;
    deps.store = services_.store;
    deps.provider = services_.provider;
    deps.synthesizer = services_.synthesizer_factory(session->call_id());
    return std::make_shared<session::SessionOrchestrator>(std::move(session), std::move(deps),
                                                          orchestrator_options_);
}

std::shared_ptr<session::SessionOrchestrator> EngineApp::register_session(
    const std::string& call_id,
    std::shared_ptr<session::SessionOrchestrator> orchestrator,
    bool& inserted) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto result = sessions_.emplace(call_id, std::move(orchestrator));
    inserted = result.second;
    return result.first->second;
}

void EngineApp::abandon_call(const std::string& call_id, const std::string& reason) {
    Metrics::instance().increment("call_endings", reason);
    try {
        services_.provider->speak(call_id, config_.closing_line);
    } catch (const telephony::TelephonyError& ex) {
        warn("Closing line failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
    try {
        services_.provider->hangup(call_id);
    } catch (const telephony::TelephonyError& ex) {
        error("Hangup failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
}

std::string EngineApp::resolve_agent_id(const telephony::TelephonyEvent& event) const {
    if (event.payload.contains("agent_id") && event.payload.at("agent_id").is_string()) {
        return event.payload.at("agent_id").get<std::string>();
    }
    // Outbound calls carry {"agent_id": ...} in client_state.
    if (event.unit_id) {
        const auto state = nlohmann::json::parse(*event.unit_id, nullptr, false);
        if (state.is_object() && state.contains("agent_id") && state.at("agent_id").is_string()) {
            return state.at("agent_id").get<std::string>();
        }
    }
    return config_.default_agent_id.value_or("");
}

}

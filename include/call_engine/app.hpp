#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "call_engine/config.hpp"
#include "call_engine/flow/agent_repository.hpp"
#include "call_engine/llm/client.hpp"
#include "call_engine/server/rest_server.hpp"
#include "call_engine/session/orchestrator.hpp"
#include "call_engine/session/shared_store.hpp"
#include "call_engine/telephony/events.hpp"
#include "call_engine/telephony/provider.hpp"
#include "call_engine/tts/synth_client.hpp"

namespace call_engine {

using SynthesizerFactory =
    std::function<std::shared_ptr<tts::SpeechSynthesizer>(const std::string& call_id)>;

struct EngineServices {
    std::shared_ptr<LlmClient> llm;
    std::shared_ptr<session::SharedSessionStore> store;
    std::shared_ptr<telephony::TelephonyProvider> provider;
    std::shared_ptr<flow::AgentRepository> agents;
    SynthesizerFactory synthesizer_factory;
};

// Stateless-worker front: routes webhooks and transcripts to the call's
// orchestrator, rebuilding it from the shared store when this worker has
// never seen the call.
class EngineApp {
public:
    explicit EngineApp(Config config);
    EngineApp(Config config, EngineServices services);
    ~EngineApp();

    void init();
    // Blocks until stop() or request_stop().
    void run();
    void stop();
    // Async-signal-safe.
    static void request_stop();
    const Config& config() const;

    RestResponse handle_webhook(const nlohmann::json& body);
    RestResponse handle_transcript(const std::string& call_id, const nlohmann::json& body);

    std::shared_ptr<session::SessionOrchestrator> find_session(const std::string& call_id) const;
    size_t active_sessions() const;

    static EngineServices make_services(const Config& config);
    static session::OrchestratorOptions orchestrator_options(const Config& config);
    static flow::TransitionEvaluatorOptions evaluator_options(const Config& config);

private:
    void on_call_answered(const telephony::TelephonyEvent& event);
    void on_playback(const telephony::TelephonyEvent& event);
    void on_hangup(const telephony::TelephonyEvent& event);

    // Hung up already; late events must not speak or hang up again.
    bool call_ended(const std::string& call_id);
    std::shared_ptr<session::SessionOrchestrator> restore_session(const std::string& call_id);
    std::shared_ptr<session::SessionOrchestrator> create_orchestrator(
        std::shared_ptr<session::CallSession> session,
        std::shared_ptr<const flow::AgentRuntime> agent);
    // Registers unless another thread won; returns the registered one.
    std::shared_ptr<session::SessionOrchestrator> register_session(
        const std::string& call_id,
        std::shared_ptr<session::SessionOrchestrator> orchestrator,
        bool& inserted);
    // No usable session: closing line through the provider, then hang up.
    void abandon_call(const std::string& call_id, const std::string& reason);
    std::string resolve_agent_id(const telephony::TelephonyEvent& event) const;

    Config config_;
    EngineServices services_;
    session::OrchestratorOptions orchestrator_options_;
    std::unordered_map<std::string, std::shared_ptr<session::SessionOrchestrator>> sessions_;
    mutable std::mutex sessions_mutex_;
    std::atomic<bool> quitting_{false};
    static std::atomic<bool> stop_requested_;
    std::unique_ptr<RestServer> rest_server_;
};

}

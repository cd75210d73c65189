#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_engine/audio/stream_coordinator.hpp"
#include "call_engine/flow/agent_repository.hpp"
#include "call_engine/flow/variable_extractor.hpp"
#include "call_engine/llm/client.hpp"
#include "call_engine/session/call_session.hpp"
#include "call_engine/session/interruption.hpp"
#include "call_engine/session/shared_store.hpp"
#include "call_engine/session/silence_monitor.hpp"
#include "call_engine/telephony/provider.hpp"
#include "call_engine/tts/synth_client.hpp"

namespace call_engine::session {

struct OrchestratorOptions {
    InterruptionOptions interruption;
    SilenceOptions silence;
    audio::StreamOptions stream;
    std::chrono::milliseconds extraction_timeout{2000};
    std::chrono::milliseconds generation_timeout{6000};
    int max_node_hops = 8;
    std::string checkin_message = "Are you still there?";
    std::string closing_line = "Thanks for your time. Goodbye.";
    std::string fallback_reply = "Sorry, could you say that one more time?";
    std::chrono::seconds store_ttl{3600};
    // Run the silence monitor on its own thread; tests drive ticks by hand.
    bool run_silence_thread = true;
};

struct OrchestratorDeps {
    std::shared_ptr<const flow::AgentRuntime> agent;
    std::shared_ptr<LlmClient> llm;
    std::shared_ptr<SharedSessionStore> store;
    std::shared_ptr<tts::SpeechSynthesizer> synthesizer;
    std::shared_ptr<telephony::TelephonyProvider> provider;
};

// Single consumer of transcript, playback and silence events for one call.
// Turns are serialized; barge-in and playback accounting never wait on them.
class SessionOrchestrator : public std::enable_shared_from_this<SessionOrchestrator> {
public:
    SessionOrchestrator(std::shared_ptr<CallSession> session,
                        OrchestratorDeps deps,
                        OrchestratorOptions options);
    ~SessionOrchestrator();

    // Warms the synthesis connection, publishes the session and, for a fresh
    // call, runs the entry node.
    void start(bool greet);
    void stop();

    void on_transcript(const std::string& utterance, bool is_final, TimePoint at);
    void on_playback_event(const std::string& unit_id, bool ended, TimePoint at);
    void on_silence_tick(TimePoint now);

    // Cancels everything, speaks the closing line and hangs up once drained.
    // Waits for a turn in progress before speaking.
    void end_call(const std::string& reason);

    bool finished() const { return finished_; }
    const std::shared_ptr<CallSession>& session() const { return session_; }
    SilenceState silence_state() const { return monitor_.state(); }

private:
    // turn_mutex_ held.
    void end_call_locked(const std::string& reason);
    void close_call(const std::string& reason);
    void run_turn(const std::string& utterance, TimePoint at);
    // false when the turn must stay on the node to collect a mandatory value.
    bool extract_variables(const flow::FlowNode& node, const std::string& utterance);
    void advance(const std::string& target_node_id, const std::string& utterance);
    void respond_in_place(const flow::FlowNode& node, const std::string& utterance);

    // Visits one node; returns the next node for automatic nodes.
    std::optional<std::string> enter_node(const flow::FlowNode& node, const std::string& utterance);
    std::optional<std::string> next_automatic(const flow::FlowNode& node,
                                              const std::string& utterance);
    void call_function(const flow::FlowNode& node,
                       const flow::FunctionCallNode& function,
                       const std::string& utterance);

    void speak_node(const flow::FlowNode& node, const std::string& utterance);
    void speak_text(const std::string& text);
    void speak_generated(const std::string& instruction, const std::string& utterance);
    void complete_turn(const std::vector<audio::PlaybackUnit>& units, const std::string& text);

    void maybe_finish(TimePoint now);
    void publish_descriptor();

    std::shared_ptr<CallSession> session_;
    OrchestratorDeps deps_;
    OrchestratorOptions options_;
    InterruptionController interruption_;
    flow::VariableExtractor extractor_;
    std::shared_ptr<audio::AudioStreamCoordinator> coordinator_;
    SilenceMonitor monitor_;

    std::mutex turn_mutex_;
    std::mutex transfer_mutex_;
    std::optional<std::string> pending_transfer_;
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> closing_{false};
};

}

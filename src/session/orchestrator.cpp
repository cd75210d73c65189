#include "call_engine/session/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <variant>

#include "call_engine/backend/client.hpp"
#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/async.hpp"
#include "call_engine/utils/http.hpp"
#include "call_engine/utils/text.hpp"

namespace call_engine::session {

namespace {

template <typename>
inline constexpr bool always_false_v = false;

constexpr size_t kFunctionHistoryTurns = 10;

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

nlohmann::json history_json(const std::vector<ChatMessage>& history, size_t limit) {
    auto array = nlohmann::json::array();
    const size_t begin = history.size() > limit ? history.size() - limit : 0;
    for (size_t i = begin; i < history.size(); ++i) {
        array.push_back({{"role", history[i].role}, {"content", history[i].content}});
    }
    return array;
}

}

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<CallSession> session,
                                         OrchestratorDeps deps,
                                         OrchestratorOptions options)
    : session_(std::move(session)),
      deps_(std::move(deps)),
      options_(std::move(options)),
      interruption_(options_.interruption),
      extractor_(deps_.llm, options_.extraction_timeout),
      coordinator_(std::make_shared<audio::AudioStreamCoordinator>(
          session_, deps_.store, deps_.synthesizer, deps_.provider, options_.stream)),
      monitor_(session_, deps_.store, options_.silence) {}

SessionOrchestrator::~SessionOrchestrator() {
    monitor_.stop();
}

void SessionOrchestrator::start(bool greet) {
    if (started_.exchange(true)) {
        return;
    }
    const auto& call_id = session_->call_id();
    try {
        coordinator_->open();
    } catch (const std::exception& ex) {
        warn("Synthesis warm-up failed", {kv("call_id", call_id), kv("error", ex.what())});
    }

    publish_descriptor();
    try {
        deps_.store->set_flag(call_id, flags::kSessionReady, options_.store_ttl);
    } catch (const StoreError& ex) {
        warn("Session ready flag failed", {kv("call_id", call_id), kv("error", ex.what())});
    }

    if (options_.run_silence_thread) {
        std::weak_ptr<SessionOrchestrator> weak = shared_from_this();
        monitor_.start([weak](TimePoint now) {
            if (auto self = weak.lock()) {
                self->on_silence_tick(now);
            }
        });
    }

    info("Session started", {kv("call_id", call_id),
                             kv("agent_id", session_->agent_id()),
                             kv("node", session_->current_node_id()),
                             kv("greet", greet)});
    if (!greet) {
        session_->start_silence(Clock::now());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(turn_mutex_);
        session_->set_generating(true, Clock::now());
        try {
            advance(deps_.agent->graph.entry_node().id, "");
        } catch (const std::exception& ex) {
            error("Greeting failed", {kv("call_id", call_id), kv("error", ex.what())});
            session_->set_generating(false, Clock::now());
            end_call_locked("greeting_error");
            return;
        }
        session_->set_generating(false, Clock::now());
    }
    publish_descriptor();
    maybe_finish(Clock::now());
}

void SessionOrchestrator::stop() {
    monitor_.stop();
    coordinator_->close();
    finished_ = true;
    info("Session stopped", {kv("call_id", session_->call_id())});
}

void SessionOrchestrator::on_transcript(const std::string& utterance, bool is_final, TimePoint at) {
    if (finished_) {
        return;
    }
    const auto now = Clock::now();
    const auto& call_id = session_->call_id();
    auto cancel = [this]() { coordinator_->cancel(); };

    if (!is_final) {
        session_->set_user_speaking(true, now);
        const auto cls = interruption_.classify(utterance, session_->snapshot(), now);
        if (cls == UtteranceClass::Genuine && session_->agent_speaking()) {
            const auto action = interruption_.handle(cls, at, *session_, cancel);
            if (action == InterruptAction::Cancelled) {
                info("Barge-in on partial transcript", {kv("call_id", call_id)});
            }
        }
        if (auto phrase = interruption_.rambling_interjection(utterance, *session_)) {
            utils::run_async([self = shared_from_this(), text = *phrase]() {
                // A turn already speaking makes the interjection moot.
                std::unique_lock<std::mutex> lock(self->turn_mutex_, std::try_to_lock);
                if (!lock.owns_lock() || self->finished_ || self->closing_) {
                    return;
                }
                self->coordinator_->stream_content(text);
            });
        }
        return;
    }

    const auto cls = interruption_.classify(utterance, session_->snapshot(), now);
    Metrics::instance().increment("utterances", to_string(cls));
    if (cls != UtteranceClass::Genuine) {
        debug("Utterance ignored", {kv("call_id", call_id),
                                    kv("class", to_string(cls)),
                                    kv("text", utterance)});
        session_->set_user_speaking(false, now);
        return;
    }

    const auto action = interruption_.handle(cls, at, *session_, cancel);
    if (action == InterruptAction::Cancelled) {
        info("Barge-in", {kv("call_id", call_id), kv("text", utterance)});
    } else if (action == InterruptAction::SuppressedByTiming) {
        debug("Barge-in suppressed by timing", {kv("call_id", call_id)});
    }

    std::lock_guard<std::mutex> lock(turn_mutex_);
    if (finished_ || closing_) {
        return;
    }
    run_turn(utterance, at);
}

void SessionOrchestrator::on_playback_event(const std::string& unit_id, bool ended, TimePoint at) {
    try {
        if (ended) {
            coordinator_->on_playback_ended(unit_id, at);
        } else {
            coordinator_->on_playback_started(unit_id, at);
        }
    } catch (const StoreError& ex) {
        warn("Playback accounting failed", {kv("call_id", session_->call_id()),
                                            kv("unit_id", unit_id),
                                            kv("error", ex.what())});
        if (ended) {
            session_->end_playback(unit_id, at);
        }
    }
    if (ended) {
        maybe_finish(Clock::now());
    }
}

void SessionOrchestrator::on_silence_tick(TimePoint now) {
    if (finished_) {
        return;
    }
    maybe_finish(now);
    if (finished_ || closing_) {
        return;
    }

    const auto decision = monitor_.tick(now);
    switch (decision.action) {
        case SilenceDecision::Action::None:
            break;
        case SilenceDecision::Action::Checkin: {
            std::lock_guard<std::mutex> lock(turn_mutex_);
            // A turn that ran while waiting for the lock already answered the silence.
            if (!finished_ && !closing_ && session_->snapshot().last_utterance_was_checkin) {
                session_->set_generating(true, now);
                speak_text(options_.checkin_message);
                session_->set_generating(false, Clock::now());
            } else {
                debug("Check-in dropped", {kv("call_id", session_->call_id())});
            }
            try {
                deps_.store->clear_flag(session_->call_id(), flags::kCheckinInProgress);
            } catch (const StoreError& ex) {
                warn("Check-in flag clear failed", {kv("call_id", session_->call_id()),
                                                    kv("error", ex.what())});
            }
            publish_descriptor();
            break;
        }
        case SilenceDecision::Action::Terminate:
            end_call(decision.reason);
            break;
    }
}

void SessionOrchestrator::end_call(const std::string& reason) {
    if (closing_.exchange(true)) {
        return;
    }
    // Silences the current turn now; the closing line waits for it to return.
    coordinator_->cancel();
    std::lock_guard<std::mutex> lock(turn_mutex_);
    close_call(reason);
}

void SessionOrchestrator::end_call_locked(const std::string& reason) {
    if (closing_.exchange(true)) {
        return;
    }
    close_call(reason);
}

void SessionOrchestrator::close_call(const std::string& reason) {
    const auto& call_id = session_->call_id();
    info("Ending call", {kv("call_id", call_id), kv("reason", reason)});
    Metrics::instance().increment("call_endings", reason);

    coordinator_->cancel();
    session_->set_generating(true, Clock::now());
    const auto units = coordinator_->stream_content(options_.closing_line);
    session_->set_generating(false, Clock::now());
    session_->request_end();
    if (units.empty()) {
        try {
            deps_.provider->speak(call_id, options_.closing_line);
        } catch (const telephony::TelephonyError& ex) {
            warn("Closing line failed", {kv("call_id", call_id), kv("error", ex.what())});
        }
    }
    maybe_finish(Clock::now());
}

void SessionOrchestrator::run_turn(const std::string& utterance, TimePoint at) {
    const auto now = Clock::now();
    const auto& call_id = session_->call_id();
    const bool acknowledgement = interruption_.is_acknowledgement(utterance);
    const bool hold_on = interruption_.is_hold_on(utterance);
    const bool after_checkin = session_->snapshot().last_utterance_was_checkin;

    session_->register_user_reply(acknowledgement, hold_on, now);
    if (after_checkin) {
        info(acknowledgement ? "Check-in acknowledged" : "Check-in answered",
             {kv("call_id", call_id), kv("checkins", session_->snapshot().checkin_count)});
    }
    session_->append_history("user", utterance);
    session_->set_generating(true, now);

    try {
        const auto node_id = session_->current_node_id();
        const auto* node = deps_.agent->graph.find(node_id);
        if (!node) {
            throw flow::FlowError("Unknown current node " + node_id);
        }
        if (const auto* collect = node->as<flow::CollectInputNode>()) {
            session_->set_variable(collect->variable, utterance);
        }

        if (extract_variables(*node, utterance)) {
            const auto decision = deps_.agent->evaluator->evaluate(
                *node, utterance, session_->variables(), session_->history());
            info("Transition decided", {kv("call_id", call_id),
                                        kv("node", node->id),
                                        kv("target", decision.target_node_id.value_or("-")),
                                        kv("source", flow::to_string(decision.source))});
            if (closing_) {
                debug("Turn dropped for closing call", {kv("call_id", call_id)});
            } else if (decision.stay()) {
                respond_in_place(*node, utterance);
            } else {
                advance(*decision.target_node_id, utterance);
            }
        }
    } catch (const std::exception& ex) {
        error("Turn failed", {kv("call_id", call_id), kv("error", ex.what())});
        session_->clear_content_dispatched();
        session_->set_generating(false, Clock::now());
        end_call_locked("turn_error");
        return;
    }

    // The marker only covers the turn whose barge-in was suppressed.
    session_->clear_content_dispatched();
    session_->set_generating(false, Clock::now());
    publish_descriptor();
    const auto elapsed = std::chrono::duration<double>(Clock::now() - at);
    Metrics::instance().observe_latency("turn", std::max(0.0, elapsed.count()));
    maybe_finish(Clock::now());
}

bool SessionOrchestrator::extract_variables(const flow::FlowNode& node,
                                            const std::string& utterance) {
    if (node.extract_variables.empty()) {
        return true;
    }
    const auto known = session_->variables();
    const auto pending = flow::VariableExtractor::pending(node.extract_variables, known);
    if (pending.empty()) {
        return true;
    }

    const bool blocking = std::any_of(pending.begin(), pending.end(),
                                      [](const flow::VariableSpec* spec) { return spec->mandatory; });
    if (!blocking) {
        std::weak_ptr<CallSession> weak = session_;
        extractor_.extract_async(node.extract_variables, utterance, known, session_->history(),
                                 [weak](const nlohmann::json& values) {
                                     if (auto session = weak.lock()) {
                                         session->merge_variables(values);
                                     }
                                 });
        return true;
    }

    const auto result =
        extractor_.extract(node.extract_variables, utterance, known, session_->history());
    session_->merge_variables(result.values);
    if (result.complete()) {
        return true;
    }

    std::string reprompt;
    for (const auto* spec : result.missing_mandatory) {
        std::string ask = spec->prompt_message;
        if (ask.empty()) {
            ask = "Could you tell me " + (spec->description.empty() ? spec->name : spec->description) + "?";
        }
        if (!reprompt.empty()) {
            reprompt += ' ';
        }
        reprompt += ask;
    }
    info("Mandatory variable missing", {kv("call_id", session_->call_id()),
                                        kv("node", node.id),
                                        kv("missing", result.missing_mandatory.size()),
                                        kv("timed_out", result.timed_out)});
    speak_text(utils::render_template(reprompt, session_->variables()));
    return false;
}

void SessionOrchestrator::advance(const std::string& target_node_id, const std::string& utterance) {
    session_->clear_content_dispatched();
    std::string node_id = target_node_id;
    for (int hop = 0;; ++hop) {
        if (hop >= options_.max_node_hops) {
            warn("Node hop limit reached", {kv("call_id", session_->call_id()),
                                            kv("node", node_id),
                                            kv("hops", hop)});
            return;
        }
        const auto* node = deps_.agent->graph.find(node_id);
        if (!node) {
            throw flow::FlowError("Unknown node " + node_id);
        }
        session_->set_current_node(node->id);
        debug("Entered node", {kv("call_id", session_->call_id()),
                               kv("node", node->id),
                               kv("type", node->type_name())});
        const auto next = enter_node(*node, utterance);
        if (!next) {
            return;
        }
        node_id = *next;
    }
}

void SessionOrchestrator::respond_in_place(const flow::FlowNode& node, const std::string& utterance) {
    if (session_->take_content_dispatched(node.id)) {
        debug("Content already playing", {kv("call_id", session_->call_id()), kv("node", node.id)});
        return;
    }
    std::string instruction;
    if (node.content_mode == flow::ContentMode::Prompt) {
        instruction = node.content;
    } else if (!node.content.empty()) {
        instruction = "Answer the caller briefly, then continue with: " +
                      utils::render_template(node.content, session_->variables());
    }
    if (node.goal) {
        if (!instruction.empty()) {
            instruction += "\n";
        }
        instruction += "Goal of this step: " + *node.goal;
    }
    speak_generated(instruction, utterance);
}

std::optional<std::string> SessionOrchestrator::enter_node(const flow::FlowNode& node,
                                                           const std::string& utterance) {
    return std::visit(
        [&](const auto& body) -> std::optional<std::string> {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, flow::ConversationNode> ||
                          std::is_same_v<T, flow::CollectInputNode> ||
                          std::is_same_v<T, flow::ExtractVariableNode>) {
                speak_node(node, utterance);
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, flow::FunctionCallNode>) {
                speak_node(node, utterance);
                call_function(node, body, utterance);
                return next_automatic(node, utterance);
            } else if constexpr (std::is_same_v<T, flow::LogicSplitNode>) {
                auto target = flow::evaluate_logic_split(body, session_->variables());
                if (!target) {
                    warn("Logic split without match", {kv("call_id", session_->call_id()),
                                                       kv("node", node.id)});
                }
                return target;
            } else if constexpr (std::is_same_v<T, flow::PressDigitNode>) {
                try {
                    deps_.provider->send_dtmf(session_->call_id(), body.digits);
                } catch (const telephony::TelephonyError& ex) {
                    warn("DTMF failed", {kv("call_id", session_->call_id()), kv("error", ex.what())});
                }
                return next_automatic(node, utterance);
            } else if constexpr (std::is_same_v<T, flow::TransferNode>) {
                speak_node(node, utterance);
                {
                    std::lock_guard<std::mutex> lock(transfer_mutex_);
                    pending_transfer_ = body.destination;
                }
                session_->request_end();
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, flow::EndingNode>) {
                speak_node(node, utterance);
                session_->request_end();
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, flow::StartNode>) {
                speak_node(node, utterance);
                if (node.transitions.empty()) {
                    return std::nullopt;
                }
                return node.transitions.front().target_node_id;
            } else {
                static_assert(always_false_v<T>, "unhandled node type");
            }
        },
        node.body);
}

std::optional<std::string> SessionOrchestrator::next_automatic(const flow::FlowNode& node,
                                                               const std::string& utterance) {
    if (node.transitions.empty()) {
        return std::nullopt;
    }
    if (node.transitions.size() == 1) {
        return node.transitions.front().target_node_id;
    }
    const auto decision = deps_.agent->evaluator->evaluate(node, utterance, session_->variables(),
                                                           session_->history());
    if (decision.target_node_id) {
        return decision.target_node_id;
    }
    return node.transitions.front().target_node_id;
}

void SessionOrchestrator::call_function(const flow::FlowNode& node,
                                        const flow::FunctionCallNode& function,
                                        const std::string& utterance) {
    const auto& call_id = session_->call_id();
    if (function.url.empty()) {
        warn("Function node without url", {kv("call_id", call_id), kv("node", node.id)});
        return;
    }

    const auto parts = utils::parse_url(function.url);
    BackendRequestOptions request_options;
    request_options.request_timeout = function.timeout;
    request_options.connect_timeout = std::min(function.timeout, request_options.connect_timeout);
    request_options.sock_read_timeout = function.timeout;
    BackendClient client(utils::build_url(parts.scheme, parts.host, parts.port, ""),
                         std::nullopt, request_options);
    const auto path = parts.base_path.empty() ? std::string("/") : parts.base_path;

    nlohmann::json body = {
        {"user_message", utterance},
        {"call_id", call_id},
        {"conversation_history", history_json(session_->history(), kFunctionHistoryTurns)},
        {"variables", session_->variables()},
    };

    nlohmann::json response;
    const auto started = std::chrono::steady_clock::now();
    try {
        response = upper(function.method) == "GET" ? client.get_json(path) : client.post_json(path, body);
        Metrics::instance().increment("function_calls", "ok");
    } catch (const BackendError& ex) {
        Metrics::instance().increment("function_calls", "error");
        warn("Function call failed", {kv("call_id", call_id),
                                      kv("node", node.id),
                                      kv("error", ex.what())});
        response = {{"success", false}, {"error", ex.what()}};
    }
    Metrics::instance().observe_latency(
        "function_call",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    const auto variable =
        function.response_variable.empty() ? std::string("webhook_response") : function.response_variable;
    session_->set_variable(variable, response);
    if (response.is_object()) {
        session_->merge_variables(response);
    }
}

void SessionOrchestrator::speak_node(const flow::FlowNode& node, const std::string& utterance) {
    if (node.content_mode == flow::ContentMode::Prompt) {
        if (!node.content.empty() || node.goal) {
            std::string instruction = node.content;
            if (node.goal) {
                instruction += (instruction.empty() ? "" : "\n") + std::string("Goal of this step: ") + *node.goal;
            }
            speak_generated(instruction, utterance);
        }
        return;
    }
    const auto text = utils::render_template(node.content, session_->variables());
    if (!utils::normalize_text(text).empty()) {
        speak_text(text);
    }
}

void SessionOrchestrator::speak_text(const std::string& text) {
    const auto units = coordinator_->stream_content(text);
    complete_turn(units, text);
}

void SessionOrchestrator::speak_generated(const std::string& instruction, const std::string& utterance) {
    const auto& call_id = session_->call_id();
    ChatRequest request;
    request.temperature = 0.7;
    std::string system = deps_.agent->graph.system_prompt();
    if (!instruction.empty()) {
        system += (system.empty() ? "" : "\n\n") + utils::render_template(instruction, session_->variables());
    }
    request.messages.push_back({"system", system});
    for (auto& message : session_->history()) {
        request.messages.push_back(std::move(message));
    }
    if (request.messages.size() == 1 && !utterance.empty()) {
        request.messages.push_back({"user", utterance});
    }

    coordinator_->begin_turn();
    std::string streamed;
    const auto started = std::chrono::steady_clock::now();
    try {
        deps_.llm->stream(
            request,
            [&](const std::string& delta) {
                streamed += delta;
                coordinator_->append_text(delta);
            },
            options_.generation_timeout);
    } catch (const std::exception& ex) {
        Metrics::instance().increment("generation", "error");
        warn("Generation failed", {kv("call_id", call_id), kv("error", ex.what())});
    }
    Metrics::instance().observe_latency(
        "generate", std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    if (utils::normalize_text(streamed).empty()) {
        Metrics::instance().increment("generation", "fallback");
        streamed = options_.fallback_reply;
        coordinator_->append_text(streamed);
    }
    complete_turn(coordinator_->finish_turn(), streamed);
}

void SessionOrchestrator::complete_turn(const std::vector<audio::PlaybackUnit>& units,
                                        const std::string& text) {
    if (!text.empty()) {
        session_->append_history("assistant", text);
    }
    debug("Agent turn dispatched", {kv("call_id", session_->call_id()),
                                    kv("units", units.size()),
                                    kv("chars", text.size())});
}

void SessionOrchestrator::maybe_finish(TimePoint now) {
    const auto snapshot = session_->snapshot();
    if (!snapshot.should_end_call || snapshot.active_playback_count > 0 ||
        snapshot.generating_response) {
        return;
    }
    if (finished_.exchange(true)) {
        return;
    }

    const auto& call_id = session_->call_id();
    std::optional<std::string> transfer;
    {
        std::lock_guard<std::mutex> lock(transfer_mutex_);
        transfer = pending_transfer_;
    }
    try {
        if (transfer && !transfer->empty()) {
            info("Transferring call", {kv("call_id", call_id), kv("destination", *transfer)});
            deps_.provider->transfer(call_id, *transfer);
        } else {
            info("Hanging up", {kv("call_id", call_id)});
            deps_.provider->hangup(call_id);
        }
    } catch (const telephony::TelephonyError& ex) {
        error("Call teardown failed", {kv("call_id", call_id), kv("error", ex.what())});
        if (transfer) {
            try {
                deps_.provider->hangup(call_id);
            } catch (const telephony::TelephonyError& hangup_ex) {
                error("Hangup failed", {kv("call_id", call_id), kv("error", hangup_ex.what())});
            }
        }
    }
    const auto duration = std::chrono::duration<double>(now - snapshot.call_started_at);
    Metrics::instance().observe_latency("call_duration", std::max(0.0, duration.count()));
    monitor_.stop();
}

void SessionOrchestrator::publish_descriptor() {
    try {
        deps_.store->set(session_->call_id(), session_->descriptor(), options_.store_ttl);
    } catch (const StoreError& ex) {
        warn("Session publish failed", {kv("call_id", session_->call_id()), kv("error", ex.what())});
    }
}

}

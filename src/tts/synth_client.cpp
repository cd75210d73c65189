#include "call_engine/tts/synth_client.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/http.hpp"

namespace call_engine::tts {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

}

struct WsSynthesisClient::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

WsSynthesisClient::WsSynthesisClient(SynthesisOptions options)
    : options_(std::move(options)) {}

WsSynthesisClient::~WsSynthesisClient() {
    close();
}

void WsSynthesisClient::connect() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { run_loop(); });
}

bool WsSynthesisClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!open_ || !ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, payload.dump(),
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        warn("Synthesis send failed",
             {kv("call_id", options_.call_id), kv("error", ec.message())});
        return false;
    }
    return true;
}

std::optional<std::string> WsSynthesisClient::synthesize(int64_t seq,
                                                         const std::string& text,
                                                         std::chrono::milliseconds timeout) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    {
        std::unique_lock<std::mutex> lock(ws_mutex_);
        if (!connected_cv_.wait_until(lock, deadline, [this]() { return open_ || !running_; }) ||
            !open_) {
            warn("Synthesis connection not ready", {kv("call_id", options_.call_id), kv("seq", seq)});
            return std::nullopt;
        }
    }

    std::future<std::optional<std::string>> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto& promise = pending_[seq];
        promise = std::promise<std::optional<std::string>>();
        future = promise.get_future();
    }

    nlohmann::json request = {{"type", "synthesize"}, {"seq", seq}, {"text", text}};
    if (!options_.voice.empty()) {
        request["voice"] = options_.voice;
    }
    if (!send_json(request)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(seq);
        return std::nullopt;
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(seq);
        warn("Synthesis timed out", {kv("call_id", options_.call_id), kv("seq", seq)});
        return std::nullopt;
    }
    Metrics::instance().observe_latency(
        "synthesize",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    return future.get();
}

void WsSynthesisClient::handle_message(const nlohmann::json& payload) {
    const auto type = payload.value("type", "");
    if (!payload.contains("seq") || !payload.at("seq").is_number_integer()) {
        debug("Synthesis message without seq", {kv("type", type)});
        return;
    }
    const auto seq = payload.at("seq").get<int64_t>();
    std::lock_guard<std::mutex> lock(pending_mutex_);
    const auto it = pending_.find(seq);
    if (it == pending_.end()) {
        return;
    }
    if (type == "audio") {
        it->second.set_value(payload.value("audio", std::string()));
    } else {
        warn("Synthesis error",
             {kv("call_id", options_.call_id), kv("seq", seq),
              kv("message", payload.value("message", type))});
        it->second.set_value(std::nullopt);
    }
    pending_.erase(it);
}

void WsSynthesisClient::fail_pending() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& item : pending_) {
        item.second.set_value(std::nullopt);
    }
    pending_.clear();
}

void WsSynthesisClient::close() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client && !ws_state_->connection.expired()) {
            websocketpp::lib::error_code ec;
            ws_state_->client->close(ws_state_->connection,
                                     websocketpp::close::status::going_away,
                                     "call ended", ec);
        }
        if (ws_state_ && ws_state_->client) {
            ws_state_->client->stop();
        }
    }
    connected_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    fail_pending();
}

void WsSynthesisClient::run_loop() {
    while (running_) {
        auto client = std::make_shared<WsClient>();
        client->clear_access_channels(websocketpp::log::alevel::all);
        client->clear_error_channels(websocketpp::log::elevel::all);
        client->init_asio();

        client->set_open_handler([this](websocketpp::connection_hdl) {
            {
                std::lock_guard<std::mutex> lock(ws_mutex_);
                open_ = true;
            }
            connected_cv_.notify_all();
            debug("Synthesis connection open", {kv("call_id", options_.call_id)});
        });
        client->set_message_handler([this](websocketpp::connection_hdl,
                                           WsClient::message_ptr msg) {
            try {
                handle_message(nlohmann::json::parse(msg->get_payload()));
            } catch (const nlohmann::json::exception& ex) {
                warn("Malformed synthesis message",
                     {kv("call_id", options_.call_id), kv("error", ex.what())});
            }
        });
        auto on_down = [this](websocketpp::connection_hdl) {
            {
                std::lock_guard<std::mutex> lock(ws_mutex_);
                open_ = false;
            }
            fail_pending();
        };
        client->set_close_handler(on_down);
        client->set_fail_handler(on_down);

        websocketpp::lib::error_code ec;
        auto conn = client->get_connection(make_ws_url(), ec);
        if (ec) {
            error("Synthesis connection setup failed",
                  {kv("call_id", options_.call_id), kv("error", ec.message())});
            std::this_thread::sleep_for(options_.reconnect_delay);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_ = std::make_unique<WsState>();
            ws_state_->client = client;
            ws_state_->connection = conn->get_handle();
        }
        if (!running_) {
            break;
        }
        client->connect(conn);
        client->run();

        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_.reset();
            open_ = false;
        }
        if (running_) {
            warn("Synthesis connection lost, reconnecting", {kv("call_id", options_.call_id)});
            std::this_thread::sleep_for(options_.reconnect_delay);
        }
    }
}

std::string WsSynthesisClient::make_ws_url() const {
    auto url = utils::to_ws_url(options_.url);
    if (!options_.call_id.empty()) {
        url += (url.find('?') == std::string::npos ? "?" : "&");
        url += "call_id=" + utils::url_encode(options_.call_id);
    }
    return url;
}

}

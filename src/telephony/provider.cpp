#include "call_engine/telephony/provider.hpp"

#include <algorithm>
#include <thread>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/base64.hpp"
#include "call_engine/utils/http.hpp"

namespace call_engine::telephony {

namespace {

BackendRequestOptions request_options(std::chrono::milliseconds timeout) {
    BackendRequestOptions options;
    options.request_timeout = timeout;
    options.connect_timeout = timeout;
    options.sock_read_timeout = timeout;
    return options;
}

}

HttpTelephonyProvider::HttpTelephonyProvider(HttpTelephonyOptions options)
    : options_(std::move(options)),
      client_(options_.api_url, options_.api_key, request_options(options_.timeout)) {}

void HttpTelephonyProvider::action(const std::string& call_id,
                                   const std::string& name,
                                   const nlohmann::json& body) {
    const auto path = "/calls/" + utils::url_encode(call_id) + "/actions/" + name;
    const int attempts = std::max(1, options_.max_retries + 1);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        const auto started = std::chrono::steady_clock::now();
        try {
            client_.post_json(path, body);
            Metrics::instance().observe_latency(
                "provider_" + name,
                std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
            return;
        } catch (const BackendPermissionError& ex) {
            throw TelephonyError(name + " rejected: " + ex.what());
        } catch (const BackendError& ex) {
            Metrics::instance().increment("provider_errors", name);
            warn("Telephony action failed",
                 {kv("call_id", call_id), kv("action", name), kv("attempt", attempt),
                  kv("error", ex.what())});
            if (attempt == attempts) {
                throw TelephonyError(name + " failed after " + std::to_string(attempts) +
                                     " attempts: " + ex.what());
            }
            std::this_thread::sleep_for(options_.retry_backoff * attempt);
        }
    }
}

void HttpTelephonyProvider::start_playback(const std::string& call_id,
                                           const std::string& audio_base64,
                                           const std::string& unit_id) {
    action(call_id, "playback_start",
           {{"playback_content", audio_base64},
            {"client_state", utils::base64_encode(unit_id)}});
}

void HttpTelephonyProvider::stop_playback(const std::string& call_id) {
    action(call_id, "playback_stop", {{"stop", "all"}});
}

void HttpTelephonyProvider::speak(const std::string& call_id, const std::string& text) {
    action(call_id, "speak",
           {{"payload", text},
            {"voice", options_.speak_voice},
            {"language", options_.speak_language}});
}

void HttpTelephonyProvider::send_dtmf(const std::string& call_id, const std::string& digits) {
    action(call_id, "send_dtmf", {{"digits", digits}});
}

void HttpTelephonyProvider::transfer(const std::string& call_id, const std::string& destination) {
    action(call_id, "transfer", {{"to", destination}});
}

void HttpTelephonyProvider::hangup(const std::string& call_id) {
    action(call_id, "hangup", nlohmann::json::object());
}

}

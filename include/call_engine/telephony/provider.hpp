#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "call_engine/backend/client.hpp"

namespace call_engine::telephony {

class TelephonyError : public std::runtime_error {
public:
    explicit TelephonyError(const std::string& message) : std::runtime_error(message) {}
};

// Call-control seam. Failures surface as TelephonyError once retries are spent.
class TelephonyProvider {
public:
    virtual ~TelephonyProvider() = default;

    // unit_id comes back as client_state on playback webhooks.
    virtual void start_playback(const std::string& call_id,
                                const std::string& audio_base64,
                                const std::string& unit_id) = 0;
    virtual void stop_playback(const std::string& call_id) = 0;
    // Provider-side TTS, used for closing lines when no session exists.
    virtual void speak(const std::string& call_id, const std::string& text) = 0;
    virtual void send_dtmf(const std::string& call_id, const std::string& digits) = 0;
    virtual void transfer(const std::string& call_id, const std::string& destination) = 0;
    virtual void hangup(const std::string& call_id) = 0;
};

struct HttpTelephonyOptions {
    std::string api_url;
    std::optional<std::string> api_key;
    int max_retries = 2;
    std::chrono::milliseconds timeout{3000};
    std::chrono::milliseconds retry_backoff{200};
    std::string speak_voice = "female";
    std::string speak_language = "en-US";
};

// Telnyx-style call control: POST /calls/{id}/actions/{action}.
class HttpTelephonyProvider : public TelephonyProvider {
public:
    explicit HttpTelephonyProvider(HttpTelephonyOptions options);

    void start_playback(const std::string& call_id,
                        const std::string& audio_base64,
                        const std::string& unit_id) override;
    void stop_playback(const std::string& call_id) override;
    void speak(const std::string& call_id, const std::string& text) override;
    void send_dtmf(const std::string& call_id, const std::string& digits) override;
    void transfer(const std::string& call_id, const std::string& destination) override;
    void hangup(const std::string& call_id) override;

private:
    void action(const std::string& call_id, const std::string& name, const nlohmann::json& body);

    HttpTelephonyOptions options_;
    BackendClient client_;
};

}

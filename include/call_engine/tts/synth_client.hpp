#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace call_engine::tts {

// Text-to-speech seam. synthesize() returns base64 audio, or nothing on
// timeout or synthesis failure.
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    virtual void connect() = 0;
    virtual std::optional<std::string> synthesize(int64_t seq,
                                                   const std::string& text,
                                                   std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

struct SynthesisOptions {
    std::string url;
    std::string voice;
    std::string call_id;
    std::chrono::milliseconds reconnect_delay{1000};
};

// One persistent WebSocket per call, opened at call start and kept warm.
// Requests carry a sequence number so replies may arrive in any order.
class WsSynthesisClient : public SpeechSynthesizer {
public:
    explicit WsSynthesisClient(SynthesisOptions options);
    ~WsSynthesisClient() override;

    void connect() override;
    std::optional<std::string> synthesize(int64_t seq,
                                          const std::string& text,
                                          std::chrono::milliseconds timeout) override;
    void close() override;

private:
    void run_loop();
    void handle_message(const nlohmann::json& payload);
    void fail_pending();
    bool send_json(const nlohmann::json& payload);
    std::string make_ws_url() const;

    SynthesisOptions options_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    mutable std::mutex ws_mutex_;
    std::condition_variable connected_cv_;
    bool open_ = false;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
    std::mutex pending_mutex_;
    std::map<int64_t, std::promise<std::optional<std::string>>> pending_;
};

}

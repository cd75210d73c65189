#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace call_engine {

class LlmError : public std::runtime_error {
public:
    explicit LlmError(const std::string& message) : std::runtime_error(message) {}
};

struct ChatMessage {
    std::string role;
    std::string content;
};

struct ChatRequest {
    std::vector<ChatMessage> messages;
    double temperature = 0.2;
    int max_tokens = 0;
    bool json_response = false;
};

// Model endpoint seam. Implementations must honour the timeout and throw
// LlmError on transport or protocol failures.
class LlmClient {
public:
    using DeltaHandler = std::function<void(const std::string&)>;

    virtual ~LlmClient() = default;

    virtual std::string complete(const ChatRequest& request,
                                 std::chrono::milliseconds timeout) = 0;

    // Streams content deltas to on_delta and returns the full text.
    virtual std::string stream(const ChatRequest& request,
                               const DeltaHandler& on_delta,
                               std::chrono::milliseconds timeout) {
        auto text = complete(request, timeout);
        if (!text.empty()) {
            on_delta(text);
        }
        return text;
    }
};

struct LlmClientOptions {
    std::string url;
    std::optional<std::string> api_key;
    std::string model;
};

// OpenAI-compatible /chat/completions client.
class HttpLlmClient : public LlmClient {
public:
    explicit HttpLlmClient(LlmClientOptions options);

    std::string complete(const ChatRequest& request,
                         std::chrono::milliseconds timeout) override;
    std::string stream(const ChatRequest& request,
                       const DeltaHandler& on_delta,
                       std::chrono::milliseconds timeout) override;

    nlohmann::json build_body(const ChatRequest& request, bool stream) const;

private:
    LlmClientOptions options_;
    std::string origin_;
    std::string path_;
};

// Feeds raw SSE bytes and emits the content delta of every complete
// "data:" line. Returns false once "[DONE]" was seen.
class SseDeltaParser {
public:
    bool feed(const std::string& chunk, const LlmClient::DeltaHandler& on_delta);
    const std::string& text() const { return text_; }

private:
    std::string buffer_;
    std::string text_;
    bool done_ = false;
};

}

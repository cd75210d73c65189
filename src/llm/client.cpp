#include "call_engine/llm/client.hpp"

#include <httplib.h>

#include <utility>

#include "call_engine/logging.hpp"
#include "call_engine/utils/http.hpp"

namespace call_engine {

namespace {

httplib::Headers auth_headers(const std::optional<std::string>& api_key) {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (api_key) {
        headers.emplace("Authorization", "Bearer " + *api_key);
    }
    return headers;
}

void apply_deadline(httplib::Client& client, std::chrono::milliseconds timeout) {
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
}

}

HttpLlmClient::HttpLlmClient(LlmClientOptions options)
    : options_(std::move(options)) {
    const auto parts = utils::parse_url(options_.url);
    origin_ = parts.scheme + "://" + parts.host + ":" + std::to_string(parts.port);
    path_ = utils::join_path(parts.base_path, "/chat/completions");
}

nlohmann::json HttpLlmClient::build_body(const ChatRequest& request, bool stream) const {
    nlohmann::json body = {
        {"model", options_.model},
        {"temperature", request.temperature},
        {"stream", stream},
        {"messages", nlohmann::json::array()},
    };
    for (const auto& message : request.messages) {
        body["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }
    if (request.max_tokens > 0) {
        body["max_tokens"] = request.max_tokens;
    }
    if (request.json_response) {
        body["response_format"] = {{"type", "json_object"}};
    }
    return body;
}

std::string HttpLlmClient::complete(const ChatRequest& request,
                                    std::chrono::milliseconds timeout) {
    httplib::Client client(origin_);
    apply_deadline(client, timeout);
    const auto response = client.Post(path_, auth_headers(options_.api_key),
                                      build_body(request, false).dump(), "application/json");
    if (!response) {
        throw LlmError("LLM request failed: " + httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw LlmError("LLM HTTP " + std::to_string(response->status) + ": " + response->body);
    }
    try {
        const auto payload = nlohmann::json::parse(response->body);
        return payload.at("choices").at(0).at("message").value("content", "");
    } catch (const nlohmann::json::exception& ex) {
        throw LlmError(std::string("Malformed LLM response: ") + ex.what());
    }
}

std::string HttpLlmClient::stream(const ChatRequest& request,
                                  const DeltaHandler& on_delta,
                                  std::chrono::milliseconds timeout) {
    httplib::Client client(origin_);
    apply_deadline(client, timeout);

    httplib::Request http_request;
    http_request.method = "POST";
    http_request.path = path_;
    http_request.headers = auth_headers(options_.api_key);
    http_request.headers.emplace("Content-Type", "application/json");
    http_request.body = build_body(request, true).dump();

    SseDeltaParser parser;
    int status = 0;
    std::string error_body;
    http_request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    http_request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status < 200 || status >= 300) {
            error_body.append(data, length);
            return true;
        }
        return parser.feed(std::string(data, length), on_delta);
    };

    auto result = client.send(http_request);
    if (status != 0 && (status < 200 || status >= 300)) {
        throw LlmError("LLM HTTP " + std::to_string(status) + ": " + error_body);
    }
    // Cancelled by the parser after [DONE]; anything else is a transport error.
    if (!result && result.error() != httplib::Error::Canceled) {
        throw LlmError("LLM stream failed: " + httplib::to_string(result.error()));
    }
    return parser.text();
}

bool SseDeltaParser::feed(const std::string& chunk, const LlmClient::DeltaHandler& on_delta) {
    if (done_) {
        return false;
    }
    buffer_ += chunk;
    size_t newline = 0;
    while ((newline = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind("data:", 0) != 0) {
            continue;
        }
        auto data = line.substr(5);
        if (!data.empty() && data.front() == ' ') {
            data.erase(0, 1);
        }
        if (data == "[DONE]") {
            done_ = true;
            return false;
        }
        try {
            const auto event = nlohmann::json::parse(data);
            const auto& choices = event.at("choices");
            if (choices.empty()) {
                continue;
            }
            const auto& delta = choices.at(0).value("delta", nlohmann::json::object());
            const auto content = delta.contains("content") && delta["content"].is_string()
                                     ? delta["content"].get<std::string>()
                                     : std::string();
            if (!content.empty()) {
                text_ += content;
                on_delta(content);
            }
        } catch (const nlohmann::json::exception& ex) {
            warn("Skipping malformed stream event", {kv("error", ex.what())});
        }
    }
    return true;
}

}

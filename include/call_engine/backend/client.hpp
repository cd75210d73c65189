#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace call_engine {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

struct BackendRequestOptions {
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds sock_read_timeout{10000};
};

// JSON-over-HTTP client shared by the agent repository, the telephony
// provider and function-call nodes. Non-2xx statuses throw BackendError.
class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);

private:
    enum class Method { Get, Post };

    nlohmann::json send(Method method, const std::string& path,
                        const std::optional<nlohmann::json>& body);
    httplib::Headers headers() const;
    std::string build_path(const std::string& path) const;
    void apply_timeouts();

    std::string base_url_;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
    std::mutex client_mutex_;
    std::unique_ptr<httplib::Client> client_;
};

}

#include "call_engine/backend/client.hpp"

#include <utility>

#include "call_engine/utils/http.hpp"

namespace call_engine {

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    const auto parts = utils::parse_url(base_url_);
    base_path_ = parts.base_path;

    if (parts.scheme == "https") {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    }
    const auto origin = parts.scheme + "://" + parts.host + ":" + std::to_string(parts.port);
    client_ = std::make_unique<httplib::Client>(origin);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client_->enable_server_certificate_verification(false);
#endif
    apply_timeouts();
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    return send(Method::Get, path, std::nullopt);
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    return send(Method::Post, path, body);
}

nlohmann::json BackendClient::send(Method method, const std::string& path,
                                   const std::optional<nlohmann::json>& body) {
    const auto full_path = build_path(path);
    const auto request_headers = headers();
    const auto payload = body ? body->dump() : std::string();

    httplib::Result response;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        switch (method) {
            case Method::Get:
                response = client_->Get(full_path, request_headers);
                break;
            case Method::Post:
                response = client_->Post(full_path, request_headers, payload, "application/json");
                break;
        }
    }

    if (!response) {
        throw BackendError(std::string(method == Method::Get ? "GET " : "POST ") +
                           full_path + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 401 || response->status == 403) {
        throw BackendPermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("HTTP " + std::to_string(response->status) + ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(std::string("Invalid JSON response: ") + ex.what());
    }
}

httplib::Headers BackendClient::headers() const {
    httplib::Headers result{{"Accept", "application/json"}};
    if (authorization_token_) {
        result.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return result;
}

std::string BackendClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

void BackendClient::apply_timeouts() {
    client_->set_connection_timeout(options_.connect_timeout);
    client_->set_read_timeout(options_.sock_read_timeout);
    client_->set_write_timeout(options_.request_timeout);
}

}

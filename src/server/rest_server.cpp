#include "call_engine/server/rest_server.hpp"

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"

namespace call_engine {

RestServer::RestServer(const Config& config,
                       WebhookHandler on_webhook,
                       TranscriptHandler on_transcript)
    : config_(config),
      on_webhook_(std::move(on_webhook)),
      on_transcript_(std::move(on_transcript)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->set_logger([](const httplib::Request&, const httplib::Response&) {
        Metrics::instance().increment_request();
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/webhooks/telephony", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to parse telephony webhook",
                {kv("error", ex.what())});
            res.status = 400;
            res.set_content(R"({"message":"invalid request body"})", "application/json");
            return;
        }
        try {
            write_json(res, on_webhook_(body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle telephony webhook",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"webhook handling failed"})", "application/json");
        }
    });

    server_->Post(R"(/calls/([A-Za-z0-9_:.\-]+)/transcript)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto call_id = req.matches[1].str();
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to parse transcript body",
                {kv("call_id", call_id), kv("error", ex.what())});
            res.status = 400;
            res.set_content(R"({"message":"invalid request body"})", "application/json");
            return;
        }
        try {
            write_json(res, on_transcript_(call_id, body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle transcript",
                {kv("call_id", call_id), kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"transcript handling failed"})", "application/json");
        }
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        server_->listen("0.0.0.0", config_.rest_api_port);
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}

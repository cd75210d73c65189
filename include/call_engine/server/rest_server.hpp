#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "call_engine/config.hpp"

namespace call_engine {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using WebhookHandler = std::function<RestResponse(const nlohmann::json&)>;
    using TranscriptHandler =
        std::function<RestResponse(const std::string&, const nlohmann::json&)>;

    RestServer(const Config& config, WebhookHandler on_webhook, TranscriptHandler on_transcript);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    WebhookHandler on_webhook_;
    TranscriptHandler on_transcript_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}

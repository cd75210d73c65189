#include "call_engine/app.hpp"
#include "call_engine/config.hpp"
#include "call_engine/logging.hpp"

#include <csignal>
#include <string>

namespace {

void on_signal(int) {
    call_engine::EngineApp::request_stop();
}

}

int main() {
    try {
        const auto config = call_engine::Config::load();
        config.validate();
        call_engine::logging::init(config);
        call_engine::info(
            "Starting call-engine",
            {call_engine::kv("backend_url", config.backend_url),
             call_engine::kv("rest_port", config.rest_api_port),
             call_engine::kv("store", config.store_url.empty() ? std::string("memory") : config.store_url),
             call_engine::kv("transition_timeout_ms", config.transition_timeout_ms)});
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        call_engine::EngineApp app(config);
        app.init();
        app.run();
        app.stop();
    } catch (const std::exception& ex) {
        call_engine::error(
            "Startup failed",
            {call_engine::kv("error", ex.what())});
        return 1;
    }
    return 0;
}

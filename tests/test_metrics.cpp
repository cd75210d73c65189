#include <catch2/catch_test_macros.hpp>

#include "call_engine/metrics.hpp"

#include <string>

using call_engine::Metrics;

TEST_CASE("Counters are kept per name and kind") {
    auto& metrics = Metrics::instance();
    const auto before = metrics.counter_value("test_checkins", "1");
    metrics.increment("test_checkins", "1");
    metrics.increment("test_checkins", "1");
    metrics.increment("test_checkins", "2");

    REQUIRE(metrics.counter_value("test_checkins", "1") == before + 2);
    REQUIRE(metrics.counter_value("test_checkins", "missing") == 0);
    REQUIRE(metrics.counter_value("test_unknown_series", "1") == 0);

    const auto text = metrics.render_prometheus();
    REQUIRE(text.find("# TYPE test_checkins_total counter") != std::string::npos);
    REQUIRE(text.find("test_checkins_total{kind=\"2\"}") != std::string::npos);
}

TEST_CASE("Latency is exposed as histogram and summary") {
    auto& metrics = Metrics::instance();
    metrics.observe_latency("test_operation", 0.2);

    const auto text = metrics.render_prometheus();
    REQUIRE(text.find("operation_latency_seconds_bucket{operation=\"test_operation\",le=\"+Inf\"}") !=
            std::string::npos);
    REQUIRE(text.find("operation_latency_seconds_count{operation=\"test_operation\"}") !=
            std::string::npos);
    REQUIRE(text.find("operation_latency_summary_sum{operation=\"test_operation\"}") !=
            std::string::npos);
}

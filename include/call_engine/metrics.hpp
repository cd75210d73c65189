#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace call_engine {

class Metrics {
public:
    static Metrics& instance();

    void increment_request();
    // Counter series keyed by name and a single "kind" label.
    void increment(const std::string& name, const std::string& kind);
    void observe_latency(const std::string& operation, double seconds);
    uint64_t counter_value(const std::string& name, const std::string& kind) const;
    std::string render_prometheus() const;

private:
    struct LatencySeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    LatencySeries& latency_for(const std::string& operation);

    mutable std::mutex mutex_;
    uint64_t request_total_ = 0;
    std::map<std::string, std::map<std::string, uint64_t>> counters_;
    std::unordered_map<std::string, LatencySeries> latencies_;
    std::vector<double> histogram_bounds_;
};

}

#include "call_engine/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace call_engine {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5,
                         0.75, 1.0, 1.5, 2.0, 3.0, 5.0, 10.0};
}

void Metrics::increment_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_total_;
}

void Metrics::increment(const std::string& name, const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[name][kind];
}

uint64_t Metrics::counter_value(const std::string& name, const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto series = counters_.find(name);
    if (series == counters_.end()) {
        return 0;
    }
    const auto value = series->second.find(kind);
    return value == series->second.end() ? 0 : value->second;
}

Metrics::LatencySeries& Metrics::latency_for(const std::string& operation) {
    auto& series = latencies_[operation];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& operation, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = latency_for(operation);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP engine_requests_total Total number of inbound HTTP requests\n";
    out << "# TYPE engine_requests_total counter\n";
    out << "engine_requests_total " << request_total_ << "\n";

    for (const auto& [name, series] : counters_) {
        out << "# TYPE " << name << "_total counter\n";
        for (const auto& [kind, value] : series) {
            out << name << "_total{kind=\"" << kind << "\"} " << value << "\n";
        }
    }

    out << "# HELP operation_latency_seconds Latency of external and internal operations\n";
    out << "# TYPE operation_latency_seconds histogram\n";
    std::vector<std::string> operations;
    operations.reserve(latencies_.size());
    for (const auto& item : latencies_) {
        operations.push_back(item.first);
    }
    std::sort(operations.begin(), operations.end());
    for (const auto& operation : operations) {
        const auto& series = latencies_.at(operation);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "operation_latency_seconds_bucket{operation=\"" << operation
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "operation_latency_seconds_bucket{operation=\"" << operation
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "operation_latency_seconds_count{operation=\"" << operation << "\"} "
            << series.count << "\n";
        out << "operation_latency_seconds_sum{operation=\"" << operation << "\"} "
            << series.sum << "\n";
    }

    out << "# HELP operation_latency_summary Time elapsed per operation\n";
    out << "# TYPE operation_latency_summary summary\n";
    for (const auto& operation : operations) {
        const auto& series = latencies_.at(operation);
        out << "operation_latency_summary_count{operation=\"" << operation << "\"} "
            << series.count << "\n";
        out << "operation_latency_summary_sum{operation=\"" << operation << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}

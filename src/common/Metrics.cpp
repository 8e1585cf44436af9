#include "common/Metrics.hpp"

#include <utility>

namespace csync::common::metrics {

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
    if (value == 0.0) {
        if (!gauge.zeroSince.has_value()) {
            gauge.zeroSince = now;
        }
    }
    else {
        gauge.zeroSince.reset();
    }
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{value});
    }
    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        GaugeSnapshot gaugeSnapshot;
        gaugeSnapshot.value = gauge.value;
        gaugeSnapshot.updatedAt = gauge.updatedAt;
        gaugeSnapshot.zeroSince = gauge.zeroSince;
        snapshot.gauges.emplace(key, std::move(gaugeSnapshot));
    }
    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
}

}  // namespace csync::common::metrics

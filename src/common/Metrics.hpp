#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace csync::common::metrics {

namespace names {
inline constexpr const char* kInvalidRecords = "invalid_records_total";
inline constexpr const char* kFetchFailed = "fetch_failed_total";
inline constexpr const char* kCacheHits = "cache_hits_total";
inline constexpr const char* kCacheMisses = "cache_misses_total";
inline constexpr const char* kCacheCorrupt = "cache_corrupt_total";
inline constexpr const char* kReconnectAttempts = "reconnect_attempts_total";
inline constexpr const char* kStaleResultsDropped = "stale_results_dropped_total";
inline constexpr const char* kWsState = "ws_state";
}  // namespace names

class Registry {
public:
    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;
    Snapshot snapshot() const;

    void reset();

private:
    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace csync::common::metrics

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tsync::common::metrics {

// Builds "name{tenant=<id>}" keys for per-tenant series.
std::string tenantKey(const std::string& name, const std::string& tenantId);

class Registry {
public:
    static constexpr std::size_t kLatencyWindow = 1000;

    struct LatencySnapshot {
        std::uint64_t samples{0};
        std::optional<double> averageMs{};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, LatencySnapshot> latencies;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string key);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void recordLatency(const std::string& key, double latencyMs);

    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

private:
    struct LatencyWindow {
        std::uint64_t samples{0};
        std::deque<double> recentMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LatencyWindow> latencies_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeSnapshot> gauges_;
};

}  // namespace tsync::common::metrics

#pragma once

/// @file metrics.h
/// @brief promptguard self-monitoring metrics in Prometheus text format

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promptguard {

/// @brief Monotonically increasing counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief A gauge metric that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Cumulative histogram with fixed upper bounds plus +Inf
class Histogram {
public:
    /// @brief Create a histogram with latency buckets from 50us to 1s
    explicit Histogram(std::string name, std::string description = "");

    /// @brief Create a histogram with custom buckets (sorted on construction)
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative (upper bound, count) pairs, last bound is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;

    mutable std::mutex mutex_;
    std::vector<int64_t> bucket_counts_;
    int64_t count_ = 0;
    double sum_ = 0.0;
};

/// @brief RAII timer that observes elapsed seconds into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide registry. Metrics live as long as the registry, so the
///        references it hands out stay valid until Reset().
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Export all metrics in Prometheus text exposition format,
    ///        sorted by metric name
    std::string ExportText() const;

    /// @brief Drop all metrics (tests only; invalidates outstanding references)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define PROMPTGUARD_COUNTER(name) \
    ::promptguard::MetricsRegistry::Instance().GetCounter(name)

#define PROMPTGUARD_GAUGE(name) \
    ::promptguard::MetricsRegistry::Instance().GetGauge(name)

#define PROMPTGUARD_HISTOGRAM(name) \
    ::promptguard::MetricsRegistry::Instance().GetHistogram(name)

#define PROMPTGUARD_TIMER(histogram) \
    ::promptguard::ScopedTimer PROMPTGUARD_METRICS_CONCAT(_timer_, __LINE__)(histogram)

#define PROMPTGUARD_METRICS_CONCAT(a, b) PROMPTGUARD_METRICS_CONCAT_IMPL(a, b)
#define PROMPTGUARD_METRICS_CONCAT_IMPL(a, b) a##b

}  // namespace promptguard

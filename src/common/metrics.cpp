#include "metrics.h"

#include <algorithm>
#include <limits>
#include <map>
#include <sstream>

namespace promptguard {

// Classification runs in microseconds to low milliseconds
static const std::vector<double> kDefaultBuckets = {
    0.00005, 0.0001, 0.00025, 0.0005, 0.001, 0.0025, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0
};

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    double current = value_.load(std::memory_order_relaxed);
    while (!value_.compare_exchange_weak(current, current + delta,
                                          std::memory_order_relaxed)) {
    }
}

void Gauge::Decrement(double delta) {
    Increment(-delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)) {
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    bucket_counts_.assign(bucket_bounds_.size() + 1, 0);  // +1 for +Inf bucket
}

void Histogram::Observe(double value) {
    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    size_t bucket_idx = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    bucket_counts_[bucket_idx]++;
    count_++;
    sum_ += value;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_bounds_.size() + 1);

    std::lock_guard<std::mutex> lock(mutex_);
    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i];
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_.back();
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);

    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> duration = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(duration.count());
}

namespace {

template <typename Metric>
Metric& FindOrCreate(std::unordered_map<std::string, std::unique_ptr<Metric>>& metrics,
                     const std::string& name, const std::string& description) {
    auto& slot = metrics[name];
    if (!slot) {
        slot = std::make_unique<Metric>(name, description);
    }
    return *slot;
}

template <typename Metric>
std::map<std::string, const Metric*> SortedByName(
    const std::unordered_map<std::string, std::unique_ptr<Metric>>& metrics) {
    std::map<std::string, const Metric*> sorted;
    for (const auto& [name, metric] : metrics) {
        sorted.emplace(name, metric.get());
    }
    return sorted;
}

void WriteHeader(std::ostringstream& oss, const std::string& name,
                 const std::string& description, const char* type) {
    if (!description.empty()) {
        oss << "# HELP " << name << " " << description << "\n";
    }
    oss << "# TYPE " << name << " " << type << "\n";
}

}  // namespace

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindOrCreate(counters_, name, description);
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindOrCreate(gauges_, name, description);
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindOrCreate(histograms_, name, description);
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, counter] : SortedByName(counters_)) {
        WriteHeader(oss, name, counter->Description(), "counter");
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, gauge] : SortedByName(gauges_)) {
        WriteHeader(oss, name, gauge->Description(), "gauge");
        oss << name << " " << gauge->Value() << "\n";
    }

    for (const auto& [name, histogram] : SortedByName(histograms_)) {
        WriteHeader(oss, name, histogram->Description(), "histogram");
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

}  // namespace promptguard

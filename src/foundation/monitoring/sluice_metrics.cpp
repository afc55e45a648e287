/// @file sluice_metrics.cpp
/// @brief In-memory implementation of SluiceMetrics.

#include "sluice/foundation/sluice_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

namespace sluice::foundation {

HistogramBuckets HistogramBuckets::defaultLatency() {
    return HistogramBuckets{{1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 30000}};
}

HistogramBuckets HistogramBuckets::defaultDuration() {
    return HistogramBuckets{{0.1, 0.5, 1, 2.5, 5, 10, 25, 50}};
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // one per boundary + 1 for +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

// std::atomic<double> has no fetch_add before C++20 library support lands
// everywhere, so use a CAS loop.
void atomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(
        current, current + delta, std::memory_order_release, std::memory_order_relaxed)) {
    }
}

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

/// "name{label=\"x\"}" -> "name".
std::string_view familyOf(std::string_view name) {
    auto brace = name.find('{');
    return brace == std::string_view::npos ? name : name.substr(0, brace);
}

/// Insert an extra label into a possibly-labelled metric name.
std::string withLabel(std::string_view name, std::string_view suffix, std::string_view label) {
    auto brace = name.find('{');
    std::string out(name.substr(0, brace));
    out += suffix;
    if (brace == std::string_view::npos) {
        out += '{';
        out += label;
        out += '}';
    } else {
        auto inner = name.substr(brace + 1, name.size() - brace - 2);
        out += '{';
        out += inner;
        out += ',';
        out += label;
        out += '}';
    }
    return out;
}

std::string withSuffix(std::string_view name, std::string_view suffix) {
    auto brace = name.find('{');
    if (brace == std::string_view::npos) {
        return std::string(name) + std::string(suffix);
    }
    return std::string(name.substr(0, brace)) + std::string(suffix) +
           std::string(name.substr(brace));
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct SluiceMetrics::Impl {
    // std::map keeps scrape output grouped by family and stable for tests.
    mutable std::mutex counterMutex;
    std::map<std::string, std::atomic<uint64_t>, std::less<>> counters;

    mutable std::mutex gaugeMutex;
    std::map<std::string, std::atomic<double>, std::less<>> gauges;

    mutable std::mutex histogramMutex;
    std::map<std::string, HistogramData, std::less<>> histograms;

    mutable std::mutex healthMutex;
    std::string serviceName{"sluice"};
    std::unordered_map<std::string, HealthStatus> componentHealth;
};

SluiceMetrics::SluiceMetrics() : impl_(std::make_unique<Impl>()) {}

SluiceMetrics::~SluiceMetrics() = default;

SluiceMetrics::SluiceMetrics(SluiceMetrics&&) noexcept = default;

SluiceMetrics& SluiceMetrics::operator=(SluiceMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void SluiceMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        it = impl_->counters.try_emplace(std::string(name), 0).first;
    }
    it->second.fetch_add(value, std::memory_order_relaxed);
}

uint64_t SluiceMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void SluiceMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        impl_->gauges.try_emplace(std::string(name), value);
        return;
    }
    it->second.store(value, std::memory_order_release);
}

void SluiceMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        it = impl_->gauges.try_emplace(std::string(name), 0.0).first;
    }
    atomicAdd(it->second, delta);
}

void SluiceMetrics::decrementGauge(std::string_view name, double delta) {
    incrementGauge(name, -delta);
}

double SluiceMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(name);
    if (it == impl_->gauges.end()) {
        return 0.0;
    }
    return it->second.load(std::memory_order_acquire);
}

// ── Histograms ──────────────────────────────────────────────────────────────

void SluiceMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    if (impl_->histograms.find(name) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::string(name), HistogramData(std::move(buckets.boundaries)));
    }
}

void SluiceMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

HistogramSummary SluiceMetrics::histogramSummary(std::string_view name) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(name);
    if (it == impl_->histograms.end()) {
        return {};
    }
    return HistogramSummary{it->second.totalCount, it->second.totalSum};
}

// ── Health ───────────────────────────────────────────────────────────────────

void SluiceMetrics::setServiceName(std::string_view name) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->serviceName = std::string(name);
}

void SluiceMetrics::setComponentHealth(std::string_view component, HealthStatus status) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->componentHealth[std::string(component)] = status;
}

HealthCheckResult SluiceMetrics::healthCheck() const {
    std::lock_guard lock(impl_->healthMutex);

    HealthCheckResult result;
    result.serviceName = impl_->serviceName;
    result.timestamp = std::chrono::system_clock::now();
    result.components = impl_->componentHealth;

    result.status = HealthStatus::Healthy;
    for (const auto& [_, status] : impl_->componentHealth) {
        if (status == HealthStatus::Unhealthy) {
            result.status = HealthStatus::Unhealthy;
            break;
        }
        if (status == HealthStatus::Degraded) {
            result.status = HealthStatus::Degraded;
        }
    }
    return result;
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string SluiceMetrics::scrape() const {
    std::ostringstream out;
    std::set<std::string, std::less<>> typed;

    auto typeLine = [&](std::string_view name, std::string_view type) {
        auto family = familyOf(name);
        if (typed.insert(std::string(family)).second) {
            out << "# TYPE " << family << " " << type << "\n";
        }
    };

    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            typeLine(name, "counter");
            out << name << " " << value.load(std::memory_order_relaxed) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            typeLine(name, "gauge");
            out << name << " " << formatDouble(value.load(std::memory_order_acquire)) << "\n";
        }
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        for (const auto& [name, data] : impl_->histograms) {
            typeLine(name, "histogram");
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                out << withLabel(name, "_bucket",
                                 "le=\"" + formatDouble(data.boundaries[i]) + "\"")
                    << " " << data.bucketCounts[i] << "\n";
            }
            out << withLabel(name, "_bucket", "le=\"+Inf\"") << " "
                << data.bucketCounts.back() << "\n";
            out << withSuffix(name, "_sum") << " " << formatDouble(data.totalSum) << "\n";
            out << withSuffix(name, "_count") << " " << data.totalCount << "\n";
        }
    }

    return out.str();
}

void SluiceMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
    }
    {
        std::lock_guard lock(impl_->healthMutex);
        impl_->componentHealth.clear();
    }
}

SluiceMetrics& SluiceMetrics::instance() {
    static SluiceMetrics inst;
    return inst;
}

}  // namespace sluice::foundation

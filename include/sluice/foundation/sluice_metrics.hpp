#pragma once

/// @file sluice_metrics.hpp
/// @brief In-memory counters, gauges, histograms and component health with
///        Prometheus text export.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sluice::foundation {

// ── Metric types ────────────────────────────────────────────────────────────

/// Bucket boundaries for histogram metrics (each is an inclusive upper bound).
struct HistogramBuckets {
    /// Request latency buckets in milliseconds.
    static HistogramBuckets defaultLatency();

    /// Duration buckets in seconds: {0.1,0.5,1,2.5,5,10,25,50}.
    static HistogramBuckets defaultDuration();

    std::vector<double> boundaries;
};

/// Point-in-time copy of a histogram's totals.
struct HistogramSummary {
    uint64_t count{0};
    double sum{0.0};

    [[nodiscard]] double mean() const noexcept {
        return count == 0 ? 0.0 : sum / static_cast<double>(count);
    }
};

// ── Health checking ─────────────────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/// Aggregated health of the service and its components.
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::string serviceName;
    std::unordered_map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

// ── SluiceMetrics ───────────────────────────────────────────────────────────

/// Metrics facade shared by the scheduler, cache and pool.
///
/// Metric names may carry Prometheus labels inline, e.g.
/// `sluice_requests_rejected_total{reason="rate_limited"}`; scrape() emits
/// one TYPE line per family.
///
/// Thread-safe: counters and gauges are atomics behind a map mutex;
/// histograms and health state are fully mutex-protected.
///
/// Example:
/// @code
///   auto& metrics = SluiceMetrics::instance();
///   metrics.incrementCounter("sluice_requests_submitted_total");
///   metrics.setGauge("sluice_queue_depth", 12.0);
///   metrics.registerHistogram("sluice_request_latency_ms",
///                             HistogramBuckets::defaultLatency());
///   metrics.recordHistogram("sluice_request_latency_ms", 42.0);
///   std::string prom = metrics.scrape();
/// @endcode
class SluiceMetrics {
public:
    SluiceMetrics();
    ~SluiceMetrics();

    SluiceMetrics(const SluiceMetrics&) = delete;
    SluiceMetrics& operator=(const SluiceMetrics&) = delete;
    SluiceMetrics(SluiceMetrics&&) noexcept;
    SluiceMetrics& operator=(SluiceMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Increment a counter (created on first use).
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Current counter value, 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    void setGauge(std::string_view name, double value);

    void incrementGauge(std::string_view name, double delta = 1.0);

    void decrementGauge(std::string_view name, double delta = 1.0);

    /// Current gauge value, 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    // ── Histograms ──────────────────────────────────────────────────────

    /// Register a histogram. Re-registering an existing name is a no-op.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation. No-op if the histogram was never registered.
    void recordHistogram(std::string_view name, double value);

    [[nodiscard]] HistogramSummary histogramSummary(std::string_view name) const;

    // ── Health ──────────────────────────────────────────────────────────

    void setServiceName(std::string_view name);

    void setComponentHealth(std::string_view component, HealthStatus status);

    /// Overall status is the worst status among all components.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    // ── Export ───────────────────────────────────────────────────────────

    /// Serialize all metrics in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear all metrics and health state. Intended for tests.
    void reset();

    static SluiceMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::foundation

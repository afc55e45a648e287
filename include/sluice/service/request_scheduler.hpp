#pragma once

/// @file request_scheduler.hpp
/// @brief Admission control and priority scheduling of requests onto a
///        fixed pool of workers.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/foundation/sluice_result.hpp"
#include "sluice/foundation/types.hpp"
#include "sluice/service/circuit_breaker.hpp"
#include "sluice/service/rate_limiter.hpp"
#include "sluice/service/request_types.hpp"

namespace sluice::service {

/// Handler invoked for one request attempt.
using RequestHandler =
    std::function<HandlerOutcome(const RequestContext&, const foundation::Payload&)>;

/// Configuration for RequestScheduler.
struct RequestSchedulerConfig {
    uint32_t workerCount = 10;
    std::size_t maxQueueSize = 1000;

    /// Terminal requests kept for getStatus().
    std::size_t historyCapacity = 1000;

    std::chrono::milliseconds defaultTimeout{30000};
    uint32_t defaultMaxRetries = 3;

    /// Retry n waits min(2^n * backoffUnit, maxBackoff).
    std::chrono::milliseconds backoffUnit{1000};
    std::chrono::milliseconds maxBackoff{60000};

    /// How long a request held back by an open breaker waits before the
    /// breaker is consulted again.
    std::chrono::milliseconds breakerRecheckInterval{250};

    /// How often users with no timestamps left in the hour window are
    /// dropped from the rate limiter; 0 disables the sweep.
    std::chrono::milliseconds rateLimitSweepInterval{60000};

    /// Handler threads; 0 means one per worker.
    std::size_t handlerThreads = 0;

    RateLimiterConfig rateLimits;
    CircuitBreakerConfig breaker;
};

/// Per-worker counters.
struct WorkerStats {
    foundation::WorkerId id;
    uint64_t processed{0};
    std::chrono::milliseconds totalProcessingTime{0};
    std::optional<std::chrono::steady_clock::time_point> lastRequestAt;
    bool busy{false};
};

/// Aggregate scheduler statistics.
struct SchedulerStats {
    uint64_t totalRequests{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timedOut{0};
    uint64_t cancelled{0};
    uint64_t cacheHits{0};

    /// Mean processing time of completed requests.
    double averageProcessingMs{0.0};

    std::size_t queueSize{0};
    std::size_t activeRequests{0};
    std::vector<WorkerStats> workers;

    /// Users with a non-empty hour window.
    std::size_t rateLimitedUsers{0};
    std::size_t openBreakers{0};

    /// Keyed by errorCodeName(): queue_full, rate_limited, circuit_open.
    std::map<std::string, uint64_t> rejectedByReason;
};

/// Entry point of the service.
///
/// submit() runs admission (capacity, rate limit, circuit breaker,
/// deduplication) and queues the request. Workers pop requests in
/// (priority, arrival) order and run the handler registered for the
/// request type on the handler pool, waiting at most until the request
/// deadline.
///
/// Usage:
/// @code
///   RequestScheduler scheduler(RequestSchedulerConfig{.workerCount = 4});
///   scheduler.setDefaultHandler([&](const RequestContext& ctx, const Payload& p) {
///       return optimizer.handle(ctx, p);
///   });
///   (void)scheduler.start();
///   auto id = scheduler.submit({.requestType = "chat", .payload = {{"prompt", "hi"}}});
/// @endcode
///
/// Every accepted request reaches exactly one terminal state.
class RequestScheduler {
public:
    explicit RequestScheduler(
        RequestSchedulerConfig config = {},
        foundation::SluiceMetrics& metrics = foundation::SluiceMetrics::instance());
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&) = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    /// Handler for one request type. Replaces an earlier registration.
    void registerHandler(std::string requestType, RequestHandler handler);

    /// Handler for request types without a registration.
    void setDefaultHandler(RequestHandler handler);

    /// Spawn the workers.
    [[nodiscard]] foundation::SluiceResult<void> start();

    /// Cancel everything queued or in flight and join the workers. Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Admit and queue a request.
    ///
    /// Errors: QueueFull, RateLimited, CircuitOpen, SchedulerStopped.
    /// A duplicate of a queued or in-flight request yields the existing id.
    [[nodiscard]] foundation::SluiceResult<foundation::RequestId> submit(SubmitOptions options);

    /// Cancel a queued or in-flight request. False for unknown or terminal ids.
    bool cancel(foundation::RequestId id);

    /// Queued, active or historical request.
    [[nodiscard]] std::optional<RequestSnapshot> getStatus(foundation::RequestId id) const;

    [[nodiscard]] SchedulerStats stats() const;

    [[nodiscard]] RateLimitStatus rateLimitStatus(const std::string& userId) const;

    /// Users the rate limiter still holds state for.
    [[nodiscard]] std::size_t trackedRateLimitUsers() const;

    [[nodiscard]] std::vector<BreakerStatus> breakerStatus() const;

    /// Breakers, for manual override.
    [[nodiscard]] CircuitBreakerRegistry& breakers();

    [[nodiscard]] std::size_t queueSize() const;

    [[nodiscard]] const RequestSchedulerConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

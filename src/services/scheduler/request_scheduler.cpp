/// @file request_scheduler.cpp
/// @brief RequestScheduler: admission, priority queue, workers and retries.

#include "sluice/service/request_scheduler.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>

#include "sluice/foundation/content_hash.hpp"
#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/job_scheduler.hpp"
#include "sluice/foundation/json_log_formatter.hpp"
#include "sluice/foundation/periodic_task.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::CorrelationScope;
using sluice::foundation::ErrorCode;
using sluice::foundation::HealthStatus;
using sluice::foundation::HistogramBuckets;
using sluice::foundation::JobPriority;
using sluice::foundation::JobScheduler;
using sluice::foundation::LogCategory;
using sluice::foundation::Payload;
using sluice::foundation::PeriodicTask;
using sluice::foundation::RequestId;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;
using sluice::foundation::WorkerId;

using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{20};

constexpr std::string_view kSubmittedTotal = "sluice_requests_submitted_total";
constexpr std::string_view kCompletedTotal = "sluice_requests_completed_total";
constexpr std::string_view kFailedTotal = "sluice_requests_failed_total";
constexpr std::string_view kTimedOutTotal = "sluice_requests_timed_out_total";
constexpr std::string_view kQueueDepth = "sluice_queue_depth";
constexpr std::string_view kBreakersOpen = "sluice_breakers_open";
constexpr std::string_view kLatency = "sluice_request_latency_ms";
constexpr std::string_view kHealthComponent = "scheduler";

/// Scheduler-side state of an accepted request.
struct TrackedRequest {
    RequestSnapshot snapshot;
    Payload payload;

    /// Dedup key; empty when deduplication was not requested.
    std::string fingerprint;

    CancelToken token;
    std::string traceId;
    Clock::time_point readyAt{};

    /// Changes on every (re)queue so stale heap items can be recognized.
    uint64_t sequence{0};

    /// Holds the HalfOpen probe of its breaker.
    bool probe{false};

    [[nodiscard]] Clock::time_point deadline() const {
        return snapshot.createdAt + snapshot.timeout;
    }
};

using TrackedPtr = std::shared_ptr<TrackedRequest>;

struct QueueItem {
    RequestPriority priority;
    Clock::time_point createdAt;
    uint64_t sequence;
    RequestId id;
};

/// Lower priority ordinal first, then arrival, then sequence.
struct QueueOrder {
    bool operator()(const QueueItem& a, const QueueItem& b) const {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.sequence > b.sequence;
    }
};

/// How one handler attempt ended, seen from the worker.
struct Attempt {
    enum class Kind : uint8_t { Finished, DeadlineExceeded, Abandoned };

    Kind kind{Kind::Finished};
    std::optional<HandlerOutcome> outcome;
};

JobPriority toJobPriority(RequestPriority p) {
    switch (p) {
        case RequestPriority::Critical:
            return JobPriority::Critical;
        case RequestPriority::High:
            return JobPriority::High;
        case RequestPriority::Normal:
            return JobPriority::Normal;
        case RequestPriority::Low:
        case RequestPriority::Batch:
            return JobPriority::Low;
    }
    return JobPriority::Normal;
}

std::string describeRequest(const RequestSnapshot& s) {
    return "request " + std::to_string(s.id.value()) + " ('" + s.requestType + "')";
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct RequestScheduler::Impl {
    RequestSchedulerConfig config;
    foundation::SluiceMetrics& metrics;

    RateLimiter limiter;
    CircuitBreakerRegistry breakers;
    std::unique_ptr<JobScheduler> jobs;
    std::unique_ptr<PeriodicTask> limiterSweep;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool running = false;
    bool stopping = false;
    std::vector<std::thread> workers;
    std::vector<WorkerStats> workerStats;

    std::priority_queue<QueueItem, std::vector<QueueItem>, QueueOrder> ready;
    std::vector<QueueItem> delayed;
    std::size_t queued = 0;

    std::unordered_map<RequestId, TrackedPtr> live;
    std::unordered_map<std::string, RequestId> dedup;

    std::deque<RequestId> historyOrder;
    std::unordered_map<RequestId, RequestSnapshot> history;

    std::unordered_map<std::string, RequestHandler> handlers;
    RequestHandler defaultHandler;

    uint64_t nextId = 1;
    uint64_t nextSequence = 1;
    std::size_t active = 0;

    uint64_t totalRequests = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t timedOut = 0;
    uint64_t cancelled = 0;
    uint64_t cacheHits = 0;
    double completedProcessingMs = 0.0;
    std::map<std::string, uint64_t> rejectedByReason;

    Impl(RequestSchedulerConfig cfg, foundation::SluiceMetrics& m)
        : config(std::move(cfg)),
          metrics(m),
          limiter(config.rateLimits),
          breakers(config.breaker) {}

    // ── Admission helpers ───────────────────────────────────────────────

    SluiceResult<RequestId> reject(ErrorCode code, std::string message) {
        std::string reason(foundation::errorCodeName(code));
        ++rejectedByReason[reason];
        metrics.incrementCounter("sluice_requests_rejected_total{reason=\"" + reason + "\"}");
        SLUICE_LOG_INFO(LogCategory::Admission, "rejected: " + message);
        return SluiceResult<RequestId>::err(SluiceError(code, std::move(message)));
    }

    // ── Queue (caller holds mutex) ──────────────────────────────────────

    void pushReady(const TrackedPtr& request) {
        request->sequence = nextSequence++;
        ready.push(QueueItem{request->snapshot.priority, request->snapshot.createdAt,
                             request->sequence, request->snapshot.id});
        ++queued;
    }

    void pushDelayed(const TrackedPtr& request) {
        request->sequence = nextSequence++;
        delayed.push_back(QueueItem{request->snapshot.priority, request->snapshot.createdAt,
                                    request->sequence, request->snapshot.id});
        ++queued;
    }

    [[nodiscard]] TrackedPtr lookupQueued(const QueueItem& item) const {
        auto it = live.find(item.id);
        if (it == live.end() || it->second->sequence != item.sequence ||
            it->second->snapshot.status != RequestStatus::Queued) {
            return nullptr;
        }
        return it->second;
    }

    /// Move delayed items whose backoff (or deadline) has passed into the
    /// ready heap. Returns the earliest remaining wake-up time.
    Clock::time_point promoteDelayed(Clock::time_point now) {
        auto nextWake = Clock::time_point::max();
        auto it = delayed.begin();
        while (it != delayed.end()) {
            auto request = lookupQueued(*it);
            if (!request) {
                it = delayed.erase(it);
                continue;
            }
            auto wake = std::min(request->readyAt, request->deadline());
            if (now >= wake) {
                ready.push(*it);
                it = delayed.erase(it);
            } else {
                nextWake = std::min(nextWake, wake);
                ++it;
            }
        }
        return nextWake;
    }

    TrackedPtr popReady() {
        while (!ready.empty()) {
            auto item = ready.top();
            ready.pop();
            if (auto request = lookupQueued(item)) {
                --queued;
                return request;
            }
        }
        return nullptr;
    }

    // ── Terminal transitions (caller holds mutex) ───────────────────────

    void pushHistory(const RequestSnapshot& snapshot) {
        if (config.historyCapacity == 0) {
            return;
        }
        historyOrder.push_back(snapshot.id);
        history[snapshot.id] = snapshot;
        while (historyOrder.size() > config.historyCapacity) {
            history.erase(historyOrder.front());
            historyOrder.pop_front();
        }
    }

    void finish(const TrackedPtr& request, RequestStatus status,
                std::optional<SluiceError> error, Clock::time_point now) {
        auto& snap = request->snapshot;
        snap.status = status;
        snap.completedAt = now;
        if (error) {
            snap.error = std::move(error);
        }

        switch (status) {
            case RequestStatus::Completed: {
                ++completed;
                if (snap.cacheHit) {
                    ++cacheHits;
                }
                if (auto processing = snap.processingTime()) {
                    completedProcessingMs += static_cast<double>(processing->count());
                }
                metrics.incrementCounter(kCompletedTotal);
                auto latency = std::chrono::duration<double, std::milli>(now - snap.createdAt);
                metrics.recordHistogram(kLatency, latency.count());
                break;
            }
            case RequestStatus::Failed:
                ++failed;
                metrics.incrementCounter(kFailedTotal);
                break;
            case RequestStatus::TimedOut:
                ++timedOut;
                metrics.incrementCounter(kTimedOutTotal);
                break;
            case RequestStatus::Cancelled:
                ++cancelled;
                break;
            case RequestStatus::Queued:
            case RequestStatus::Processing:
                break;
        }

        if (!request->fingerprint.empty()) {
            auto it = dedup.find(request->fingerprint);
            if (it != dedup.end() && it->second == snap.id) {
                dedup.erase(it);
            }
        }
        live.erase(snap.id);
        pushHistory(snap);
        publishGauges();

        SLUICE_LOG_DEBUG(LogCategory::Scheduler,
                         describeRequest(snap) + " -> " + std::string(toString(status)));
    }

    void publishGauges() {
        metrics.setGauge(kQueueDepth, static_cast<double>(queued));
        metrics.setGauge(kBreakersOpen, static_cast<double>(breakers.openCount()));
    }

    [[nodiscard]] std::chrono::milliseconds backoffFor(uint32_t retry) const {
        auto exponent = std::min<uint32_t>(retry, 30);
        auto delay = config.backoffUnit * (int64_t{1} << exponent);
        return std::min(delay, config.maxBackoff);
    }

    [[nodiscard]] RequestHandler handlerFor(const std::string& requestType) const {
        auto it = handlers.find(requestType);
        return it != handlers.end() ? it->second : defaultHandler;
    }

    // ── Workers ─────────────────────────────────────────────────────────

    void workerLoop(std::size_t index) {
        std::unique_lock lock(mutex);
        while (!stopping) {
            auto now = Clock::now();
            auto nextWake = promoteDelayed(now);
            auto request = popReady();
            if (!request) {
                if (nextWake == Clock::time_point::max()) {
                    cv.wait(lock);
                } else {
                    cv.wait_until(lock, nextWake);
                }
                continue;
            }

            CorrelationScope scope(request->traceId);
            auto breaker = breakers.get(request->snapshot.requestType);

            if (now > request->deadline() || request->readyAt > request->deadline()) {
                breaker->recordFailure();
                finish(request, RequestStatus::TimedOut,
                       SluiceError(ErrorCode::TimedOut, "deadline passed before dispatch",
                                   request->snapshot.id),
                       now);
                continue;
            }

            if (!request->probe) {
                auto admission = breaker->tryDispatch();
                if (admission == BreakerAdmission::Rejected) {
                    request->readyAt = now + config.breakerRecheckInterval;
                    pushDelayed(request);
                    continue;
                }
                request->probe = admission == BreakerAdmission::Probe;
            }

            dispatch(index, request, *breaker, lock);
        }
    }

    void dispatch(std::size_t index, const TrackedPtr& request, CircuitBreaker& breaker,
                  std::unique_lock<std::mutex>& lock) {
        const auto startedAt = Clock::now();
        auto& snap = request->snapshot;
        snap.status = RequestStatus::Processing;
        snap.startedAt = startedAt;
        snap.workerId = WorkerId(static_cast<uint32_t>(index + 1));
        ++active;
        workerStats[index].busy = true;
        workerStats[index].lastRequestAt = startedAt;
        publishGauges();

        RequestContext ctx;
        ctx.requestId = snap.id;
        ctx.userId = snap.userId;
        ctx.requestType = snap.requestType;
        ctx.priority = snap.priority;
        ctx.deadline = request->deadline();
        ctx.cancelToken = request->token;
        ctx.traceId = request->traceId;

        auto handler = handlerFor(snap.requestType);
        auto payload = request->payload;

        SLUICE_LOG_DEBUG(LogCategory::Scheduler,
                         describeRequest(snap) + " dispatched to worker " +
                             std::to_string(index + 1) + " (attempt " +
                             std::to_string(snap.retryCount + 1) + ")");

        lock.unlock();
        auto attempt = runHandler(std::move(handler), std::move(ctx), std::move(payload));
        lock.lock();

        settle(index, request, breaker, std::move(attempt), startedAt);
    }

    Attempt runHandler(RequestHandler handler, RequestContext ctx, Payload payload) {
        if (!handler) {
            return Attempt{Attempt::Kind::Finished,
                           HandlerOutcome::fatal(SluiceError(
                               ErrorCode::HandlerMissing,
                               "no handler registered for '" + ctx.requestType + "'",
                               ctx.requestId))};
        }

        auto priority = toJobPriority(ctx.priority);
        auto submitted = jobs->submit<HandlerOutcome>(
            [handler = std::move(handler), ctx, payload = std::move(payload)]() {
                CorrelationScope scope(ctx.traceId);
                return handler(ctx, payload);
            },
            priority);
        if (!submitted) {
            return Attempt{Attempt::Kind::Finished, HandlerOutcome::retryable(submitted.error())};
        }

        auto& future = submitted.value();
        while (future.wait_until(std::min(Clock::now() + kWaitSlice, ctx.deadline)) !=
               std::future_status::ready) {
            if (ctx.cancelled()) {
                return Attempt{Attempt::Kind::Abandoned, std::nullopt};
            }
            if (ctx.expired()) {
                ctx.cancelToken.cancel();
                return Attempt{Attempt::Kind::DeadlineExceeded, std::nullopt};
            }
        }

        try {
            return Attempt{Attempt::Kind::Finished, future.get()};
        } catch (const std::exception& e) {
            SLUICE_LOG_ERROR(LogCategory::Scheduler,
                             "handler for '" + ctx.requestType + "' threw: " + e.what());
            return Attempt{Attempt::Kind::Finished,
                           HandlerOutcome::retryable(
                               SluiceError(ErrorCode::DownstreamError, e.what(), ctx.requestId))};
        }
    }

    void settle(std::size_t index, const TrackedPtr& request, CircuitBreaker& breaker,
                Attempt attempt, Clock::time_point startedAt) {
        const auto now = Clock::now();
        --active;
        auto& worker = workerStats[index];
        worker.busy = false;
        ++worker.processed;
        worker.totalProcessingTime +=
            std::chrono::duration_cast<std::chrono::milliseconds>(now - startedAt);

        auto& snap = request->snapshot;

        // Cancelled while in flight: the late outcome is discarded.
        if (isTerminal(snap.status)) {
            if (request->probe) {
                breaker.releaseProbe();
            }
            publishGauges();
            return;
        }

        if (attempt.kind == Attempt::Kind::Abandoned) {
            if (request->probe) {
                breaker.releaseProbe();
            }
            finish(request, RequestStatus::Cancelled,
                   SluiceError(ErrorCode::Cancelled, "request cancelled", snap.id), now);
            return;
        }

        if (attempt.kind == Attempt::Kind::DeadlineExceeded) {
            breaker.recordFailure();
            SLUICE_LOG_WARN(LogCategory::Scheduler, describeRequest(snap) + " exceeded its deadline");
            finish(request, RequestStatus::TimedOut,
                   SluiceError(ErrorCode::TimedOut, "deadline exceeded during processing", snap.id),
                   now);
            return;
        }

        const auto& outcome = *attempt.outcome;
        switch (outcome.kind()) {
            case HandlerOutcome::Kind::Ok:
                breaker.recordSuccess();
                snap.result = outcome.value();
                snap.cacheHit = outcome.cacheHit();
                finish(request, RequestStatus::Completed, std::nullopt, now);
                return;

            case HandlerOutcome::Kind::Retryable:
                breaker.recordFailure();
                if (snap.retryCount < snap.maxRetries && !stopping) {
                    ++snap.retryCount;
                    auto delay = backoffFor(snap.retryCount);
                    snap.status = RequestStatus::Queued;
                    snap.startedAt.reset();
                    snap.error = outcome.error();
                    request->probe = false;
                    request->readyAt = now + delay;
                    pushDelayed(request);
                    publishGauges();
                    SLUICE_LOG_WARN(LogCategory::Scheduler,
                                    describeRequest(snap) + " failed (" + outcome.error().describe() +
                                        "), retry " + std::to_string(snap.retryCount) + "/" +
                                        std::to_string(snap.maxRetries) + " in " +
                                        std::to_string(delay.count()) + "ms");
                    cv.notify_one();
                    return;
                }
                SLUICE_LOG_ERROR(LogCategory::Scheduler,
                                 describeRequest(snap) + " failed after " +
                                     std::to_string(snap.retryCount) +
                                     " retries: " + outcome.error().describe());
                finish(request, RequestStatus::Failed, outcome.error(), now);
                return;

            case HandlerOutcome::Kind::Fatal:
                breaker.recordFailure();
                SLUICE_LOG_ERROR(LogCategory::Scheduler,
                                 describeRequest(snap) + " failed: " + outcome.error().describe());
                finish(request, RequestStatus::Failed, outcome.error(), now);
                return;
        }
    }
};

// ── Construction / lifecycle ────────────────────────────────────────────────

RequestScheduler::RequestScheduler(RequestSchedulerConfig config, foundation::SluiceMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), metrics)) {
    if (impl_->config.workerCount == 0) {
        impl_->config.workerCount = 1;
    }
    impl_->metrics.registerHistogram(kLatency, HistogramBuckets::defaultLatency());
}

RequestScheduler::~RequestScheduler() {
    stop();
}

void RequestScheduler::registerHandler(std::string requestType, RequestHandler handler) {
    std::lock_guard lock(impl_->mutex);
    impl_->handlers[std::move(requestType)] = std::move(handler);
}

void RequestScheduler::setDefaultHandler(RequestHandler handler) {
    std::lock_guard lock(impl_->mutex);
    impl_->defaultHandler = std::move(handler);
}

SluiceResult<void> RequestScheduler::start() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->running) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TaskAlreadyRunning, "request scheduler already running"));
    }

    auto threads = impl_->config.handlerThreads == 0 ? impl_->config.workerCount
                                                     : impl_->config.handlerThreads;
    impl_->jobs = std::make_unique<JobScheduler>(threads, "sluice_handlers");
    impl_->running = true;
    impl_->stopping = false;

    impl_->workerStats.clear();
    impl_->workers.clear();
    for (uint32_t i = 0; i < impl_->config.workerCount; ++i) {
        impl_->workerStats.push_back(WorkerStats{WorkerId(i + 1)});
    }
    for (std::size_t i = 0; i < impl_->config.workerCount; ++i) {
        impl_->workers.emplace_back([this, i] { impl_->workerLoop(i); });
    }

    if (impl_->config.rateLimitSweepInterval.count() > 0) {
        impl_->limiterSweep = std::make_unique<PeriodicTask>(
            "rate-limit-sweep", impl_->config.rateLimitSweepInterval, [this] {
                auto forgotten = impl_->limiter.sweep();
                if (forgotten > 0) {
                    SLUICE_LOG_DEBUG(LogCategory::Admission,
                                     "forgot " + std::to_string(forgotten) + " idle users");
                }
            });
        auto started = impl_->limiterSweep->start();
        if (!started) {
            SLUICE_LOG_WARN(LogCategory::Admission,
                            "rate limit sweep not started: " + started.error().describe());
        }
    }

    impl_->metrics.setComponentHealth(kHealthComponent, HealthStatus::Healthy);
    impl_->publishGauges();
    SLUICE_LOG_INFO(LogCategory::Scheduler,
                    "request scheduler started with " +
                        std::to_string(impl_->config.workerCount) + " workers");
    return SluiceResult<void>::ok();
}

void RequestScheduler::stop() {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->running) {
            return;
        }
        impl_->running = false;
        impl_->stopping = true;

        std::vector<TrackedPtr> pending;
        pending.reserve(impl_->live.size());
        for (const auto& [id, request] : impl_->live) {
            pending.push_back(request);
        }

        const auto now = Clock::now();
        for (const auto& request : pending) {
            request->token.cancel();
            if (request->snapshot.status == RequestStatus::Queued && request->probe) {
                impl_->breakers.get(request->snapshot.requestType)->releaseProbe();
            }
            impl_->finish(request, RequestStatus::Cancelled,
                          SluiceError(ErrorCode::SchedulerStopped, "request scheduler stopped",
                                      request->snapshot.id),
                          now);
        }

        impl_->ready = decltype(impl_->ready){};
        impl_->delayed.clear();
        impl_->queued = 0;
        impl_->publishGauges();
    }

    impl_->cv.notify_all();
    for (auto& worker : impl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    impl_->workers.clear();

    if (impl_->limiterSweep) {
        impl_->limiterSweep->stop();
        impl_->limiterSweep.reset();
    }

    if (impl_->jobs) {
        impl_->jobs->shutdown();
    }

    impl_->metrics.setComponentHealth(kHealthComponent, HealthStatus::Unhealthy);
    SLUICE_LOG_INFO(LogCategory::Scheduler, "request scheduler stopped");
}

bool RequestScheduler::isRunning() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->running;
}

// ── submit() ────────────────────────────────────────────────────────────────

SluiceResult<RequestId> RequestScheduler::submit(SubmitOptions options) {
    std::unique_lock lock(impl_->mutex);
    auto& d = *impl_;

    if (!d.running) {
        return SluiceResult<RequestId>::err(
            SluiceError(ErrorCode::SchedulerStopped, "request scheduler not running"));
    }

    if (d.queued >= d.config.maxQueueSize) {
        return d.reject(ErrorCode::QueueFull,
                        "queue full (" + std::to_string(d.queued) + " pending)");
    }

    if (!d.limiter.canAdmit(options.userId)) {
        return d.reject(ErrorCode::RateLimited, "rate limit exceeded for '" + options.userId + "'");
    }

    auto breaker = d.breakers.get(options.requestType);
    auto admission = breaker->tryAdmit();
    if (admission == BreakerAdmission::Rejected) {
        return d.reject(ErrorCode::CircuitOpen,
                        "circuit open for '" + options.requestType + "'");
    }

    std::string fingerprint;
    if (options.deduplicate) {
        fingerprint = foundation::requestFingerprint(options.requestType, options.payload);
        auto existing = d.dedup.find(fingerprint);
        if (existing != d.dedup.end()) {
            if (admission == BreakerAdmission::Probe) {
                breaker->releaseProbe();
            }
            d.metrics.incrementCounter(kSubmittedTotal);
            SLUICE_LOG_DEBUG(LogCategory::Admission,
                             "duplicate of request " + std::to_string(existing->second.value()));
            return SluiceResult<RequestId>::ok(existing->second);
        }
    }

    // Only an accepted request uses a rate-limit slot.
    d.limiter.record(options.userId);

    const auto now = Clock::now();
    auto request = std::make_shared<TrackedRequest>();
    auto& snap = request->snapshot;
    snap.id = RequestId(d.nextId++);
    snap.userId = std::move(options.userId);
    snap.requestType = std::move(options.requestType);
    snap.priority = options.priority;
    snap.status = RequestStatus::Queued;
    snap.maxRetries = options.maxRetries.value_or(d.config.defaultMaxRetries);
    snap.timeout = options.timeout.value_or(d.config.defaultTimeout);
    snap.createdAt = now;
    request->payload = std::move(options.payload);
    request->fingerprint = std::move(fingerprint);
    request->traceId = foundation::generateCorrelationId();
    request->readyAt = now;
    request->probe = admission == BreakerAdmission::Probe;

    d.live.emplace(snap.id, request);
    if (!request->fingerprint.empty()) {
        d.dedup.emplace(request->fingerprint, snap.id);
    }
    d.pushReady(request);
    ++d.totalRequests;
    d.metrics.incrementCounter(kSubmittedTotal);
    d.publishGauges();

    auto id = snap.id;
    SLUICE_LOG_DEBUG(LogCategory::Admission,
                     describeRequest(snap) + " queued at priority " +
                         std::string(toString(snap.priority)));
    lock.unlock();

    d.cv.notify_one();
    return SluiceResult<RequestId>::ok(id);
}

// ── cancel() / getStatus() ──────────────────────────────────────────────────

bool RequestScheduler::cancel(RequestId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->live.find(id);
    if (it == impl_->live.end()) {
        return false;
    }

    auto request = it->second;
    if (request->snapshot.status == RequestStatus::Queued) {
        // The heap item goes stale once the request leaves the live map.
        --impl_->queued;
        if (request->probe) {
            impl_->breakers.get(request->snapshot.requestType)->releaseProbe();
        }
    }
    // In flight: the worker releases a held probe when it settles.
    request->token.cancel();
    impl_->finish(request, RequestStatus::Cancelled,
                  SluiceError(ErrorCode::Cancelled, "request cancelled", id), Clock::now());
    return true;
}

std::optional<RequestSnapshot> RequestScheduler::getStatus(RequestId id) const {
    std::lock_guard lock(impl_->mutex);
    if (auto it = impl_->live.find(id); it != impl_->live.end()) {
        return it->second->snapshot;
    }
    if (auto it = impl_->history.find(id); it != impl_->history.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ── Stats ───────────────────────────────────────────────────────────────────

SchedulerStats RequestScheduler::stats() const {
    SchedulerStats s;
    {
        std::lock_guard lock(impl_->mutex);
        const auto& d = *impl_;
        s.totalRequests = d.totalRequests;
        s.completed = d.completed;
        s.failed = d.failed;
        s.timedOut = d.timedOut;
        s.cancelled = d.cancelled;
        s.cacheHits = d.cacheHits;
        s.averageProcessingMs =
            d.completed == 0 ? 0.0 : d.completedProcessingMs / static_cast<double>(d.completed);
        s.queueSize = d.queued;
        s.activeRequests = d.active;
        s.workers = d.workerStats;
        s.rejectedByReason = d.rejectedByReason;
    }
    s.rateLimitedUsers = impl_->limiter.activeUsers();
    s.openBreakers = impl_->breakers.openCount();
    return s;
}

RateLimitStatus RequestScheduler::rateLimitStatus(const std::string& userId) const {
    return impl_->limiter.status(userId);
}

std::size_t RequestScheduler::trackedRateLimitUsers() const {
    return impl_->limiter.trackedUsers();
}

std::vector<BreakerStatus> RequestScheduler::breakerStatus() const {
    return impl_->breakers.snapshot();
}

CircuitBreakerRegistry& RequestScheduler::breakers() {
    return impl_->breakers;
}

std::size_t RequestScheduler::queueSize() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->queued;
}

const RequestSchedulerConfig& RequestScheduler::config() const noexcept {
    return impl_->config;
}

} // namespace sluice::service

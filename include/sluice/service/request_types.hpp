#pragma once

/// @file request_types.hpp
/// @brief Request priorities, statuses, handler outcomes and the per-request
///        execution context shared by the scheduler and its handlers.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/types.hpp"

namespace sluice::service {

// ── Enums ───────────────────────────────────────────────────────────────────

/// Dispatch priority; a lower ordinal always runs first.
enum class RequestPriority : uint8_t {
    Critical = 1,
    High = 2,
    Normal = 3,
    Low = 4,
    Batch = 5
};

/// Request lifecycle state. Completed, Failed, Cancelled and TimedOut are
/// terminal.
enum class RequestStatus : uint8_t {
    Queued,
    Processing,
    Completed,
    Failed,
    Cancelled,
    TimedOut
};

[[nodiscard]] constexpr bool isTerminal(RequestStatus s) noexcept {
    return s == RequestStatus::Completed || s == RequestStatus::Failed ||
           s == RequestStatus::Cancelled || s == RequestStatus::TimedOut;
}

[[nodiscard]] constexpr std::string_view toString(RequestStatus s) {
    switch (s) {
        case RequestStatus::Queued:
            return "queued";
        case RequestStatus::Processing:
            return "processing";
        case RequestStatus::Completed:
            return "completed";
        case RequestStatus::Failed:
            return "failed";
        case RequestStatus::Cancelled:
            return "cancelled";
        case RequestStatus::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view toString(RequestPriority p) {
    switch (p) {
        case RequestPriority::Critical:
            return "critical";
        case RequestPriority::High:
            return "high";
        case RequestPriority::Normal:
            return "normal";
        case RequestPriority::Low:
            return "low";
        case RequestPriority::Batch:
            return "batch";
    }
    return "unknown";
}

// ── RequestContext ──────────────────────────────────────────────────────────

/// Cooperative cancellation flag shared between a request and its handler.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// What a handler knows about the request it is running.
struct RequestContext {
    using Clock = std::chrono::steady_clock;

    foundation::RequestId requestId;
    std::string userId;
    std::string requestType;
    RequestPriority priority{RequestPriority::Normal};

    /// createdAt + timeout; covers queue wait and execution.
    Clock::time_point deadline{Clock::time_point::max()};

    CancelToken cancelToken;

    /// Correlation id of the request, for logs emitted by the handler.
    std::string traceId;

    [[nodiscard]] bool cancelled() const noexcept { return cancelToken.cancelled(); }

    [[nodiscard]] bool expired() const noexcept { return Clock::now() >= deadline; }

    /// Time left before the deadline, never negative.
    [[nodiscard]] std::chrono::milliseconds remaining() const {
        auto now = Clock::now();
        if (now >= deadline) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    }

    /// A context with no deadline and a fresh token (tests, direct calls).
    [[nodiscard]] static RequestContext unbounded() { return RequestContext{}; }

    [[nodiscard]] static RequestContext withTimeout(std::chrono::milliseconds timeout) {
        RequestContext ctx;
        ctx.deadline = Clock::now() + timeout;
        return ctx;
    }
};

// ── HandlerOutcome ──────────────────────────────────────────────────────────

/// Result of a request handler: Ok(value), Retryable(error) or Fatal(error).
class HandlerOutcome {
public:
    enum class Kind : uint8_t { Ok, Retryable, Fatal };

    [[nodiscard]] static HandlerOutcome ok(std::string value, bool cacheHit = false) {
        HandlerOutcome o(Kind::Ok);
        o.value_ = std::move(value);
        o.cacheHit_ = cacheHit;
        return o;
    }

    [[nodiscard]] static HandlerOutcome retryable(foundation::SluiceError error) {
        HandlerOutcome o(Kind::Retryable);
        o.error_ = std::move(error);
        return o;
    }

    [[nodiscard]] static HandlerOutcome fatal(foundation::SluiceError error) {
        HandlerOutcome o(Kind::Fatal);
        o.error_ = std::move(error);
        return o;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isOk() const noexcept { return kind_ == Kind::Ok; }

    /// Result text (empty unless Ok).
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    /// Error (default-constructed when Ok).
    [[nodiscard]] const foundation::SluiceError& error() const noexcept { return error_; }

    [[nodiscard]] bool cacheHit() const noexcept { return cacheHit_; }

private:
    explicit HandlerOutcome(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string value_;
    foundation::SluiceError error_;
    bool cacheHit_{false};
};

// ── Submission / status ─────────────────────────────────────────────────────

/// Arguments of RequestScheduler::submit().
struct SubmitOptions {
    std::string requestType;
    foundation::Payload payload;
    std::string userId = "anonymous";
    RequestPriority priority = RequestPriority::Normal;

    /// Deadline budget; unset uses the scheduler default.
    std::optional<std::chrono::milliseconds> timeout;

    bool deduplicate = true;

    /// Unset uses the scheduler default.
    std::optional<uint32_t> maxRetries;
};

/// Read-only view of a request, returned by getStatus().
struct RequestSnapshot {
    using Clock = std::chrono::steady_clock;

    foundation::RequestId id;
    std::string userId;
    std::string requestType;
    RequestPriority priority{RequestPriority::Normal};
    RequestStatus status{RequestStatus::Queued};

    uint32_t retryCount{0};
    uint32_t maxRetries{0};

    std::optional<std::string> result;
    std::optional<foundation::SluiceError> error;
    bool cacheHit{false};

    Clock::time_point createdAt{};
    std::optional<Clock::time_point> startedAt;
    std::optional<Clock::time_point> completedAt;
    std::chrono::milliseconds timeout{0};

    foundation::WorkerId workerId;

    /// Completed - started, when both are known.
    [[nodiscard]] std::optional<std::chrono::milliseconds> processingTime() const {
        if (!startedAt || !completedAt) {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(*completedAt - *startedAt);
    }
};

} // namespace sluice::service

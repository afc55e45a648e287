#pragma once

/// @file rate_limiter.hpp
/// @brief Per-user sliding-window rate limiter with minute and hour windows.

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sluice::service {

/// Limits and window lengths for RateLimiter.
struct RateLimiterConfig {
    uint32_t limitPerMinute = 60;
    uint32_t limitPerHour = 1000;

    /// Window lengths; only shortened in tests.
    std::chrono::milliseconds minuteWindow{std::chrono::minutes(1)};
    std::chrono::milliseconds hourWindow{std::chrono::hours(1)};
};

/// Remaining allowance for one user.
struct RateLimitStatus {
    uint32_t remainingPerMinute{0};
    uint32_t remainingPerHour{0};
    bool limited{false};
};

/// Sliding-window rate limiter keyed by user id.
///
/// A rejected attempt records nothing, so it does not consume a slot.
/// Callers that run further admission checks use canAdmit() first and
/// record() once the request is actually accepted.
///
/// Example:
/// @code
///   RateLimiter limiter(RateLimiterConfig{.limitPerMinute = 5});
///   if (!limiter.canAdmit("alice")) {
///       // Rate limit exceeded
///   }
///   // ... remaining admission checks ...
///   limiter.record("alice");
/// @endcode
class RateLimiter {
public:
    explicit RateLimiter(RateLimiterConfig config = {});

    /// Check and record in one step.
    /// Returns true if the attempt is allowed, false if either window is full.
    [[nodiscard]] bool allow(const std::string& userId);

    /// Whether an attempt by @p userId would be allowed now. Records nothing.
    [[nodiscard]] bool canAdmit(const std::string& userId) const;

    /// Charge one slot to @p userId, regardless of the limits.
    void record(const std::string& userId);

    /// Remaining allowance in both windows.
    [[nodiscard]] RateLimitStatus status(const std::string& userId) const;

    /// Number of users with at least one timestamp in the hour window.
    [[nodiscard]] std::size_t activeUsers() const;

    /// Number of users with an entry, including ones not yet swept.
    [[nodiscard]] std::size_t trackedUsers() const;

    /// Drop expired timestamps for every user and forget idle users.
    /// @return Number of users forgotten.
    std::size_t sweep();

    /// Forget all attempts for @p userId.
    void reset(const std::string& userId);

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    /// Drop timestamps older than the hour window.
    void purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const;

    /// Both windows have room. Expects @p timestamps already purged.
    [[nodiscard]] bool hasRoom(const std::deque<TimePoint>& timestamps, TimePoint now) const;

    /// Timestamps inside the minute window (the deque is chronological).
    [[nodiscard]] std::size_t countRecent(const std::deque<TimePoint>& timestamps,
                                          TimePoint now) const;

    RateLimiterConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<TimePoint>> attempts_;
};

} // namespace sluice::service

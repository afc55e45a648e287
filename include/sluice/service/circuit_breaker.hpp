#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-request-type circuit breakers for admission control.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// so that a failing request type stops being dispatched until its
/// recovery timeout has elapsed.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sluice::service {

/// Configuration shared by every breaker in a registry.
struct CircuitBreakerConfig {
    /// Number of consecutive failures before the circuit opens.
    uint32_t failureThreshold = 5;

    /// Duration the circuit stays open before admitting a probe.
    std::chrono::milliseconds recoveryTimeout{60000};
};

/// Outcome of CircuitBreaker::tryAdmit().
enum class BreakerAdmission : uint8_t {
    Allowed,  ///< Closed circuit; request passes.
    Probe,    ///< HalfOpen circuit; this request is the single recovery probe.
    Rejected  ///< Open circuit, or a probe is already outstanding.
};

/// Circuit breaker state machine for one request type.
///
/// Usage:
/// @code
///   CircuitBreaker cb("chat", CircuitBreakerConfig{.failureThreshold = 3});
///   if (cb.tryAdmit() != BreakerAdmission::Rejected) {
///       auto outcome = runHandler();
///       outcome ? cb.recordSuccess() : cb.recordFailure();
///   }
/// @endcode
///
/// HalfOpen admits exactly one probe. Its success closes the circuit, its
/// failure re-opens it; until then every other request is rejected.
///
/// Thread-safe: all state transitions use a mutex.
class CircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe outstanding or pending.
    };

    explicit CircuitBreaker(std::string key, CircuitBreakerConfig config = {});

    /// Decide whether a new request may be admitted.
    ///
    /// An Open circuit whose recovery timeout has elapsed moves to HalfOpen
    /// and hands out the probe.
    [[nodiscard]] BreakerAdmission tryAdmit();

    /// Same decision as tryAdmit() for an already admitted request about to
    /// be dispatched; a rejection here is not counted.
    [[nodiscard]] BreakerAdmission tryDispatch();

    /// Record a successful outcome. Closes a HalfOpen circuit.
    void recordSuccess();

    /// Record a failed outcome. May open the circuit; re-opens a HalfOpen one.
    void recordFailure();

    /// Give the probe slot back without an outcome (probe cancelled or
    /// merged into an existing request).
    void releaseProbe();

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] State state() const;

    /// Number of consecutive failures.
    [[nodiscard]] uint32_t failureCount() const;

    /// Total number of requests rejected by this breaker.
    [[nodiscard]] uint64_t rejectedCount() const;

    [[nodiscard]] bool probeOutstanding() const;

    [[nodiscard]] std::string_view key() const;

private:
    BreakerAdmission admit(bool countRejection);
    void transitionTo(State newState);

    std::string key_;
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint32_t consecutiveFailures_{0};
    uint64_t totalRejected_{0};
    bool probeOutstanding_{false};
    std::chrono::steady_clock::time_point openedAt_{};
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

/// Snapshot of one breaker, for stats output.
struct BreakerStatus {
    std::string key;
    CircuitBreaker::State state{CircuitBreaker::State::Closed};
    uint32_t failureCount{0};
    uint64_t rejectedCount{0};
};

/// Lazily created breakers keyed by request type.
///
/// The registry lock only guards the map; each breaker has its own lock.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig config = {});

    /// Breaker for @p key, created Closed on first use.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(const std::string& key);

    /// Breaker for @p key if it exists.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(const std::string& key) const;

    /// Number of breakers currently Open or HalfOpen.
    [[nodiscard]] std::size_t openCount() const;

    [[nodiscard]] std::vector<BreakerStatus> snapshot() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace sluice::service

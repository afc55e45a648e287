/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine and per-key registry.

#include "sluice/service/circuit_breaker.hpp"

#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::LogCategory;

// ── CircuitBreaker ──────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(std::string key, CircuitBreakerConfig config)
    : key_(std::move(key)), config_(config) {}

BreakerAdmission CircuitBreaker::tryAdmit() {
    return admit(true);
}

BreakerAdmission CircuitBreaker::tryDispatch() {
    return admit(false);
}

BreakerAdmission CircuitBreaker::admit(bool countRejection) {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            return BreakerAdmission::Allowed;

        case State::Open: {
            auto elapsed = std::chrono::steady_clock::now() - openedAt_;
            if (elapsed >= config_.recoveryTimeout) {
                transitionTo(State::HalfOpen);
                probeOutstanding_ = true;
                return BreakerAdmission::Probe;
            }
            break;
        }

        case State::HalfOpen:
            if (!probeOutstanding_) {
                probeOutstanding_ = true;
                return BreakerAdmission::Probe;
            }
            break;
    }

    if (countRejection) {
        ++totalRejected_;
    }
    return BreakerAdmission::Rejected;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            consecutiveFailures_ = 0;
            break;

        case State::HalfOpen:
            transitionTo(State::Closed);
            SLUICE_LOG_INFO(LogCategory::Admission, "circuit closed for '" + key_ + "'");
            break;

        case State::Open:
            // Late outcome of a request admitted before the circuit opened.
            break;
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            ++consecutiveFailures_;
            if (consecutiveFailures_ >= config_.failureThreshold) {
                transitionTo(State::Open);
                SLUICE_LOG_WARN(LogCategory::Admission,
                                "circuit opened for '" + key_ + "' after " +
                                    std::to_string(consecutiveFailures_) + " failures");
            }
            break;

        case State::HalfOpen:
            ++consecutiveFailures_;
            transitionTo(State::Open);
            SLUICE_LOG_WARN(LogCategory::Admission, "probe failed, circuit re-opened for '" + key_ + "'");
            break;

        case State::Open:
            ++consecutiveFailures_;
            break;
    }
}

void CircuitBreaker::releaseProbe() {
    std::lock_guard lock(mutex_);
    if (state_ == State::HalfOpen) {
        probeOutstanding_ = false;
    }
}

void CircuitBreaker::forceState(State newState) {
    std::lock_guard lock(mutex_);
    transitionTo(newState);
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = State::Closed;
    consecutiveFailures_ = 0;
    totalRejected_ = 0;
    probeOutstanding_ = false;
    openedAt_ = {};
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    return consecutiveFailures_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

bool CircuitBreaker::probeOutstanding() const {
    std::lock_guard lock(mutex_);
    return probeOutstanding_;
}

std::string_view CircuitBreaker::key() const {
    return key_;
}

void CircuitBreaker::transitionTo(State newState) {
    state_ = newState;
    probeOutstanding_ = false;
    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
    } else if (newState == State::Open) {
        // Recovery timeout counts from the moment the circuit opens.
        openedAt_ = std::chrono::steady_clock::now();
    }
}

// ── CircuitBreakerRegistry ──────────────────────────────────────────────────

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig config)
    : config_(config) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto& slot = breakers_[key];
    if (!slot) {
        slot = std::make_shared<CircuitBreaker>(key, config_);
    }
    return slot;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = breakers_.find(key);
    return it == breakers_.end() ? nullptr : it->second;
}

std::size_t CircuitBreakerRegistry::openCount() const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [key, breaker] : breakers_) {
        if (breaker->state() != CircuitBreaker::State::Closed) {
            ++count;
        }
    }
    return count;
}

std::vector<BreakerStatus> CircuitBreakerRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<BreakerStatus> out;
    out.reserve(breakers_.size());
    for (const auto& [key, breaker] : breakers_) {
        out.push_back(BreakerStatus{key, breaker->state(), breaker->failureCount(),
                                    breaker->rejectedCount()});
    }
    return out;
}

} // namespace sluice::service

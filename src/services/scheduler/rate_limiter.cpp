/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "sluice/service/rate_limiter.hpp"

#include <algorithm>
#include <iterator>

namespace sluice::service {

RateLimiter::RateLimiter(RateLimiterConfig config)
    : config_(config) {}

bool RateLimiter::allow(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    auto it = attempts_.find(userId);
    if (it != attempts_.end()) {
        purgeExpired(it->second, now);
        if (!hasRoom(it->second, now)) {
            return false;
        }
        it->second.push_back(now);
        return true;
    }

    std::deque<TimePoint> fresh;
    if (!hasRoom(fresh, now)) {
        return false;
    }
    fresh.push_back(now);
    attempts_.emplace(userId, std::move(fresh));
    return true;
}

bool RateLimiter::canAdmit(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    auto it = attempts_.find(userId);
    if (it == attempts_.end()) {
        return hasRoom({}, now);
    }
    auto timestamps = it->second;  // copy to purge
    purgeExpired(timestamps, now);
    return hasRoom(timestamps, now);
}

void RateLimiter::record(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    auto& timestamps = attempts_[userId];
    purgeExpired(timestamps, now);
    timestamps.push_back(now);
}

RateLimitStatus RateLimiter::status(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimitStatus s{config_.limitPerMinute, config_.limitPerHour, false};

    auto it = attempts_.find(userId);
    if (it == attempts_.end()) {
        s.limited = config_.limitPerMinute == 0 || config_.limitPerHour == 0;
        return s;
    }

    const auto now = std::chrono::steady_clock::now();
    auto timestamps = it->second;  // copy to purge
    purgeExpired(timestamps, now);

    auto usedHour = static_cast<uint32_t>(timestamps.size());
    auto usedMinute = static_cast<uint32_t>(countRecent(timestamps, now));

    s.remainingPerMinute = usedMinute >= config_.limitPerMinute ? 0u : config_.limitPerMinute - usedMinute;
    s.remainingPerHour = usedHour >= config_.limitPerHour ? 0u : config_.limitPerHour - usedHour;
    s.limited = s.remainingPerMinute == 0 || s.remainingPerHour == 0;
    return s;
}

std::size_t RateLimiter::activeUsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = std::chrono::steady_clock::now() - config_.hourWindow;
    return static_cast<std::size_t>(std::count_if(
        attempts_.begin(), attempts_.end(), [cutoff](const auto& entry) {
            return !entry.second.empty() && entry.second.back() >= cutoff;
        }));
}

std::size_t RateLimiter::trackedUsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_.size();
}

std::size_t RateLimiter::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    std::size_t forgotten = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        purgeExpired(it->second, now);
        if (it->second.empty()) {
            it = attempts_.erase(it);
            ++forgotten;
        } else {
            ++it;
        }
    }
    return forgotten;
}

void RateLimiter::reset(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.erase(userId);
}

bool RateLimiter::hasRoom(const std::deque<TimePoint>& timestamps, TimePoint now) const {
    return timestamps.size() < static_cast<std::size_t>(config_.limitPerHour) &&
           countRecent(timestamps, now) < static_cast<std::size_t>(config_.limitPerMinute);
}

void RateLimiter::purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const {
    auto cutoff = now - config_.hourWindow;
    while (!timestamps.empty() && timestamps.front() < cutoff) {
        timestamps.pop_front();
    }
}

std::size_t RateLimiter::countRecent(const std::deque<TimePoint>& timestamps, TimePoint now) const {
    auto cutoff = now - config_.minuteWindow;
    auto first = std::lower_bound(timestamps.begin(), timestamps.end(), cutoff);
    return static_cast<std::size_t>(std::distance(first, timestamps.end()));
}

} // namespace sluice::service

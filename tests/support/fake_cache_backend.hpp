#pragma once

/// @file fake_cache_backend.hpp
/// @brief In-memory CacheBackend that can be switched into a failing state.

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "sluice/service/cache_backend.hpp"

namespace sluice::test {

struct FakeCacheState {
    std::mutex mutex;
    std::map<std::string, std::pair<std::string, std::chrono::steady_clock::time_point>> data;
    std::atomic<bool> down{false};
    std::atomic<int> gets{0};
    std::atomic<int> sets{0};
    std::atomic<int> pings{0};

    bool contains(const std::string& key) {
        std::lock_guard lock(mutex);
        return data.count(key) > 0;
    }

    std::size_t size() {
        std::lock_guard lock(mutex);
        return data.size();
    }
};

class FakeCacheBackend final : public service::CacheBackend {
public:
    explicit FakeCacheBackend(std::shared_ptr<FakeCacheState> state) : state_(std::move(state)) {}

    foundation::SluiceResult<std::optional<std::string>> get(const std::string& key) override {
        using R = foundation::SluiceResult<std::optional<std::string>>;
        ++state_->gets;
        if (state_->down) {
            return R::err(unavailable());
        }
        std::lock_guard lock(state_->mutex);
        auto it = state_->data.find(key);
        if (it == state_->data.end() || std::chrono::steady_clock::now() >= it->second.second) {
            return R::ok(std::nullopt);
        }
        return R::ok(it->second.first);
    }

    foundation::SluiceResult<void> set(const std::string& key, std::string_view value,
                                       std::chrono::milliseconds ttl) override {
        ++state_->sets;
        if (state_->down) {
            return foundation::SluiceResult<void>::err(unavailable());
        }
        std::lock_guard lock(state_->mutex);
        state_->data[key] = {std::string(value), std::chrono::steady_clock::now() + ttl};
        return foundation::SluiceResult<void>::ok();
    }

    foundation::SluiceResult<int64_t> deleteMatching(const std::string& pattern) override {
        if (state_->down) {
            return foundation::SluiceResult<int64_t>::err(unavailable());
        }
        // Only trailing-star patterns are used by ResponseCache::invalidate().
        auto prefix = pattern.substr(0, pattern.find('*'));
        std::lock_guard lock(state_->mutex);
        int64_t removed = 0;
        for (auto it = state_->data.begin(); it != state_->data.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = state_->data.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return foundation::SluiceResult<int64_t>::ok(removed);
    }

    foundation::SluiceResult<void> flush() override {
        if (state_->down) {
            return foundation::SluiceResult<void>::err(unavailable());
        }
        std::lock_guard lock(state_->mutex);
        state_->data.clear();
        return foundation::SluiceResult<void>::ok();
    }

    foundation::SluiceResult<void> ping() override {
        ++state_->pings;
        if (state_->down) {
            return foundation::SluiceResult<void>::err(unavailable());
        }
        return foundation::SluiceResult<void>::ok();
    }

    std::string_view name() const override { return "fake"; }

private:
    static foundation::SluiceError unavailable() {
        return foundation::SluiceError(foundation::ErrorCode::CacheUnavailable, "connection refused");
    }

    std::shared_ptr<FakeCacheState> state_;
};

} // namespace sluice::test

#pragma once

/// @file redis_cache_backend.hpp
/// @brief CacheBackend over Redis, using redis++.

#include <chrono>
#include <memory>
#include <string>

#include "sluice/service/cache_backend.hpp"

namespace sluice::service {

/// Connection settings for RedisCacheBackend.
struct RedisBackendConfig {
    /// e.g. "redis://127.0.0.1:6379/0"
    std::string url = "redis://127.0.0.1:6379";

    std::chrono::milliseconds connectTimeout{1500};
    std::chrono::milliseconds socketTimeout{1000};

    /// redis++ connection pool size.
    std::size_t poolSize = 4;

    /// SCAN batch hint used by deleteMatching().
    long long scanCount = 100;
};

/// Redis-backed primary cache.
///
/// Every redis++ exception is caught here and returned as a SluiceError
/// (CacheUnavailable for I/O and timeout errors, CacheBackendError otherwise).
class RedisCacheBackend final : public CacheBackend {
public:
    explicit RedisCacheBackend(RedisBackendConfig config);
    ~RedisCacheBackend() override;

    RedisCacheBackend(const RedisCacheBackend&) = delete;
    RedisCacheBackend& operator=(const RedisCacheBackend&) = delete;

    /// Create the client and verify it with a ping.
    [[nodiscard]] static foundation::SluiceResult<std::unique_ptr<CacheBackend>> connect(
        RedisBackendConfig config);

    [[nodiscard]] foundation::SluiceResult<std::optional<std::string>> get(
        const std::string& key) override;

    [[nodiscard]] foundation::SluiceResult<void> set(const std::string& key,
                                                     std::string_view value,
                                                     std::chrono::milliseconds ttl) override;

    [[nodiscard]] foundation::SluiceResult<int64_t> deleteMatching(
        const std::string& pattern) override;

    [[nodiscard]] foundation::SluiceResult<void> flush() override;

    [[nodiscard]] foundation::SluiceResult<void> ping() override;

    [[nodiscard]] std::string_view name() const override { return "redis"; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

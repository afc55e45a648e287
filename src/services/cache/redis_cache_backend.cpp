/// @file redis_cache_backend.cpp
/// @brief RedisCacheBackend implementation (redis++ hidden behind PIMPL).

#include "sluice/service/redis_cache_backend.hpp"

#include <iterator>
#include <vector>

#include <sw/redis++/redis++.h>

#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::ErrorCode;
using sluice::foundation::LogCategory;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

namespace {

/// Map a redis++ exception to a SluiceError.
SluiceError toSluiceError(const sw::redis::Error& e, std::string_view op) {
    std::string message = "redis " + std::string(op) + ": " + e.what();
    if (dynamic_cast<const sw::redis::IoError*>(&e) != nullptr ||
        dynamic_cast<const sw::redis::TimeoutError*>(&e) != nullptr ||
        dynamic_cast<const sw::redis::ClosedError*>(&e) != nullptr) {
        return SluiceError(ErrorCode::CacheUnavailable, std::move(message));
    }
    return SluiceError(ErrorCode::CacheBackendError, std::move(message));
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct RedisCacheBackend::Impl {
    RedisBackendConfig config;
    std::unique_ptr<sw::redis::Redis> redis;
};

RedisCacheBackend::RedisCacheBackend(RedisBackendConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);

    sw::redis::ConnectionOptions opts(impl_->config.url);
    opts.connect_timeout = impl_->config.connectTimeout;
    opts.socket_timeout = impl_->config.socketTimeout;

    sw::redis::ConnectionPoolOptions poolOpts;
    poolOpts.size = impl_->config.poolSize;

    // Construction is lazy; no connection is attempted until the first command.
    impl_->redis = std::make_unique<sw::redis::Redis>(opts, poolOpts);
}

RedisCacheBackend::~RedisCacheBackend() = default;

// ── connect() ───────────────────────────────────────────────────────────────

SluiceResult<std::unique_ptr<CacheBackend>> RedisCacheBackend::connect(RedisBackendConfig config) {
    using R = SluiceResult<std::unique_ptr<CacheBackend>>;

    std::unique_ptr<RedisCacheBackend> backend;
    try {
        backend = std::make_unique<RedisCacheBackend>(std::move(config));
    } catch (const sw::redis::Error& e) {
        return R::err(toSluiceError(e, "connect"));
    }

    auto pong = backend->ping();
    if (!pong) {
        return R::err(pong.error());
    }

    SLUICE_LOG_INFO(LogCategory::Cache, "connected to redis at " + backend->impl_->config.url);
    return R::ok(std::move(backend));
}

// ── Commands ────────────────────────────────────────────────────────────────

SluiceResult<std::optional<std::string>> RedisCacheBackend::get(const std::string& key) {
    using R = SluiceResult<std::optional<std::string>>;
    try {
        auto value = impl_->redis->get(key);
        if (!value) {
            return R::ok(std::nullopt);
        }
        return R::ok(std::optional<std::string>(std::move(*value)));
    } catch (const sw::redis::Error& e) {
        return R::err(toSluiceError(e, "GET"));
    }
}

SluiceResult<void> RedisCacheBackend::set(const std::string& key,
                                          std::string_view value,
                                          std::chrono::milliseconds ttl) {
    try {
        impl_->redis->psetex(key, ttl, std::string(value));
        return SluiceResult<void>::ok();
    } catch (const sw::redis::Error& e) {
        return SluiceResult<void>::err(toSluiceError(e, "PSETEX"));
    }
}

SluiceResult<int64_t> RedisCacheBackend::deleteMatching(const std::string& pattern) {
    try {
        long long cursor = 0;
        int64_t deleted = 0;
        do {
            std::vector<std::string> keys;
            cursor = impl_->redis->scan(cursor, pattern, impl_->config.scanCount,
                                        std::back_inserter(keys));
            if (!keys.empty()) {
                deleted += impl_->redis->del(keys.begin(), keys.end());
            }
        } while (cursor != 0);
        return SluiceResult<int64_t>::ok(deleted);
    } catch (const sw::redis::Error& e) {
        return SluiceResult<int64_t>::err(toSluiceError(e, "SCAN/DEL"));
    }
}

SluiceResult<void> RedisCacheBackend::flush() {
    try {
        impl_->redis->flushdb();
        return SluiceResult<void>::ok();
    } catch (const sw::redis::Error& e) {
        return SluiceResult<void>::err(toSluiceError(e, "FLUSHDB"));
    }
}

SluiceResult<void> RedisCacheBackend::ping() {
    try {
        impl_->redis->ping();
        return SluiceResult<void>::ok();
    } catch (const sw::redis::Error& e) {
        return SluiceResult<void>::err(toSluiceError(e, "PING"));
    }
}

} // namespace sluice::service

#pragma once

/// @file cache_backend.hpp
/// @brief Abstract primary cache backend used by ResponseCache.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "sluice/foundation/sluice_result.hpp"

namespace sluice::service {

/// External key/value store with per-key expiry.
///
/// Implementations report every failure as CacheUnavailable or
/// CacheBackendError; ResponseCache treats both as "use the fallback".
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /// Value for @p key, or nullopt when absent or expired.
    [[nodiscard]] virtual foundation::SluiceResult<std::optional<std::string>> get(
        const std::string& key) = 0;

    /// Store @p value under @p key, expiring after @p ttl.
    [[nodiscard]] virtual foundation::SluiceResult<void> set(const std::string& key,
                                                             std::string_view value,
                                                             std::chrono::milliseconds ttl) = 0;

    /// Delete every key matching the glob @p pattern.
    /// @return Number of keys deleted.
    [[nodiscard]] virtual foundation::SluiceResult<int64_t> deleteMatching(
        const std::string& pattern) = 0;

    /// Delete everything in the backend's keyspace.
    [[nodiscard]] virtual foundation::SluiceResult<void> flush() = 0;

    /// Round-trip health probe.
    [[nodiscard]] virtual foundation::SluiceResult<void> ping() = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sluice::service

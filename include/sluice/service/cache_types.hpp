#pragma once

/// @file cache_types.hpp
/// @brief Cache categories, their policy table, and cache entry shape.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sluice::service {

/// Kind of cached data; each kind has its own TTL and fallback capacity.
enum class CacheCategory : uint8_t {
    ModelResponse,
    UserSession,
    SystemData,
    Embedding
};

inline constexpr std::size_t kCacheCategoryCount = 4;

inline constexpr std::array<CacheCategory, kCacheCategoryCount> kAllCacheCategories = {
    CacheCategory::ModelResponse,
    CacheCategory::UserSession,
    CacheCategory::SystemData,
    CacheCategory::Embedding,
};

/// Name used in cache keys and config ("model_responses", ...).
[[nodiscard]] constexpr std::string_view toString(CacheCategory category) {
    switch (category) {
        case CacheCategory::ModelResponse:
            return "model_responses";
        case CacheCategory::UserSession:
            return "user_sessions";
        case CacheCategory::SystemData:
            return "system_data";
        case CacheCategory::Embedding:
            return "embeddings";
    }
    return "unknown";
}

[[nodiscard]] std::optional<CacheCategory> parseCacheCategory(std::string_view name);

/// Per-category caching policy.
struct CachePolicy {
    std::chrono::milliseconds ttl{std::chrono::hours(1)};
    std::size_t maxFallbackEntries = 1000;
    double costPerHit = 0.0;
};

/// Policy table indexed by CacheCategory.
using CachePolicyTable = std::array<CachePolicy, kCacheCategoryCount>;

/// Built-in policies:
///   model_responses 1 h / 10000 / 0.02, user_sessions 2 h / 5000 / 0,
///   system_data 24 h / 1000 / 0, embeddings 7 d / 50000 / 0.001.
[[nodiscard]] CachePolicyTable defaultCachePolicies();

[[nodiscard]] constexpr std::size_t categoryIndex(CacheCategory category) noexcept {
    return static_cast<std::size_t>(category);
}

/// One cached value as held by the in-process fallback.
struct CacheEntry {
    using Clock = std::chrono::steady_clock;

    std::string key;
    std::string value;
    CacheCategory category{CacheCategory::ModelResponse};
    Clock::time_point createdAt{};
    Clock::time_point expiresAt{};
    uint64_t accessCount{0};

    [[nodiscard]] bool expired(Clock::time_point now) const noexcept { return now >= expiresAt; }
};

} // namespace sluice::service

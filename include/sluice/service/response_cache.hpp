#pragma once

/// @file response_cache.hpp
/// @brief Two-level response cache: external primary backend plus an
///        in-process FIFO fallback.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/foundation/sluice_result.hpp"
#include "sluice/foundation/types.hpp"
#include "sluice/service/cache_backend.hpp"
#include "sluice/service/cache_types.hpp"

namespace sluice::service {

/// Configuration for ResponseCache.
struct ResponseCacheConfig {
    /// First segment of every key.
    std::string keyNamespace = "sluice";

    CachePolicyTable policies = defaultCachePolicies();

    /// Downstream latency a hit is assumed to avoid (for time-saved stats).
    std::chrono::milliseconds estimatedDownstreamLatency{2000};

    /// Interval of the primary health probe; zero disables the task.
    std::chrono::milliseconds primaryCheckInterval{30000};
};

/// Cache bookkeeping snapshot.
struct CacheStats {
    uint64_t totalRequests{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t sets{0};
    uint64_t errors{0};
    double hitRate{0.0};             ///< percent
    double costSaved{0.0};
    double timeSavedSeconds{0.0};
    std::map<std::string, uint64_t> categoryHits;
    bool primaryAvailable{false};
    std::size_t fallbackSize{0};
};

/// Response cache with a primary CacheBackend and an in-process fallback.
///
/// Reads and writes go to the primary while it is reachable. Any primary
/// error switches to degraded mode (logged once, health "cache" Degraded)
/// and the fallback serves until checkPrimary() succeeds again. Primary
/// errors never surface to callers.
///
/// The fallback keeps per-category insertion order and evicts the oldest
/// key when a category is at capacity. Expired entries are dropped when read.
///
/// Thread-safe without external locking.
///
/// Example:
/// @code
///   ResponseCache cache(ResponseCacheConfig{}, std::move(redisBackend));
///   cache.start();
///   cache.set(CacheCategory::SystemData, {{"name", "motd"}}, "hello");
///   auto motd = cache.get(CacheCategory::SystemData, {{"name", "motd"}});
/// @endcode
class ResponseCache {
public:
    /// @param primary May be null for a fallback-only cache.
    explicit ResponseCache(ResponseCacheConfig config,
                           std::unique_ptr<CacheBackend> primary = nullptr,
                           foundation::SluiceMetrics& metrics = foundation::SluiceMetrics::instance());
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /// Start the periodic primary probe (if a primary is configured).
    [[nodiscard]] foundation::SluiceResult<void> start();

    /// Stop the probe. Cached data stays readable.
    void shutdown();

    // ── Core operations ─────────────────────────────────────────────────

    [[nodiscard]] std::optional<std::string> get(CacheCategory category,
                                                 const foundation::Payload& keyInputs);

    void set(CacheCategory category, const foundation::Payload& keyInputs, std::string_view value);

    /// With a pattern, delete keys matching `{namespace}:{pattern}:*` and
    /// return the count; without one, clear everything and return -1.
    int64_t invalidate(std::optional<std::string> pattern = std::nullopt);

    /// `{namespace}:{category}:{digest16}` for @p keyInputs.
    [[nodiscard]] std::string makeKey(CacheCategory category,
                                      const foundation::Payload& keyInputs) const;

    /// Ping the primary; a success leaves degraded mode.
    /// @return true when the primary is available afterwards.
    bool checkPrimary();

    // ── Typed helpers ───────────────────────────────────────────────────

    void cacheModelResponse(std::string_view prompt, std::string_view tier,
                            std::string_view context, std::string_view response);

    [[nodiscard]] std::optional<std::string> getModelResponse(std::string_view prompt,
                                                              std::string_view tier,
                                                              std::string_view context);

    void cacheUserSession(std::string_view userId, std::string_view sessionData);

    [[nodiscard]] std::optional<std::string> getUserSession(std::string_view userId);

    void cacheEmbedding(std::string_view text, std::string_view model,
                        const std::vector<double>& embedding);

    [[nodiscard]] std::optional<std::vector<double>> getEmbedding(std::string_view text,
                                                                  std::string_view model);

    // ── Stats ───────────────────────────────────────────────────────────

    [[nodiscard]] CacheStats stats() const;

    /// Tuning advice derived from stats.
    [[nodiscard]] std::vector<std::string> recommendations() const;

    [[nodiscard]] bool primaryAvailable() const;

    [[nodiscard]] std::size_t fallbackSize() const;

    [[nodiscard]] const CachePolicy& policy(CacheCategory category) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

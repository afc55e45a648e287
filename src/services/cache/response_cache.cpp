/// @file response_cache.cpp
/// @brief ResponseCache implementation: primary backend, FIFO fallback, stats.

#include "sluice/service/response_cache.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <list>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <utility>

#include "sluice/foundation/content_hash.hpp"
#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/periodic_task.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::HealthStatus;
using sluice::foundation::LogCategory;
using sluice::foundation::Payload;
using sluice::foundation::PeriodicTask;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr const char* kCacheComponent = "cache";
constexpr const char* kHitsCounter = "sluice_cache_hits_total";
constexpr const char* kMissesCounter = "sluice_cache_misses_total";
constexpr std::size_t kMaxPromptKeyChars = 1000;

/// Glob match supporting `*` and `?`, as used by Redis SCAN MATCH.
bool globMatch(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t starP = std::string_view::npos;
    std::size_t starT = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (starP != std::string_view::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::string encodeEmbedding(const std::vector<double>& values) {
    std::ostringstream out;
    out.precision(17);
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
    return out.str();
}

std::optional<std::vector<double>> decodeEmbedding(const std::string& text) {
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        return std::nullopt;
    }
    std::vector<double> values;
    const char* cursor = text.c_str() + 1;
    const char* end = text.c_str() + text.size() - 1;
    while (cursor < end) {
        char* next = nullptr;
        double v = std::strtod(cursor, &next);
        if (next == cursor) {
            return std::nullopt;
        }
        values.push_back(v);
        cursor = next;
        if (cursor < end && *cursor == ',') {
            ++cursor;
        }
    }
    return values;
}

/// Fallback storage for one category, in insertion order.
struct FallbackShard {
    std::list<std::string> order;
    std::unordered_map<std::string, std::pair<CacheEntry, std::list<std::string>::iterator>> entries;

    void erase(const std::string& key) {
        auto it = entries.find(key);
        if (it != entries.end()) {
            order.erase(it->second.second);
            entries.erase(it);
        }
    }
};

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct ResponseCache::Impl {
    ResponseCacheConfig config;
    std::unique_ptr<CacheBackend> primary;
    foundation::SluiceMetrics& metrics;

    std::atomic<bool> primaryAvailable{false};

    mutable std::mutex fallbackMutex;
    std::array<FallbackShard, kCacheCategoryCount> fallback;

    mutable std::mutex statsMutex;
    uint64_t totalRequests = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t errors = 0;
    double costSaved = 0.0;
    double timeSavedSeconds = 0.0;
    std::map<std::string, uint64_t> categoryHits;

    std::unique_ptr<PeriodicTask> probe;

    Impl(ResponseCacheConfig cfg, std::unique_ptr<CacheBackend> backend,
         foundation::SluiceMetrics& m)
        : config(std::move(cfg)), primary(std::move(backend)), metrics(m) {}

    [[nodiscard]] bool usePrimary() const {
        return primary && primaryAvailable.load(std::memory_order_acquire);
    }

    /// Count the error and enter degraded mode on the first one.
    void onPrimaryError(const SluiceError& error) {
        {
            std::lock_guard lock(statsMutex);
            ++errors;
        }
        if (primaryAvailable.exchange(false, std::memory_order_acq_rel)) {
            metrics.setComponentHealth(kCacheComponent, HealthStatus::Degraded);
            SLUICE_LOG_WARN(LogCategory::Cache,
                            "primary cache (" + std::string(primary->name()) +
                                ") unavailable, using in-process fallback: " + error.describe());
        }
    }

    void recordHit(CacheCategory category, std::chrono::steady_clock::duration lookup) {
        {
            std::lock_guard lock(statsMutex);
            ++totalRequests;
            ++hits;
            costSaved += config.policies[categoryIndex(category)].costPerHit;
            auto saved = std::chrono::duration<double>(config.estimatedDownstreamLatency - lookup).count();
            if (saved > 0.0) {
                timeSavedSeconds += saved;
            }
            ++categoryHits[std::string(toString(category))];
        }
        metrics.incrementCounter(kHitsCounter);
    }

    void recordMiss() {
        {
            std::lock_guard lock(statsMutex);
            ++totalRequests;
            ++misses;
        }
        metrics.incrementCounter(kMissesCounter);
    }

    std::optional<std::string> fallbackGet(CacheCategory category, const std::string& key) {
        std::lock_guard lock(fallbackMutex);
        auto& shard = fallback[categoryIndex(category)];
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            return std::nullopt;
        }
        auto& entry = it->second.first;
        if (entry.expired(CacheEntry::Clock::now())) {
            shard.erase(key);
            return std::nullopt;
        }
        ++entry.accessCount;
        return entry.value;
    }

    void fallbackSet(CacheCategory category, const std::string& key, std::string_view value) {
        const auto& policy = config.policies[categoryIndex(category)];
        const auto now = CacheEntry::Clock::now();

        std::lock_guard lock(fallbackMutex);
        auto& shard = fallback[categoryIndex(category)];

        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            // Refresh keeps the original insertion position.
            auto& entry = it->second.first;
            entry.value = std::string(value);
            entry.createdAt = now;
            entry.expiresAt = now + policy.ttl;
            return;
        }

        if (policy.maxFallbackEntries == 0) {
            return;
        }
        if (shard.entries.size() >= policy.maxFallbackEntries && !shard.order.empty()) {
            shard.erase(shard.order.front());
        }

        shard.order.push_back(key);
        CacheEntry entry{key, std::string(value), category, now, now + policy.ttl, 0};
        shard.entries.emplace(key, std::make_pair(std::move(entry), std::prev(shard.order.end())));
    }

    int64_t fallbackInvalidate(const std::string& glob) {
        std::lock_guard lock(fallbackMutex);
        int64_t removed = 0;
        for (auto& shard : fallback) {
            for (auto it = shard.order.begin(); it != shard.order.end();) {
                if (globMatch(glob, *it)) {
                    shard.entries.erase(*it);
                    it = shard.order.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    void fallbackClear() {
        std::lock_guard lock(fallbackMutex);
        for (auto& shard : fallback) {
            shard.entries.clear();
            shard.order.clear();
        }
    }
};

// ── Construction / lifecycle ────────────────────────────────────────────────

ResponseCache::ResponseCache(ResponseCacheConfig config,
                             std::unique_ptr<CacheBackend> primary,
                             foundation::SluiceMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(primary), metrics)) {
    impl_->primaryAvailable.store(impl_->primary != nullptr);
    impl_->metrics.setComponentHealth(kCacheComponent, HealthStatus::Healthy);
    if (!impl_->primary) {
        SLUICE_LOG_INFO(LogCategory::Cache, "no primary cache configured, using in-process cache only");
    }
}

ResponseCache::~ResponseCache() {
    shutdown();
}

SluiceResult<void> ResponseCache::start() {
    if (!impl_->primary || impl_->config.primaryCheckInterval.count() <= 0) {
        return SluiceResult<void>::ok();
    }
    if (!impl_->probe) {
        impl_->probe = std::make_unique<PeriodicTask>(
            "cache-primary-probe", impl_->config.primaryCheckInterval, [this] { checkPrimary(); });
    }
    return impl_->probe->start();
}

void ResponseCache::shutdown() {
    if (impl_->probe) {
        impl_->probe->stop();
    }
}

// ── Keys ────────────────────────────────────────────────────────────────────

std::string ResponseCache::makeKey(CacheCategory category, const Payload& keyInputs) const {
    std::string key = impl_->config.keyNamespace;
    key += ':';
    key += toString(category);
    key += ':';
    key += foundation::shortDigest(foundation::canonicalJson(keyInputs), 16);
    return key;
}

// ── get() / set() ───────────────────────────────────────────────────────────

std::optional<std::string> ResponseCache::get(CacheCategory category, const Payload& keyInputs) {
    const auto start = std::chrono::steady_clock::now();
    const auto key = makeKey(category, keyInputs);

    std::optional<std::string> value;
    bool served = false;

    if (impl_->usePrimary()) {
        auto result = impl_->primary->get(key);
        if (result) {
            value = std::move(result).value();
            served = true;
        } else {
            impl_->onPrimaryError(result.error());
        }
    }
    if (!served) {
        value = impl_->fallbackGet(category, key);
    }

    if (value) {
        impl_->recordHit(category, std::chrono::steady_clock::now() - start);
        SLUICE_LOG_DEBUG(LogCategory::Cache, "cache hit " + key);
    } else {
        impl_->recordMiss();
    }
    return value;
}

void ResponseCache::set(CacheCategory category, const Payload& keyInputs, std::string_view value) {
    const auto key = makeKey(category, keyInputs);
    const auto& policy = impl_->config.policies[categoryIndex(category)];

    bool stored = false;
    if (impl_->usePrimary()) {
        auto result = impl_->primary->set(key, value, policy.ttl);
        if (result) {
            stored = true;
        } else {
            impl_->onPrimaryError(result.error());
        }
    }
    if (!stored) {
        impl_->fallbackSet(category, key, value);
    }

    std::lock_guard lock(impl_->statsMutex);
    ++impl_->sets;
}

// ── invalidate() ────────────────────────────────────────────────────────────

int64_t ResponseCache::invalidate(std::optional<std::string> pattern) {
    if (!pattern) {
        if (impl_->usePrimary()) {
            auto flushed = impl_->primary->flush();
            if (!flushed) {
                impl_->onPrimaryError(flushed.error());
            }
        }
        impl_->fallbackClear();
        SLUICE_LOG_INFO(LogCategory::Cache, "cache cleared");
        return -1;
    }

    const std::string glob = impl_->config.keyNamespace + ":" + *pattern + ":*";
    int64_t removed = 0;
    if (impl_->usePrimary()) {
        auto deleted = impl_->primary->deleteMatching(glob);
        if (deleted) {
            removed += deleted.value();
        } else {
            impl_->onPrimaryError(deleted.error());
        }
    }
    removed += impl_->fallbackInvalidate(glob);

    SLUICE_LOG_INFO(LogCategory::Cache,
                    "invalidated " + std::to_string(removed) + " keys matching " + glob);
    return removed;
}

// ── checkPrimary() ──────────────────────────────────────────────────────────

bool ResponseCache::checkPrimary() {
    if (!impl_->primary) {
        return false;
    }
    auto pong = impl_->primary->ping();
    if (!pong) {
        impl_->onPrimaryError(pong.error());
        return false;
    }
    if (!impl_->primaryAvailable.exchange(true, std::memory_order_acq_rel)) {
        impl_->metrics.setComponentHealth(kCacheComponent, HealthStatus::Healthy);
        SLUICE_LOG_INFO(LogCategory::Cache, "primary cache (" + std::string(impl_->primary->name()) +
                                                ") reachable again, leaving fallback mode");
    }
    return true;
}

// ── Typed helpers ───────────────────────────────────────────────────────────

namespace {

Payload modelResponseKey(std::string_view prompt, std::string_view tier, std::string_view context) {
    return Payload{
        {"context", std::string(context)},
        {"model", std::string(tier)},
        {"prompt", std::string(prompt.substr(0, kMaxPromptKeyChars))},
    };
}

Payload embeddingKey(std::string_view text, std::string_view model) {
    return Payload{{"model", std::string(model)}, {"text", std::string(text)}};
}

} // anonymous namespace

void ResponseCache::cacheModelResponse(std::string_view prompt, std::string_view tier,
                                       std::string_view context, std::string_view response) {
    set(CacheCategory::ModelResponse, modelResponseKey(prompt, tier, context), response);
}

std::optional<std::string> ResponseCache::getModelResponse(std::string_view prompt,
                                                           std::string_view tier,
                                                           std::string_view context) {
    return get(CacheCategory::ModelResponse, modelResponseKey(prompt, tier, context));
}

void ResponseCache::cacheUserSession(std::string_view userId, std::string_view sessionData) {
    set(CacheCategory::UserSession, Payload{{"user_id", std::string(userId)}}, sessionData);
}

std::optional<std::string> ResponseCache::getUserSession(std::string_view userId) {
    return get(CacheCategory::UserSession, Payload{{"user_id", std::string(userId)}});
}

void ResponseCache::cacheEmbedding(std::string_view text, std::string_view model,
                                   const std::vector<double>& embedding) {
    set(CacheCategory::Embedding, embeddingKey(text, model), encodeEmbedding(embedding));
}

std::optional<std::vector<double>> ResponseCache::getEmbedding(std::string_view text,
                                                               std::string_view model) {
    auto raw = get(CacheCategory::Embedding, embeddingKey(text, model));
    if (!raw) {
        return std::nullopt;
    }
    auto decoded = decodeEmbedding(*raw);
    if (!decoded) {
        SLUICE_LOG_WARN(LogCategory::Cache, "discarding malformed cached embedding");
    }
    return decoded;
}

// ── Stats ───────────────────────────────────────────────────────────────────

CacheStats ResponseCache::stats() const {
    CacheStats s;
    {
        std::lock_guard lock(impl_->statsMutex);
        s.totalRequests = impl_->totalRequests;
        s.hits = impl_->hits;
        s.misses = impl_->misses;
        s.sets = impl_->sets;
        s.errors = impl_->errors;
        s.costSaved = impl_->costSaved;
        s.timeSavedSeconds = impl_->timeSavedSeconds;
        s.categoryHits = impl_->categoryHits;
    }
    if (s.totalRequests > 0) {
        s.hitRate = static_cast<double>(s.hits) * 100.0 / static_cast<double>(s.totalRequests);
    }
    s.primaryAvailable = primaryAvailable();
    s.fallbackSize = fallbackSize();
    return s;
}

std::vector<std::string> ResponseCache::recommendations() const {
    auto s = stats();
    std::vector<std::string> advice;

    if (s.totalRequests > 100 && s.hitRate < 20.0) {
        advice.push_back("Low cache hit rate: consider increasing TTL for frequently requested data");
    } else if (s.hitRate > 80.0) {
        advice.push_back("Excellent cache hit rate");
    }

    if (s.totalRequests > 0 &&
        static_cast<double>(s.errors) / static_cast<double>(s.totalRequests) > 0.05) {
        advice.push_back("High cache error rate: check primary connectivity");
    }

    if (!s.primaryAvailable) {
        advice.push_back("Primary cache unavailable: running in fallback mode");
    }
    return advice;
}

bool ResponseCache::primaryAvailable() const {
    return impl_->usePrimary();
}

std::size_t ResponseCache::fallbackSize() const {
    std::lock_guard lock(impl_->fallbackMutex);
    std::size_t total = 0;
    for (const auto& shard : impl_->fallback) {
        total += shard.entries.size();
    }
    return total;
}

const CachePolicy& ResponseCache::policy(CacheCategory category) const {
    return impl_->config.policies[categoryIndex(category)];
}

} // namespace sluice::service

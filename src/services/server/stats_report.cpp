/// @file stats_report.cpp
/// @brief renderStatsJson() implementation.

#include "sluice/service/stats_report.hpp"

#include <array>
#include <cstdio>
#include <string_view>
#include <vector>

#include "sluice/foundation/json_log_formatter.hpp"
#include "sluice/service/connection_pool.hpp"
#include "sluice/service/request_optimizer.hpp"
#include "sluice/service/request_scheduler.hpp"
#include "sluice/service/response_cache.hpp"

namespace sluice::service {

namespace {

/// Appends `"key":` with a leading comma when the object is not empty.
class JsonObject {
public:
    explicit JsonObject(std::string& out) : out_(out) { out_ += '{'; }
    ~JsonObject() { out_ += '}'; }

    JsonObject(const JsonObject&) = delete;
    JsonObject& operator=(const JsonObject&) = delete;

    std::string& key(std::string_view name) {
        if (!first_) {
            out_ += ',';
        }
        first_ = false;
        foundation::appendJsonString(out_, name);
        out_ += ':';
        return out_;
    }

    void number(std::string_view name, uint64_t value) { key(name) += std::to_string(value); }

    void number(std::string_view name, double value) {
        std::array<char, 32> buf{};
        std::snprintf(buf.data(), buf.size(), "%.2f", value);
        key(name) += buf.data();
    }

    void boolean(std::string_view name, bool value) { key(name) += value ? "true" : "false"; }

    void strings(std::string_view name, const std::vector<std::string>& values) {
        auto& out = key(name);
        out += '[';
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            foundation::appendJsonString(out, values[i]);
        }
        out += ']';
    }

private:
    std::string& out_;
    bool first_ = true;
};

void renderScheduler(JsonObject& parent, const RequestScheduler& scheduler) {
    auto s = scheduler.stats();
    auto& out = parent.key("scheduler");
    JsonObject obj(out);
    obj.number("queue_depth", static_cast<uint64_t>(s.queueSize));
    obj.number("active_requests", static_cast<uint64_t>(s.activeRequests));
    obj.number("total_requests", s.totalRequests);
    obj.number("completed", s.completed);
    obj.number("failed", s.failed);
    obj.number("timed_out", s.timedOut);
    obj.number("cancelled", s.cancelled);
    obj.number("cache_hits", s.cacheHits);
    obj.number("average_processing_ms", s.averageProcessingMs);
    obj.number("open_breakers", static_cast<uint64_t>(s.openBreakers));
    obj.number("rate_limited_users", static_cast<uint64_t>(s.rateLimitedUsers));

    {
        JsonObject rejected(obj.key("rejected"));
        for (const auto& [reason, count] : s.rejectedByReason) {
            rejected.number(reason, count);
        }
    }

    auto& workers = obj.key("workers");
    workers += '[';
    for (std::size_t i = 0; i < s.workers.size(); ++i) {
        if (i > 0) {
            workers += ',';
        }
        const auto& w = s.workers[i];
        JsonObject worker(workers);
        worker.number("id", static_cast<uint64_t>(w.id.value()));
        worker.number("processed", w.processed);
        worker.number("total_processing_ms", static_cast<uint64_t>(w.totalProcessingTime.count()));
        worker.boolean("busy", w.busy);
    }
    workers += ']';
}

void renderCache(JsonObject& parent, const ResponseCache& cache) {
    auto s = cache.stats();
    JsonObject obj(parent.key("cache"));
    obj.number("requests", s.totalRequests);
    obj.number("hits", s.hits);
    obj.number("misses", s.misses);
    obj.number("hit_rate", s.hitRate);
    obj.number("cost_saved", s.costSaved);
    obj.number("time_saved_seconds", s.timeSavedSeconds);
    obj.boolean("primary_available", s.primaryAvailable);
    obj.number("fallback_entries", static_cast<uint64_t>(s.fallbackSize));
    obj.strings("recommendations", cache.recommendations());
}

void renderPool(JsonObject& parent, const ConnectionPool& pool) {
    auto s = pool.stats();
    JsonObject obj(parent.key("pool"));
    obj.number("active", static_cast<uint64_t>(s.active));
    obj.number("available", static_cast<uint64_t>(s.available));
    obj.number("total", static_cast<uint64_t>(s.total));
    obj.number("acquisitions", s.acquisitions);
    obj.number("waits", s.connectionWaits);
    obj.number("timeouts", s.timeouts);
    obj.number("queries", s.queriesExecuted);
    obj.number("query_errors", s.queryErrors);
    obj.number("average_query_ms", s.averageQueryMs);
    obj.strings("recommendations", pool.recommendations());
}

void renderOptimizer(JsonObject& parent, const RequestOptimizer& optimizer) {
    auto m = optimizer.metrics();
    JsonObject obj(parent.key("optimizer"));
    obj.number("requests", m.totalRequests);
    obj.number("template_hits", m.templateHits);
    obj.number("cache_hits", m.cacheHits);
    obj.number("fast_tier_uses", m.fastTierUses);
    obj.number("batched", m.batchOptimizations);
    obj.number("cost_saved", m.costSaved);
    obj.number("time_saved_seconds", m.timeSavedSeconds);
    obj.number("effectiveness", m.effectiveness());
}

} // anonymous namespace

std::string renderStatsJson(const StatsSources& sources) {
    std::string out;
    {
        JsonObject root(out);
        if (sources.scheduler != nullptr) {
            renderScheduler(root, *sources.scheduler);
        }
        if (sources.cache != nullptr) {
            renderCache(root, *sources.cache);
        }
        if (sources.pool != nullptr) {
            renderPool(root, *sources.pool);
        }
        if (sources.optimizer != nullptr) {
            renderOptimizer(root, *sources.optimizer);
        }
    }
    return out;
}

} // namespace sluice::service

#pragma once

/// @file stats_report.hpp
/// @brief JSON rendering of the aggregated service stats served at /stats.

#include <string>

namespace sluice::service {

class ConnectionPool;
class RequestOptimizer;
class RequestScheduler;
class ResponseCache;

/// Components reported on; any of them may be absent.
struct StatsSources {
    const RequestScheduler* scheduler = nullptr;
    const ResponseCache* cache = nullptr;
    const ConnectionPool* pool = nullptr;
    const RequestOptimizer* optimizer = nullptr;
};

/// Render one JSON object with a section per present component:
/// `scheduler` (queue depth, workers, open breakers, rate-limited users,
/// rejections), `cache` (hit rate, cost and time saved), `pool` (active and
/// available connections) and `optimizer` (effectiveness, savings).
[[nodiscard]] std::string renderStatsJson(const StatsSources& sources);

} // namespace sluice::service

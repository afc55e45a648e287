#pragma once

/// @file stats_server.hpp
/// @brief Lightweight HTTP server for health probes, Prometheus metrics
///        and the aggregated service stats.

#include "sluice/foundation/sluice_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sluice::foundation {
class SluiceMetrics;
}

namespace sluice::service {

/// Configuration for the StatsServer.
struct StatsServerConfig {
    /// TCP port to listen on; 0 picks an ephemeral port.
    uint16_t port = 9100;

    /// Human-readable service name for JSON responses.
    std::string serviceName = "sluice";
};

/// Produces the JSON body of GET /stats.
using StatsProvider = std::function<std::string()>;

/// Minimal HTTP server providing health, metrics and stats endpoints.
///
/// Endpoints:
///   - GET /healthz → 200 OK (liveness probe)
///   - GET /readyz  → 200 OK if ready, 503 if not (readiness probe)
///   - GET /metrics → Prometheus text exposition format
///   - GET /stats   → JSON from the registered StatsProvider (404 without one)
///
/// Example:
/// @code
///   StatsServer server({.port = 9100}, SluiceMetrics::instance());
///   server.setStatsProvider([&] { return renderStatsJson(sources); });
///   (void)server.start();
///   server.setReady(true);
///   // ... service runs ...
///   server.stop();
/// @endcode
///
/// Thread-safe: runs an internal background thread for accepting connections.
class StatsServer {
public:
    explicit StatsServer(StatsServerConfig config, foundation::SluiceMetrics& metrics);
    ~StatsServer();

    StatsServer(const StatsServer&) = delete;
    StatsServer& operator=(const StatsServer&) = delete;

    /// Start listening on the configured port.
    [[nodiscard]] foundation::SluiceResult<void> start();

    /// Stop the server and close the listening socket.
    void stop();

    /// Set the readiness state. When false, /readyz returns 503.
    void setReady(bool ready);

    /// Install the /stats body provider. Must be set before start().
    void setStatsProvider(StatsProvider provider);

    [[nodiscard]] bool isRunning() const;

    /// Port actually bound (the configured one until start()).
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sluice::service

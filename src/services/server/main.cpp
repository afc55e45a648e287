/// @file main.cpp
/// @brief sluice_server entry point.
///
/// Builds every component from configuration, wires the optimizer in as
/// the scheduler's default handler and serves health, metrics and stats
/// until SIGINT/SIGTERM.

#include "sluice/foundation/config_manager.hpp"
#include "sluice/foundation/sluice_logger.hpp"
#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/foundation/store_connection.hpp"
#include "sluice/service/connection_pool.hpp"
#include "sluice/service/model_client.hpp"
#include "sluice/service/redis_cache_backend.hpp"
#include "sluice/service/request_batcher.hpp"
#include "sluice/service/request_optimizer.hpp"
#include "sluice/service/request_scheduler.hpp"
#include "sluice/service/response_cache.hpp"
#include "sluice/service/service_runner.hpp"
#include "sluice/service/stats_report.hpp"
#include "sluice/service/stats_server.hpp"
#include "sluice/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

using sluice::foundation::ConfigManager;
using sluice::foundation::LogCategory;

void configureLogging(const ConfigManager& config) {
    auto& logger = sluice::foundation::SluiceLogger::instance();

    auto levelName = config.getOr<std::string>("logging.level", "info");
    if (auto level = sluice::foundation::parseLogLevel(levelName)) {
        logger.setGlobalLevel(*level);
    } else {
        std::cerr << "Unknown log level '" << levelName << "', using info\n";
    }

    logger.setJsonOutput(config.getOr<std::string>("logging.format", "text") == "json");
}

sluice::foundation::StoreConfig buildStoreConfig(const ConfigManager& config) {
    sluice::foundation::StoreConfig cfg;
    cfg.connectionString = config.getOr<std::string>("store.connection_string", cfg.connectionString);

    auto type = config.getOr<std::string>("store.type", "sqlite");
    if (type == "postgresql" || type == "postgres") {
        cfg.type = sluice::foundation::StoreType::PostgreSQL;
    } else if (type == "mysql") {
        cfg.type = sluice::foundation::StoreType::MySQL;
    }
    return cfg;
}

sluice::service::ConnectionPoolConfig buildPoolConfig(const ConfigManager& config) {
    sluice::service::ConnectionPoolConfig cfg;
    cfg.minSize = config.getOr<uint32_t>("pool.min_size", cfg.minSize);
    cfg.maxSize = config.getOr<uint32_t>("pool.max_size", cfg.maxSize);

    if (auto timeout = config.get<int>("pool.connection_timeout_seconds")) {
        cfg.connectionTimeout = std::chrono::seconds(timeout.value());
    }
    if (auto idle = config.get<int>("pool.idle_timeout_seconds")) {
        cfg.idleTimeout = std::chrono::seconds(idle.value());
    }
    if (auto interval = config.get<int>("pool.maintenance_interval_seconds")) {
        cfg.maintenanceInterval = std::chrono::seconds(interval.value());
    }
    return cfg;
}

sluice::service::ResponseCacheConfig buildCacheConfig(const ConfigManager& config) {
    sluice::service::ResponseCacheConfig cfg;
    cfg.keyNamespace = config.getOr<std::string>("cache.namespace", cfg.keyNamespace);

    for (auto category : sluice::service::kAllCacheCategories) {
        auto& policy = cfg.policies[sluice::service::categoryIndex(category)];
        auto prefix = "cache.categories." + std::string(sluice::service::toString(category));

        if (auto ttl = config.get<int>(prefix + ".ttl_seconds")) {
            policy.ttl = std::chrono::seconds(ttl.value());
        }
        policy.maxFallbackEntries =
            config.getOr<std::size_t>(prefix + ".max_entries", policy.maxFallbackEntries);
    }

    if (auto interval = config.get<int>("cache.health_check_interval_seconds")) {
        cfg.primaryCheckInterval = std::chrono::seconds(interval.value());
    }
    return cfg;
}

/// Redis primary when `cache.url` is set and reachable; null otherwise.
std::unique_ptr<sluice::service::CacheBackend> connectPrimaryCache(const ConfigManager& config) {
    auto url = config.getOr<std::string>("cache.url", "");
    if (url.empty()) {
        SLUICE_LOG_INFO(LogCategory::Cache, "cache.url not set, running fallback-only cache");
        return nullptr;
    }

    sluice::service::RedisBackendConfig cfg;
    cfg.url = url;
    cfg.poolSize = config.getOr<std::size_t>("cache.pool_size", cfg.poolSize);

    auto backend = sluice::service::RedisCacheBackend::connect(cfg);
    if (!backend) {
        SLUICE_LOG_WARN(LogCategory::Cache,
                        "primary cache unreachable (" + backend.error().describe() +
                            "), starting on fallback");
        return nullptr;
    }
    return std::move(backend).value();
}

sluice::service::RequestSchedulerConfig buildSchedulerConfig(const ConfigManager& config) {
    sluice::service::RequestSchedulerConfig cfg;
    cfg.workerCount = config.getOr<uint32_t>("scheduler.workers", cfg.workerCount);
    cfg.maxQueueSize = config.getOr<std::size_t>("scheduler.max_queue_size", cfg.maxQueueSize);
    cfg.defaultMaxRetries = config.getOr<uint32_t>("scheduler.max_retries", cfg.defaultMaxRetries);

    if (auto timeout = config.get<int>("scheduler.request_timeout_seconds")) {
        cfg.defaultTimeout = std::chrono::seconds(timeout.value());
    }

    cfg.rateLimits.limitPerMinute =
        config.getOr<uint32_t>("admission.rate_limit_per_minute", cfg.rateLimits.limitPerMinute);
    cfg.rateLimits.limitPerHour =
        config.getOr<uint32_t>("admission.rate_limit_per_hour", cfg.rateLimits.limitPerHour);
    if (auto sweep = config.get<int>("admission.rate_limit_sweep_seconds")) {
        cfg.rateLimitSweepInterval = std::chrono::seconds(sweep.value());
    }
    cfg.breaker.failureThreshold = config.getOr<uint32_t>("admission.breaker_failure_threshold",
                                                          cfg.breaker.failureThreshold);
    if (auto recovery = config.get<int>("admission.breaker_recovery_timeout_seconds")) {
        cfg.breaker.recoveryTimeout = std::chrono::seconds(recovery.value());
    }
    return cfg;
}

sluice::service::RequestBatcherConfig buildBatcherConfig(const ConfigManager& config) {
    sluice::service::RequestBatcherConfig cfg;
    cfg.maxBatchSize = config.getOr<std::size_t>("batcher.max_batch_size", cfg.maxBatchSize);
    if (auto delay = config.get<int>("batcher.max_batch_delay_ms")) {
        cfg.maxBatchDelay = std::chrono::milliseconds(delay.value());
    }
    return cfg;
}

sluice::service::SimulatedModelConfig buildModelConfig(const ConfigManager& config) {
    sluice::service::SimulatedModelConfig cfg;
    if (auto latency = config.get<int>("model.latency_ms")) {
        cfg.latency = std::chrono::milliseconds(latency.value());
    }
    return cfg;
}

}  // namespace

int main(int argc, char* argv[]) {
    sluice::service::SignalHandler signals;

    // --config flag > SLUICE_CONFIG_PATH env > /etc/sluice/config.yaml.
    ConfigManager config;
    auto loadResult = sluice::service::loadConfig(config, sluice::service::parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    configureLogging(config);

    auto& metrics = sluice::foundation::SluiceMetrics::instance();
    metrics.setServiceName("sluice");

    SLUICE_LOG_INFO(LogCategory::Core, std::string("sluice ") + sluice::Version::string + " starting");

    // ── Store / pool ────────────────────────────────────────────────────
    sluice::service::ConnectionPool pool(
        buildPoolConfig(config), sluice::foundation::makeStoreConnectionFactory(buildStoreConfig(config)),
        metrics);
    // An unreachable store leaves the optimizer on in-memory profiles.
    bool storeAvailable = true;
    if (auto init = pool.initialize(); !init) {
        SLUICE_LOG_WARN(LogCategory::Pool, "store unreachable (" + init.error().describe() +
                                               "), interactions will not be recorded");
        storeAvailable = false;
    }

    // ── Cache ───────────────────────────────────────────────────────────
    sluice::service::ResponseCache cache(buildCacheConfig(config), connectPrimaryCache(config), metrics);
    if (auto started = cache.start(); !started) {
        std::cerr << "Failed to start response cache: " << started.error().describe() << "\n";
        pool.shutdown();
        return EXIT_FAILURE;
    }

    // ── Optimizer ───────────────────────────────────────────────────────
    sluice::service::SimulatedModelClient model(buildModelConfig(config));
    sluice::service::RequestBatcher batcher(buildBatcherConfig(config), model);
    if (auto started = batcher.start(); !started) {
        std::cerr << "Failed to start request batcher: " << started.error().describe() << "\n";
        cache.shutdown();
        pool.shutdown();
        return EXIT_FAILURE;
    }

    sluice::service::RequestOptimizer optimizer({}, cache, model, storeAvailable ? &pool : nullptr,
                                                &batcher, metrics);
    if (auto init = optimizer.initialize(); !init) {
        SLUICE_LOG_WARN(LogCategory::Optimizer,
                        "interaction history unavailable: " + init.error().describe());
    }

    // ── Scheduler ───────────────────────────────────────────────────────
    sluice::service::RequestScheduler scheduler(buildSchedulerConfig(config), metrics);
    scheduler.setDefaultHandler(
        [&optimizer](const sluice::service::RequestContext& ctx,
                     const sluice::foundation::Payload& payload) {
            return optimizer.handle(ctx, payload);
        });
    if (auto started = scheduler.start(); !started) {
        std::cerr << "Failed to start scheduler: " << started.error().describe() << "\n";
        batcher.stop();
        cache.shutdown();
        pool.shutdown();
        return EXIT_FAILURE;
    }

    // ── Stats server ────────────────────────────────────────────────────
    auto statsPort = config.getOr<uint16_t>("stats.port", 9100);
    sluice::service::StatsServer stats({.port = statsPort, .serviceName = "sluice"}, metrics);
    stats.setStatsProvider([&] {
        return sluice::service::renderStatsJson({&scheduler, &cache, &pool, &optimizer});
    });
    if (auto started = stats.start(); !started) {
        std::cerr << "Failed to start stats server: " << started.error().describe() << "\n";
        scheduler.stop();
        batcher.stop();
        cache.shutdown();
        pool.shutdown();
        return EXIT_FAILURE;
    }

    sluice::service::GracefulShutdown shutdown;
    shutdown.addHook("ready", [&]() { stats.setReady(false); });
    shutdown.addHook("scheduler", [&]() { scheduler.stop(); });
    shutdown.addHook("batcher", [&]() { batcher.stop(); });
    shutdown.addHook("cache", [&]() { cache.shutdown(); });
    shutdown.addHook("pool", [&]() { pool.shutdown(); });
    shutdown.addHook("stats", [&]() { stats.stop(); });

    stats.setReady(true);
    SLUICE_LOG_INFO(LogCategory::Core,
                    "sluice started (stats_port: " + std::to_string(stats.port()) + ")");

    signals.waitForShutdown();

    shutdown.execute();
    (void)sluice::foundation::SluiceLogger::instance().flush();
    std::cout << "sluice stopped\n";
    return EXIT_SUCCESS;
}

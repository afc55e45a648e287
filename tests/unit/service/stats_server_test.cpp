/// @file stats_server_test.cpp
/// @brief Unit tests for StatsServer endpoints and renderStatsJson().

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/service/connection_pool.hpp"
#include "sluice/service/model_client.hpp"
#include "sluice/service/request_optimizer.hpp"
#include "sluice/service/request_scheduler.hpp"
#include "sluice/service/response_cache.hpp"
#include "sluice/service/stats_report.hpp"
#include "sluice/service/stats_server.hpp"
#include "support/fake_store.hpp"

using namespace sluice::service;
using namespace sluice::foundation;
using namespace std::chrono_literals;

namespace {

/// Connect to localhost:port, send a GET and return the full response.
std::string httpGet(uint16_t port, const std::string& path) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return "";
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "";
    }

    std::string request = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    auto written = write(fd, request.data(), request.size());
    (void)written;

    std::string response;
    char buf[4096];
    ssize_t n = 0;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        response.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    return response;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

class StatsServerTest : public ::testing::Test {
protected:
    void SetUp() override { metrics_.setServiceName("sluice-test"); }

    /// Start on an ephemeral port.
    void start(StatsServer& server) {
        auto started = server.start();
        ASSERT_TRUE(started.hasValue()) << started.error().describe();
        ASSERT_NE(server.port(), 0);
        std::this_thread::sleep_for(20ms);
    }

    SluiceMetrics metrics_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(StatsServerTest, EphemeralPortIsReported) {
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    EXPECT_FALSE(server.isRunning());
    start(server);
    EXPECT_TRUE(server.isRunning());

    server.stop();
    EXPECT_FALSE(server.isRunning());
    server.stop();
}

TEST_F(StatsServerTest, PortInUseFails) {
    StatsServer first({.port = 0, .serviceName = "a"}, metrics_);
    start(first);

    StatsServer second({.port = first.port(), .serviceName = "b"}, metrics_);
    auto result = second.start();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ListenFailed);
}

// ============================================================================
// Endpoints
// ============================================================================

TEST_F(StatsServerTest, Healthz) {
    metrics_.setComponentHealth("pool", HealthStatus::Healthy);
    metrics_.setComponentHealth("cache", HealthStatus::Degraded);
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    start(server);

    auto response = httpGet(server.port(), "/healthz");
    EXPECT_TRUE(contains(response, "200 OK"));
    EXPECT_TRUE(contains(response, "\"status\":\"degraded\""));
    EXPECT_TRUE(contains(response, "\"service\":\"sluice-test\""));
    EXPECT_TRUE(contains(response, "\"cache\":\"degraded\""));
    EXPECT_TRUE(contains(response, "\"uptime_seconds\":"));
}

TEST_F(StatsServerTest, ReadyzFollowsReadiness) {
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    start(server);

    auto notReady = httpGet(server.port(), "/readyz");
    EXPECT_TRUE(contains(notReady, "503"));
    EXPECT_TRUE(contains(notReady, "not_ready"));

    server.setReady(true);
    auto ready = httpGet(server.port(), "/readyz");
    EXPECT_TRUE(contains(ready, "200 OK"));
}

TEST_F(StatsServerTest, MetricsExposition) {
    metrics_.incrementCounter("sluice_cache_hits_total", 42);
    metrics_.setGauge("sluice_pool_active", 3.0);
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    start(server);

    auto response = httpGet(server.port(), "/metrics?format=text");
    EXPECT_TRUE(contains(response, "200 OK"));
    EXPECT_TRUE(contains(response, "text/plain"));
    EXPECT_TRUE(contains(response, "sluice_cache_hits_total 42"));
    EXPECT_TRUE(contains(response, "sluice_pool_active 3"));
}

TEST_F(StatsServerTest, StatsWithoutProviderIs404) {
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    start(server);

    EXPECT_TRUE(contains(httpGet(server.port(), "/stats"), "404"));
    EXPECT_TRUE(contains(httpGet(server.port(), "/nowhere"), "404"));
}

TEST_F(StatsServerTest, StatsFromProvider) {
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    server.setStatsProvider([] { return std::string(R"({"scheduler":{"queue_depth":0}})"); });
    start(server);

    auto response = httpGet(server.port(), "/stats");
    EXPECT_TRUE(contains(response, "200 OK"));
    EXPECT_TRUE(contains(response, "application/json"));
    EXPECT_TRUE(contains(response, R"("queue_depth":0)"));
}

TEST_F(StatsServerTest, ThrowingProviderIs500) {
    StatsServer server({.port = 0, .serviceName = "sluice-test"}, metrics_);
    server.setStatsProvider([]() -> std::string { throw std::runtime_error("boom"); });
    start(server);

    auto response = httpGet(server.port(), "/stats");
    EXPECT_TRUE(contains(response, "500"));
    EXPECT_TRUE(contains(response, "stats unavailable"));

    // The server keeps serving after a failed provider.
    EXPECT_TRUE(contains(httpGet(server.port(), "/healthz"), "200 OK"));
}

// ============================================================================
// renderStatsJson()
// ============================================================================

TEST(StatsReportTest, EmptySourcesRenderEmptyObject) {
    EXPECT_EQ(renderStatsJson({}), "{}");
}

TEST(StatsReportTest, RendersEverySection) {
    SluiceMetrics metrics;

    ResponseCacheConfig cacheCfg;
    cacheCfg.primaryCheckInterval = 0ms;
    ResponseCache cache(cacheCfg, nullptr, metrics);
    cache.cacheModelResponse("p", "fast", "", "r");
    (void)cache.getModelResponse("p", "fast", "");

    auto store = std::make_shared<sluice::test::FakeStoreState>();
    ConnectionPoolConfig poolCfg;
    poolCfg.minSize = 2;
    poolCfg.maxSize = 2;
    poolCfg.maintenanceInterval = 1h;
    ConnectionPool pool(poolCfg, sluice::test::makeFakeStoreFactory(store), metrics);
    ASSERT_TRUE(pool.initialize().hasValue());

    SimulatedModelConfig modelCfg;
    modelCfg.latency = 1ms;
    SimulatedModelClient model(modelCfg);
    RequestOptimizer optimizer({}, cache, model, nullptr, nullptr, metrics);
    ASSERT_TRUE(optimizer.resolve({"hello"}, RequestContext::unbounded()).hasValue());

    RequestSchedulerConfig schedCfg;
    schedCfg.workerCount = 2;
    RequestScheduler scheduler(schedCfg, metrics);
    ASSERT_TRUE(scheduler.start().hasValue());

    auto json = renderStatsJson({&scheduler, &cache, &pool, &optimizer});

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_TRUE(contains(json, R"("scheduler":{"queue_depth":0,)"));
    EXPECT_TRUE(contains(json, R"("workers":[{"id":1,)"));
    EXPECT_TRUE(contains(json, R"("rejected":{})"));
    EXPECT_TRUE(contains(json, R"("cache":{"requests":1,"hits":1,)"));
    EXPECT_TRUE(contains(json, R"("hit_rate":100.00)"));
    EXPECT_TRUE(contains(json, R"("cost_saved":0.02)"));
    EXPECT_TRUE(contains(json, R"("primary_available":false)"));
    EXPECT_TRUE(contains(json, R"("pool":{"active":0,"available":2,"total":2,)"));
    EXPECT_TRUE(contains(json, R"("optimizer":{"requests":1,"template_hits":1,)"));
    EXPECT_TRUE(contains(json, R"("effectiveness":100.00)"));
}

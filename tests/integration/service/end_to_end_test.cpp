/// @file end_to_end_test.cpp
/// @brief Integration tests: scheduler -> optimizer -> cache/model/pool with
///        a degrading primary cache and the stats report.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sluice/foundation/error_code.hpp"
#include "sluice/service/connection_pool.hpp"
#include "sluice/service/model_client.hpp"
#include "sluice/service/request_batcher.hpp"
#include "sluice/service/request_optimizer.hpp"
#include "sluice/service/request_scheduler.hpp"
#include "sluice/service/response_cache.hpp"
#include "sluice/service/stats_report.hpp"
#include "support/fake_cache_backend.hpp"
#include "support/fake_store.hpp"

using namespace sluice::service;
using namespace sluice::foundation;
using namespace std::chrono_literals;

// =============================================================================
// Fixture: the full request path with in-memory store and cache
// =============================================================================

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConnectionPoolConfig poolCfg;
        poolCfg.minSize = 2;
        poolCfg.maxSize = 4;
        poolCfg.connectionTimeout = 200ms;
        poolCfg.maintenanceInterval = 1h;
        pool_ = std::make_unique<ConnectionPool>(poolCfg, sluice::test::makeFakeStoreFactory(store_),
                                                 metrics_);
        ASSERT_TRUE(pool_->initialize().hasValue());

        ResponseCacheConfig cacheCfg;
        cacheCfg.primaryCheckInterval = 0ms;
        cache_ = std::make_unique<ResponseCache>(
            cacheCfg, std::make_unique<sluice::test::FakeCacheBackend>(primary_), metrics_);

        SimulatedModelConfig modelCfg;
        modelCfg.latency = 5ms;
        modelCfg.batchLatency = 5ms;
        model_ = std::make_unique<SimulatedModelClient>(modelCfg);

        RequestBatcherConfig batchCfg;
        batchCfg.maxBatchSize = 4;
        batchCfg.maxBatchDelay = 30ms;
        batcher_ = std::make_unique<RequestBatcher>(batchCfg, *model_);
        ASSERT_TRUE(batcher_->start().hasValue());

        optimizer_ = std::make_unique<RequestOptimizer>(RequestOptimizerConfig{}, *cache_, *model_,
                                                        pool_.get(), batcher_.get(), metrics_);
        ASSERT_TRUE(optimizer_->initialize().hasValue());

        RequestSchedulerConfig schedCfg;
        schedCfg.workerCount = 4;
        schedCfg.defaultTimeout = 5s;
        schedCfg.backoffUnit = 10ms;
        scheduler_ = std::make_unique<RequestScheduler>(schedCfg, metrics_);
        scheduler_->setDefaultHandler([this](const RequestContext& ctx, const Payload& payload) {
            return optimizer_->handle(ctx, payload);
        });
        ASSERT_TRUE(scheduler_->start().hasValue());
    }

    void TearDown() override {
        scheduler_->stop();
        batcher_->stop();
        cache_->shutdown();
        pool_->shutdown();
    }

    RequestSnapshot run(SubmitOptions options) {
        auto id = scheduler_->submit(std::move(options));
        EXPECT_TRUE(id.hasValue());
        if (!id) {
            return {};
        }
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto snap = scheduler_->getStatus(id.value());
            if (snap && isTerminal(snap->status)) {
                return *snap;
            }
            std::this_thread::sleep_for(2ms);
        }
        ADD_FAILURE() << "request did not finish";
        return {};
    }

    static SubmitOptions chat(std::string prompt, std::string user = "alice",
                              RequestPriority priority = RequestPriority::Normal) {
        SubmitOptions options;
        options.requestType = "chat";
        options.payload = {{"prompt", std::move(prompt)}};
        options.userId = std::move(user);
        options.priority = priority;
        return options;
    }

    std::shared_ptr<sluice::test::FakeStoreState> store_ =
        std::make_shared<sluice::test::FakeStoreState>();
    std::shared_ptr<sluice::test::FakeCacheState> primary_ =
        std::make_shared<sluice::test::FakeCacheState>();
    SluiceMetrics metrics_;

    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ResponseCache> cache_;
    std::unique_ptr<SimulatedModelClient> model_;
    std::unique_ptr<RequestBatcher> batcher_;
    std::unique_ptr<RequestOptimizer> optimizer_;
    std::unique_ptr<RequestScheduler> scheduler_;
};

// =============================================================================
// Request path
// =============================================================================

TEST_F(EndToEndTest, RepeatedPromptIsServedFromCache) {
    auto first = run(chat("Explain how to sort a list"));
    ASSERT_EQ(first.status, RequestStatus::Completed);
    EXPECT_FALSE(first.cacheHit);
    EXPECT_EQ(first.result.value_or(""), "[fast] Explain how to sort a list");

    auto second = run(chat("Explain how to sort a list"));
    ASSERT_EQ(second.status, RequestStatus::Completed);
    EXPECT_TRUE(second.cacheHit);
    EXPECT_EQ(second.result, first.result);
    EXPECT_NE(second.id, first.id);

    EXPECT_EQ(model_->callCount(), 1u);
    EXPECT_EQ(primary_->size(), 1u);
    EXPECT_EQ(scheduler_->stats().cacheHits, 1u);
    EXPECT_EQ(optimizer_->metrics().cacheHits, 1u);
}

TEST_F(EndToEndTest, TemplatePromptNeverReachesModel) {
    auto snap = run(chat("hello!"));
    ASSERT_EQ(snap.status, RequestStatus::Completed);
    EXPECT_NE(snap.result.value_or("").find("ready to help"), std::string::npos);
    EXPECT_EQ(model_->callCount(), 0u);
    EXPECT_EQ(model_->batchCount(), 0u);
}

TEST_F(EndToEndTest, LowPriorityRequestsAreBatched) {
    std::vector<RequestId> ids;
    for (auto prompt : {"What is a", "What is b", "What is c"}) {
        auto id = scheduler_->submit(chat(prompt, "bob", RequestPriority::Batch));
        ASSERT_TRUE(id.hasValue());
        ids.push_back(id.value());
    }
    for (auto id : ids) {
        for (int i = 0; i < 2000; ++i) {
            auto snap = scheduler_->getStatus(id);
            if (snap && isTerminal(snap->status)) {
                EXPECT_EQ(snap->status, RequestStatus::Completed);
                break;
            }
            std::this_thread::sleep_for(2ms);
        }
    }

    EXPECT_EQ(model_->callCount(), 0u);
    EXPECT_GE(model_->batchCount(), 1u);
    EXPECT_EQ(batcher_->callsBatched(), 3u);
    EXPECT_EQ(optimizer_->metrics().batchOptimizations, 3u);
}

TEST_F(EndToEndTest, InteractionsArePersisted) {
    ASSERT_EQ(run(chat("What is entropy", "carol")).status, RequestStatus::Completed);

    bool inserted = false;
    for (const auto& sql : store_->executed()) {
        if (sql.find("INSERT INTO interactions") != std::string::npos &&
            sql.find("'carol'") != std::string::npos) {
            inserted = true;
        }
    }
    EXPECT_TRUE(inserted);
    EXPECT_EQ(pool_->stats().active, 0u);
}

TEST_F(EndToEndTest, CacheOutageDegradesButServes) {
    primary_->down = true;

    auto first = run(chat("Describe the water cycle"));
    ASSERT_EQ(first.status, RequestStatus::Completed);
    EXPECT_FALSE(cache_->primaryAvailable());
    EXPECT_EQ(metrics_.healthCheck().components.at("cache"), HealthStatus::Degraded);

    // The fallback store now holds the response.
    auto second = run(chat("Describe the water cycle"));
    ASSERT_EQ(second.status, RequestStatus::Completed);
    EXPECT_TRUE(second.cacheHit);

    primary_->down = false;
    EXPECT_TRUE(cache_->checkPrimary());
    EXPECT_EQ(metrics_.healthCheck().components.at("cache"), HealthStatus::Healthy);
}

TEST_F(EndToEndTest, EmptyPromptFailsWithoutRetry) {
    SubmitOptions options;
    options.requestType = "chat";
    options.payload = {{"context", "no prompt here"}};

    auto snap = run(std::move(options));
    ASSERT_EQ(snap.status, RequestStatus::Failed);
    ASSERT_TRUE(snap.error.has_value());
    EXPECT_EQ(snap.error->code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(snap.retryCount, 0u);
}

TEST_F(EndToEndTest, StatsReportCoversTheWholePath) {
    ASSERT_EQ(run(chat("Explain how to sort a list")).status, RequestStatus::Completed);
    ASSERT_EQ(run(chat("Explain how to sort a list")).status, RequestStatus::Completed);

    auto json = renderStatsJson({scheduler_.get(), cache_.get(), pool_.get(), optimizer_.get()});
    EXPECT_NE(json.find(R"("completed":2)"), std::string::npos);
    EXPECT_NE(json.find(R"("cache_hits":1)"), std::string::npos);
    EXPECT_NE(json.find(R"("primary_available":true)"), std::string::npos);
    EXPECT_NE(json.find(R"("optimizer":{"requests":2,)"), std::string::npos);

    auto scrape = metrics_.scrape();
    EXPECT_NE(scrape.find("sluice_requests_completed_total 2"), std::string::npos);
    EXPECT_NE(scrape.find("sluice_cache_hits_total 1"), std::string::npos);
}

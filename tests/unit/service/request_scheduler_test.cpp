/// @file request_scheduler_test.cpp
/// @brief Unit tests for RequestScheduler admission, ordering, retries and lifecycle.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "sluice/foundation/error_code.hpp"
#include "sluice/service/request_scheduler.hpp"

using namespace sluice::service;
using namespace sluice::foundation;
using namespace std::chrono_literals;

namespace {

/// Holds handlers until opened; honours cancellation.
struct Gate {
    std::atomic<bool> open{false};

    RequestHandler handler() {
        return [this](const RequestContext& ctx, const Payload&) {
            while (!open.load() && !ctx.cancelled()) {
                std::this_thread::sleep_for(1ms);
            }
            return HandlerOutcome::ok("released");
        };
    }
};

HandlerOutcome echo(const RequestContext&, const Payload& payload) {
    auto it = payload.find("prompt");
    return HandlerOutcome::ok(it == payload.end() ? "" : it->second + "!");
}

} // anonymous namespace

class RequestSchedulerTest : public ::testing::Test {
protected:
    RequestSchedulerConfig baseConfig(uint32_t workers = 2) {
        RequestSchedulerConfig cfg;
        cfg.workerCount = workers;
        cfg.defaultTimeout = 5s;
        cfg.backoffUnit = 10ms;
        cfg.maxBackoff = 100ms;
        cfg.breakerRecheckInterval = 10ms;
        cfg.rateLimits.limitPerMinute = 10000;
        cfg.rateLimits.limitPerHour = 100000;
        return cfg;
    }

    std::unique_ptr<RequestScheduler> make(RequestSchedulerConfig cfg) {
        auto scheduler = std::make_unique<RequestScheduler>(std::move(cfg), metrics_);
        scheduler->registerHandler("block", gate_.handler());
        return scheduler;
    }

    static RequestId submitOk(RequestScheduler& scheduler, SubmitOptions options) {
        auto id = scheduler.submit(std::move(options));
        EXPECT_TRUE(id.hasValue()) << (id ? "" : id.error().describe());
        return id ? id.value() : RequestId{};
    }

    static std::optional<RequestSnapshot> waitTerminal(const RequestScheduler& scheduler,
                                                       RequestId id,
                                                       std::chrono::milliseconds limit = 3s) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            auto snap = scheduler.getStatus(id);
            if (snap && isTerminal(snap->status)) {
                return snap;
            }
            std::this_thread::sleep_for(2ms);
        }
        return scheduler.getStatus(id);
    }

    static void waitProcessing(const RequestScheduler& scheduler, RequestId id) {
        for (int i = 0; i < 1000; ++i) {
            auto snap = scheduler.getStatus(id);
            if (snap && snap->status == RequestStatus::Processing) {
                return;
            }
            std::this_thread::sleep_for(1ms);
        }
        FAIL() << "request never started";
    }

    SluiceMetrics metrics_;
    Gate gate_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(RequestSchedulerTest, SubmitBeforeStartRejected) {
    auto scheduler = make(baseConfig());
    auto id = scheduler->submit({"chat", {{"prompt", "hi"}}});
    ASSERT_TRUE(id.hasError());
    EXPECT_EQ(id.error().code(), ErrorCode::SchedulerStopped);
}

TEST_F(RequestSchedulerTest, StartTwiceFails) {
    auto scheduler = make(baseConfig());
    ASSERT_TRUE(scheduler->start().hasValue());
    EXPECT_TRUE(scheduler->isRunning());

    auto again = scheduler->start();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::TaskAlreadyRunning);
}

TEST_F(RequestSchedulerTest, CompletesRequest) {
    auto scheduler = make(baseConfig());
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto id = submitOk(*scheduler, {"chat", {{"prompt", "hi"}}, "alice"});
    auto snap = waitTerminal(*scheduler, id);

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Completed);
    EXPECT_EQ(snap->result.value_or(""), "hi!");
    EXPECT_EQ(snap->userId, "alice");
    EXPECT_TRUE(snap->workerId.isValid());
    EXPECT_TRUE(snap->processingTime().has_value());
    EXPECT_FALSE(snap->error.has_value());
}

TEST_F(RequestSchedulerTest, RegisteredHandlerWinsOverDefault) {
    auto scheduler = make(baseConfig());
    scheduler->setDefaultHandler(echo);
    scheduler->registerHandler("upper", [](const RequestContext&, const Payload&) {
        return HandlerOutcome::ok("UPPER");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, {"upper", {{"prompt", "x"}}}));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->result.value_or(""), "UPPER");
}

TEST_F(RequestSchedulerTest, MissingHandlerFails) {
    auto scheduler = make(baseConfig());
    ASSERT_TRUE(scheduler->start().hasValue());

    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, {"unknown", {{"prompt", "x"}}}));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Failed);
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(snap->error->code(), ErrorCode::HandlerMissing);
}

// ============================================================================
// Ordering
// ============================================================================

TEST_F(RequestSchedulerTest, HigherPriorityRunsFirst) {
    auto scheduler = make(baseConfig(1));
    std::mutex orderMutex;
    std::vector<std::string> order;
    scheduler->setDefaultHandler([&](const RequestContext&, const Payload& payload) {
        std::lock_guard lock(orderMutex);
        order.push_back(payload.at("n"));
        return HandlerOutcome::ok("done");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    auto blocker = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, blocker);

    std::vector<RequestId> ids;
    ids.push_back(submitOk(*scheduler, {"chat", {{"n", "low"}}, "u", RequestPriority::Low}));
    ids.push_back(submitOk(*scheduler, {"chat", {{"n", "normal-1"}}, "u", RequestPriority::Normal}));
    ids.push_back(submitOk(*scheduler, {"chat", {{"n", "critical"}}, "u", RequestPriority::Critical}));
    ids.push_back(submitOk(*scheduler, {"chat", {{"n", "normal-2"}}, "u", RequestPriority::Normal}));
    ids.push_back(submitOk(*scheduler, {"chat", {{"n", "high"}}, "u", RequestPriority::High}));
    EXPECT_EQ(scheduler->queueSize(), 5u);

    gate_.open = true;
    for (auto id : ids) {
        ASSERT_TRUE(waitTerminal(*scheduler, id).has_value());
    }

    std::lock_guard lock(orderMutex);
    EXPECT_EQ(order, (std::vector<std::string>{"critical", "high", "normal-1", "normal-2", "low"}));
}

// ============================================================================
// Deduplication
// ============================================================================

TEST_F(RequestSchedulerTest, DuplicateReturnsExistingId) {
    auto scheduler = make(baseConfig());
    std::atomic<int> calls{0};
    scheduler->registerHandler("slow", [&](const RequestContext& ctx, const Payload&) {
        ++calls;
        while (!gate_.open.load() && !ctx.cancelled()) {
            std::this_thread::sleep_for(1ms);
        }
        return HandlerOutcome::ok("once");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    auto first = submitOk(*scheduler, {"slow", {{"prompt", "same"}}});
    auto second = submitOk(*scheduler, {"slow", {{"prompt", "same"}}});
    EXPECT_EQ(first, second);

    gate_.open = true;
    auto snap = waitTerminal(*scheduler, first);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Completed);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(scheduler->stats().totalRequests, 1u);

    // Once terminal, the same payload is a new request.
    auto third = submitOk(*scheduler, {"slow", {{"prompt", "same"}}});
    EXPECT_NE(third, first);
    ASSERT_TRUE(waitTerminal(*scheduler, third).has_value());
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(RequestSchedulerTest, DeduplicationCanBeDisabled) {
    auto scheduler = make(baseConfig(1));
    ASSERT_TRUE(scheduler->start().hasValue());

    SubmitOptions options{"block", {{"prompt", "same"}}};
    options.deduplicate = false;
    auto a = submitOk(*scheduler, options);
    auto b = submitOk(*scheduler, options);
    EXPECT_NE(a, b);
    gate_.open = true;
}

// ============================================================================
// Deadlines
// ============================================================================

TEST_F(RequestSchedulerTest, SlowHandlerTimesOut) {
    auto scheduler = make(baseConfig());
    scheduler->registerHandler("sleepy", [](const RequestContext& ctx, const Payload&) {
        auto until = std::chrono::steady_clock::now() + 1s;
        while (std::chrono::steady_clock::now() < until && !ctx.cancelled()) {
            std::this_thread::sleep_for(1ms);
        }
        return HandlerOutcome::ok("late");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    SubmitOptions options{"sleepy", {{"prompt", "x"}}};
    options.timeout = 10ms;
    auto start = std::chrono::steady_clock::now();
    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, options));

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::TimedOut);
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(snap->error->code(), ErrorCode::TimedOut);
    EXPECT_FALSE(snap->result.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(scheduler->breakers().get("sleepy")->failureCount(), 1u);
    EXPECT_EQ(scheduler->stats().timedOut, 1u);
}

TEST_F(RequestSchedulerTest, DeadlinePassedWhileQueued) {
    auto scheduler = make(baseConfig(1));
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto blocker = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, blocker);

    SubmitOptions options{"chat", {{"prompt", "x"}}};
    options.timeout = 20ms;
    auto id = submitOk(*scheduler, options);
    std::this_thread::sleep_for(60ms);
    gate_.open = true;

    auto snap = waitTerminal(*scheduler, id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::TimedOut);
    EXPECT_FALSE(snap->startedAt.has_value());
}

// ============================================================================
// Retries
// ============================================================================

TEST_F(RequestSchedulerTest, RetryableFailureIsRetried) {
    auto scheduler = make(baseConfig());
    std::atomic<int> calls{0};
    scheduler->setDefaultHandler([&](const RequestContext& ctx, const Payload&) {
        if (++calls < 3) {
            return HandlerOutcome::retryable(
                SluiceError(ErrorCode::DownstreamError, "busy", ctx.requestId));
        }
        return HandlerOutcome::ok("third time");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    SubmitOptions options{"chat", {{"prompt", "x"}}};
    options.maxRetries = 3;
    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, options));

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Completed);
    EXPECT_EQ(snap->retryCount, 2u);
    EXPECT_EQ(snap->result.value_or(""), "third time");
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(RequestSchedulerTest, RetriesExhausted) {
    auto scheduler = make(baseConfig());
    std::atomic<int> calls{0};
    scheduler->setDefaultHandler([&](const RequestContext& ctx, const Payload&) {
        ++calls;
        return HandlerOutcome::retryable(
            SluiceError(ErrorCode::DownstreamError, "still busy", ctx.requestId));
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    SubmitOptions options{"chat", {{"prompt", "x"}}};
    options.maxRetries = 1;
    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, options));

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Failed);
    EXPECT_EQ(snap->retryCount, 1u);
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(snap->error->code(), ErrorCode::DownstreamError);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(RequestSchedulerTest, FatalFailureIsNotRetried) {
    auto scheduler = make(baseConfig());
    std::atomic<int> calls{0};
    scheduler->setDefaultHandler([&](const RequestContext& ctx, const Payload&) {
        ++calls;
        return HandlerOutcome::fatal(SluiceError(ErrorCode::InvalidArgument, "bad", ctx.requestId));
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, {"chat", {{"prompt", "x"}}}));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Failed);
    EXPECT_EQ(snap->retryCount, 0u);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RequestSchedulerTest, ThrowingHandlerCountsAsRetryable) {
    auto scheduler = make(baseConfig());
    scheduler->setDefaultHandler([](const RequestContext&, const Payload&) -> HandlerOutcome {
        throw std::runtime_error("handler exploded");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    SubmitOptions options{"chat", {{"prompt", "x"}}};
    options.maxRetries = 0;
    auto snap = waitTerminal(*scheduler, submitOk(*scheduler, options));

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Failed);
    ASSERT_TRUE(snap->error.has_value());
    EXPECT_EQ(snap->error->code(), ErrorCode::DownstreamError);
    EXPECT_NE(std::string(snap->error->message()).find("exploded"), std::string::npos);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(RequestSchedulerTest, CancelQueuedRequest) {
    auto scheduler = make(baseConfig(1));
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto blocker = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, blocker);
    auto id = submitOk(*scheduler, {"chat", {{"prompt", "x"}}});
    EXPECT_EQ(scheduler->queueSize(), 1u);

    EXPECT_TRUE(scheduler->cancel(id));
    EXPECT_FALSE(scheduler->cancel(id));
    EXPECT_FALSE(scheduler->cancel(RequestId(9999)));
    EXPECT_EQ(scheduler->queueSize(), 0u);

    auto snap = scheduler->getStatus(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Cancelled);
    gate_.open = true;
}

TEST_F(RequestSchedulerTest, CancelInFlightRequest) {
    auto scheduler = make(baseConfig());
    ASSERT_TRUE(scheduler->start().hasValue());

    auto id = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, id);
    EXPECT_TRUE(scheduler->cancel(id));

    auto snap = waitTerminal(*scheduler, id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, RequestStatus::Cancelled);
    EXPECT_FALSE(snap->result.has_value());
    EXPECT_EQ(scheduler->stats().cancelled, 1u);
}

TEST_F(RequestSchedulerTest, StopCancelsEverything) {
    auto scheduler = make(baseConfig(1));
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto inFlight = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, inFlight);
    auto queued = submitOk(*scheduler, {"chat", {{"prompt", "x"}}});

    scheduler->stop();
    EXPECT_FALSE(scheduler->isRunning());

    for (auto id : {inFlight, queued}) {
        auto snap = scheduler->getStatus(id);
        ASSERT_TRUE(snap.has_value());
        EXPECT_EQ(snap->status, RequestStatus::Cancelled);
        ASSERT_TRUE(snap->error.has_value());
        EXPECT_EQ(snap->error->code(), ErrorCode::SchedulerStopped);
    }

    auto late = scheduler->submit({"chat", {{"prompt", "y"}}});
    ASSERT_TRUE(late.hasError());
    EXPECT_EQ(late.error().code(), ErrorCode::SchedulerStopped);
    EXPECT_EQ(metrics_.healthCheck().components.at("scheduler"), HealthStatus::Unhealthy);
}

// ============================================================================
// Admission
// ============================================================================

TEST_F(RequestSchedulerTest, QueueFullRejects) {
    auto cfg = baseConfig(1);
    cfg.maxQueueSize = 2;
    auto scheduler = make(cfg);
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto blocker = submitOk(*scheduler, {"block", {}});
    waitProcessing(*scheduler, blocker);
    submitOk(*scheduler, {"chat", {{"prompt", "1"}}});
    submitOk(*scheduler, {"chat", {{"prompt", "2"}}});

    auto rejected = scheduler->submit({"chat", {{"prompt", "3"}}});
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::QueueFull);
    EXPECT_EQ(scheduler->stats().rejectedByReason.at("queue_full"), 1u);
    gate_.open = true;
}

TEST_F(RequestSchedulerTest, RateLimitPerUser) {
    auto cfg = baseConfig();
    cfg.rateLimits.limitPerMinute = 2;
    auto scheduler = make(cfg);
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    submitOk(*scheduler, {"chat", {{"prompt", "1"}}, "alice"});
    submitOk(*scheduler, {"chat", {{"prompt", "2"}}, "alice"});
    auto third = scheduler->submit({"chat", {{"prompt", "3"}}, "alice"});
    ASSERT_TRUE(third.hasError());
    EXPECT_EQ(third.error().code(), ErrorCode::RateLimited);

    submitOk(*scheduler, {"chat", {{"prompt", "3"}}, "bob"});

    auto status = scheduler->rateLimitStatus("alice");
    EXPECT_TRUE(status.limited);
    EXPECT_EQ(status.remainingPerMinute, 0u);
    EXPECT_EQ(scheduler->stats().rejectedByReason.at("rate_limited"), 1u);
}

TEST_F(RequestSchedulerTest, BreakerOpensAndRecoversThroughProbe) {
    auto cfg = baseConfig();
    cfg.breaker.failureThreshold = 2;
    cfg.breaker.recoveryTimeout = 100ms;
    auto scheduler = make(cfg);
    std::atomic<bool> healthy{false};
    scheduler->setDefaultHandler([&](const RequestContext& ctx, const Payload&) {
        if (!healthy.load()) {
            return HandlerOutcome::fatal(
                SluiceError(ErrorCode::DownstreamError, "down", ctx.requestId));
        }
        return HandlerOutcome::ok("up");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    for (auto prompt : {"a", "b"}) {
        auto snap = waitTerminal(*scheduler, submitOk(*scheduler, {"chat", {{"prompt", prompt}}}));
        ASSERT_TRUE(snap.has_value());
        EXPECT_EQ(snap->status, RequestStatus::Failed);
    }
    EXPECT_EQ(scheduler->breakers().get("chat")->state(), CircuitBreaker::State::Open);
    EXPECT_EQ(scheduler->stats().openBreakers, 1u);

    auto rejected = scheduler->submit({"chat", {{"prompt", "c"}}});
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::CircuitOpen);
    EXPECT_EQ(scheduler->stats().rejectedByReason.at("circuit_open"), 1u);

    // Other request types are unaffected.
    scheduler->registerHandler("other", echo);
    EXPECT_TRUE(scheduler->submit({"other", {{"prompt", "d"}}}).hasValue());

    std::this_thread::sleep_for(150ms);
    healthy = true;
    auto probe = waitTerminal(*scheduler, submitOk(*scheduler, {"chat", {{"prompt", "e"}}}));
    ASSERT_TRUE(probe.has_value());
    EXPECT_EQ(probe->status, RequestStatus::Completed);
    EXPECT_EQ(scheduler->breakers().get("chat")->state(), CircuitBreaker::State::Closed);
}

TEST_F(RequestSchedulerTest, CircuitOpenRejectionDoesNotUseRateSlot) {
    auto cfg = baseConfig();
    cfg.rateLimits.limitPerMinute = 3;
    cfg.breaker.failureThreshold = 1;
    cfg.breaker.recoveryTimeout = 10s;
    auto scheduler = make(cfg);
    scheduler->registerHandler("bad", [](const RequestContext& ctx, const Payload&) {
        return HandlerOutcome::fatal(SluiceError(ErrorCode::DownstreamError, "down", ctx.requestId));
    });
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto failed = waitTerminal(*scheduler, submitOk(*scheduler, {"bad", {{"prompt", "0"}}, "alice"}));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, RequestStatus::Failed);
    ASSERT_EQ(scheduler->breakers().get("bad")->state(), CircuitBreaker::State::Open);

    for (auto prompt : {"1", "2"}) {
        auto rejected = scheduler->submit({"bad", {{"prompt", prompt}}, "alice"});
        ASSERT_TRUE(rejected.hasError());
        EXPECT_EQ(rejected.error().code(), ErrorCode::CircuitOpen);
    }
    EXPECT_EQ(scheduler->rateLimitStatus("alice").remainingPerMinute, 2u);

    // One request admitted so far; two more fit in the window.
    submitOk(*scheduler, {"good", {{"prompt", "a"}}, "alice"});
    submitOk(*scheduler, {"good", {{"prompt", "b"}}, "alice"});
    auto over = scheduler->submit({"good", {{"prompt", "c"}}, "alice"});
    ASSERT_TRUE(over.hasError());
    EXPECT_EQ(over.error().code(), ErrorCode::RateLimited);
}

TEST_F(RequestSchedulerTest, DuplicateSubmitDoesNotUseRateSlot) {
    auto cfg = baseConfig();
    cfg.rateLimits.limitPerMinute = 2;
    auto scheduler = make(cfg);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto first = submitOk(*scheduler, {"block", {{"prompt", "same"}}, "alice"});
    for (int i = 0; i < 3; ++i) {
        auto again = scheduler->submit({"block", {{"prompt", "same"}}, "alice"});
        ASSERT_TRUE(again.hasValue());
        EXPECT_EQ(again.value(), first);
    }
    EXPECT_EQ(scheduler->rateLimitStatus("alice").remainingPerMinute, 1u);

    submitOk(*scheduler, {"block", {{"prompt", "other"}}, "alice"});
    gate_.open = true;
}

TEST_F(RequestSchedulerTest, IdleRateLimitUsersAreForgotten) {
    auto cfg = baseConfig();
    cfg.rateLimits.minuteWindow = 20ms;
    cfg.rateLimits.hourWindow = 40ms;
    cfg.rateLimitSweepInterval = 10ms;
    auto scheduler = make(cfg);
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    for (auto user : {"u1", "u2", "u3"}) {
        submitOk(*scheduler, {"chat", {{"prompt", user}}, user});
    }
    EXPECT_EQ(scheduler->trackedRateLimitUsers(), 3u);

    for (int i = 0; i < 200 && scheduler->trackedRateLimitUsers() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(scheduler->trackedRateLimitUsers(), 0u);
    EXPECT_EQ(scheduler->stats().rateLimitedUsers, 0u);
}

// ============================================================================
// Stats / history
// ============================================================================

TEST_F(RequestSchedulerTest, StatsTrackOutcomes) {
    auto scheduler = make(baseConfig(3));
    scheduler->setDefaultHandler([](const RequestContext&, const Payload& payload) {
        return HandlerOutcome::ok("r", payload.at("prompt") == "cached");
    });
    ASSERT_TRUE(scheduler->start().hasValue());

    std::vector<RequestId> ids;
    for (auto prompt : {"cached", "fresh-1", "fresh-2"}) {
        ids.push_back(submitOk(*scheduler, {"chat", {{"prompt", prompt}}}));
    }
    for (auto id : ids) {
        ASSERT_TRUE(waitTerminal(*scheduler, id).has_value());
    }

    auto s = scheduler->stats();
    EXPECT_EQ(s.totalRequests, 3u);
    EXPECT_EQ(s.completed, 3u);
    EXPECT_EQ(s.cacheHits, 1u);
    EXPECT_EQ(s.queueSize, 0u);
    EXPECT_EQ(s.activeRequests, 0u);
    ASSERT_EQ(s.workers.size(), 3u);

    uint64_t processed = 0;
    for (const auto& w : s.workers) {
        processed += w.processed;
    }
    EXPECT_EQ(processed, 3u);
    EXPECT_EQ(metrics_.counterValue("sluice_requests_completed_total"), 3u);
    EXPECT_EQ(metrics_.counterValue("sluice_requests_submitted_total"), 3u);
}

TEST_F(RequestSchedulerTest, HistoryIsBounded) {
    auto cfg = baseConfig();
    cfg.historyCapacity = 1;
    auto scheduler = make(cfg);
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    auto first = submitOk(*scheduler, {"chat", {{"prompt", "1"}}});
    ASSERT_TRUE(waitTerminal(*scheduler, first).has_value());
    auto second = submitOk(*scheduler, {"chat", {{"prompt", "2"}}});
    ASSERT_TRUE(waitTerminal(*scheduler, second).has_value());

    EXPECT_FALSE(scheduler->getStatus(first).has_value());
    EXPECT_TRUE(scheduler->getStatus(second).has_value());
}

TEST_F(RequestSchedulerTest, ConcurrentSubmittersAllReachTerminalState) {
    auto scheduler = make(baseConfig(4));
    scheduler->setDefaultHandler(echo);
    ASSERT_TRUE(scheduler->start().hasValue());

    std::mutex idsMutex;
    std::vector<RequestId> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                auto id = scheduler->submit(
                    {"chat", {{"prompt", std::to_string(t) + "-" + std::to_string(i)}}});
                if (id) {
                    std::lock_guard lock(idsMutex);
                    ids.push_back(id.value());
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    ASSERT_EQ(ids.size(), 100u);
    for (auto id : ids) {
        auto snap = waitTerminal(*scheduler, id);
        ASSERT_TRUE(snap.has_value());
        EXPECT_EQ(snap->status, RequestStatus::Completed);
    }
    EXPECT_EQ(scheduler->stats().completed, 100u);
}

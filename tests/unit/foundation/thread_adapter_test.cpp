#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "sluice/foundation/job_scheduler.hpp"
#include "sluice/foundation/periodic_task.hpp"

using namespace sluice::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// JobScheduler
// ---------------------------------------------------------------------------

TEST(ThreadErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::ThreadError), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::TaskAlreadyRunning), "Thread");
}

TEST(JobSchedulerTest, ScheduleAndWaitSingleJob) {
    JobScheduler scheduler(2);
    std::atomic<bool> done{false};

    auto result = scheduler.schedule([&] {
        std::this_thread::sleep_for(20ms);
        done.store(true);
    });
    ASSERT_TRUE(result.hasValue());

    EXPECT_TRUE(scheduler.wait(result.value()).hasValue());
    EXPECT_TRUE(done.load());
}

TEST(JobSchedulerTest, JobsGetUniqueIds) {
    JobScheduler scheduler(2);
    auto a = scheduler.schedule([] {});
    auto b = scheduler.schedule([] {}, JobPriority::Critical);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value(), b.value());
}

TEST(JobSchedulerTest, SubmitDeliversValue) {
    JobScheduler scheduler(2);
    auto future = scheduler.submit<int>([] { return 42; }, JobPriority::High);
    ASSERT_TRUE(future.hasValue());
    EXPECT_EQ(future.value().get(), 42);
}

TEST(JobSchedulerTest, SubmitDeliversException) {
    JobScheduler scheduler(1);
    auto future = scheduler.submit<int>([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_TRUE(future.hasValue());
    EXPECT_THROW(future.value().get(), std::runtime_error);
}

TEST(JobSchedulerTest, WaitReportsThrowingJob) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] { throw std::runtime_error("handler failed"); });
    ASSERT_TRUE(id.hasValue());

    auto waited = scheduler.wait(id.value());
    ASSERT_TRUE(waited.hasError());
    EXPECT_EQ(waited.error().code(), ErrorCode::ThreadError);
}

TEST(JobSchedulerTest, WaitNonExistentJobReturnsError) {
    JobScheduler scheduler(1);
    auto result = scheduler.wait(99999);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST(JobSchedulerTest, CancelPreventsExecution) {
    JobScheduler scheduler(1);
    std::atomic<bool> release{false};
    std::atomic<bool> targetRan{false};

    auto blocker = scheduler.schedule([&] {
        while (!release.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(1ms);
        }
    });
    ASSERT_TRUE(blocker.hasValue());

    auto target = scheduler.schedule([&] { targetRan.store(true); });
    ASSERT_TRUE(target.hasValue());
    EXPECT_TRUE(scheduler.cancel(target.value()).hasValue());

    release.store(true, std::memory_order_release);
    (void)scheduler.wait(blocker.value());
    (void)scheduler.wait(target.value());
    EXPECT_FALSE(targetRan.load());
}

TEST(JobSchedulerTest, CancelCompletedJobReturnsError) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] {});
    ASSERT_TRUE(id.hasValue());
    (void)scheduler.wait(id.value());

    auto cancelled = scheduler.cancel(id.value());
    ASSERT_TRUE(cancelled.hasError());
    EXPECT_EQ(cancelled.error().code(), ErrorCode::Cancelled);
}

TEST(JobSchedulerTest, ScheduleAfterShutdownFails) {
    JobScheduler scheduler(1);
    scheduler.shutdown();
    scheduler.shutdown();

    auto result = scheduler.schedule([] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobScheduleFailed);
}

// ---------------------------------------------------------------------------
// PeriodicTask
// ---------------------------------------------------------------------------

TEST(PeriodicTaskTest, RunsRepeatedlyUntilStopped) {
    std::atomic<int> calls{0};
    PeriodicTask task("tick", 10ms, [&] { calls.fetch_add(1); });

    ASSERT_TRUE(task.start().hasValue());
    EXPECT_TRUE(task.isRunning());
    EXPECT_EQ(task.name(), "tick");

    std::this_thread::sleep_for(100ms);
    task.stop();

    EXPECT_FALSE(task.isRunning());
    auto afterStop = calls.load();
    EXPECT_GE(afterStop, 3);
    EXPECT_EQ(task.runCount(), static_cast<uint64_t>(afterStop));

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), afterStop);
}

TEST(PeriodicTaskTest, FirstRunWaitsOneInterval) {
    std::atomic<int> calls{0};
    PeriodicTask task("slow", 1s, [&] { calls.fetch_add(1); });
    ASSERT_TRUE(task.start().hasValue());
    std::this_thread::sleep_for(50ms);
    task.stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST(PeriodicTaskTest, DoubleStartIsRejected) {
    PeriodicTask task("dup", 50ms, [] {});
    ASSERT_TRUE(task.start().hasValue());

    auto second = task.start();
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::TaskAlreadyRunning);
    task.stop();
    task.stop();
}

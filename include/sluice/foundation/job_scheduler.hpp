#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for handler execution.

#include "sluice/foundation/sluice_result.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace sluice::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Thread pool facade over kcenon's thread_system.
///
/// The request scheduler runs each handler invocation here so that its
/// worker can stop waiting at the request deadline while the handler
/// observes its cancellation token. Uses PIMPL to keep thread_system
/// headers out of the public API.
///
/// Example:
/// @code
///   JobScheduler jobs(4);
///   auto future = jobs.submit<int>([] { return 42; }, JobPriority::High);
///   if (future) {
///       int v = future.value().get();
///   }
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by a pool of @p numThreads workers.
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency(),
                          std::string name = "sluice_jobs");

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule a job with the given priority.
    /// @return The assigned JobId, or JobScheduleFailed.
    SluiceResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Schedule a value-returning job and hand back its future.
    ///
    /// Exceptions thrown by @p fn are delivered through the future.
    template <typename R>
    SluiceResult<std::future<R>> submit(std::function<R()> fn,
                                        JobPriority priority = JobPriority::Normal) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto future = task->get_future();
        auto id = schedule([task]() { (*task)(); }, priority);
        if (!id) {
            return SluiceResult<std::future<R>>::err(id.error());
        }
        return SluiceResult<std::future<R>>::ok(std::move(future));
    }

    /// Block until the job identified by @p id completes.
    /// @return Success, or NotFound / ThreadError when the job threw.
    SluiceResult<void> wait(JobId id);

    /// Request cancellation of a job that has not started yet.
    /// A job that already finished yields a Cancelled error.
    SluiceResult<void> cancel(JobId id);

    /// Number of scheduled jobs that have not finished.
    [[nodiscard]] std::size_t pendingJobs() const;

    /// Stop the pool, waiting for running jobs. Idempotent.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sluice::foundation

/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "sluice/foundation/job_scheduler.hpp"

#include "sluice/foundation/sluice_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sluice::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: sluice -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// Finished entries are pruned once the tracking map grows past this.
static constexpr std::size_t kPruneThreshold = 1024;

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> stopped{false};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancelFlags;
    mutable std::mutex mutex;

    void pruneFinished() {
        for (auto it = futures.begin(); it != futures.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                cancelFlags.erase(it->first);
                it = futures.erase(it);
            } else {
                ++it;
            }
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
JobScheduler::JobScheduler(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads == 0 ? 1 : numThreads);
    for (std::size_t i = 0; i < (numThreads == 0 ? 1 : numThreads); ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_) {
        shutdown();
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
SluiceResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job, JobPriority priority) {
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return SluiceResult<JobId>::err(
            SluiceError(ErrorCode::JobScheduleFailed, "job scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("sluice_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->futures.size() >= kPruneThreshold) {
            impl_->pruneFinished();
        }
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return SluiceResult<JobId>::err(
            SluiceError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return SluiceResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
SluiceResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return SluiceResult<void>::err(
                SluiceError(ErrorCode::NotFound, "job not found"));
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ThreadError, "job execution failed"));
    }

    return SluiceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
SluiceResult<void> JobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::NotFound, "job not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end() &&
        futIt->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::Cancelled, "job already completed"));
    }

    flagIt->second->store(true, std::memory_order_release);
    return SluiceResult<void>::ok();
}

std::size_t JobScheduler::pendingJobs() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t pending = 0;
    for (const auto& [_, future] : impl_->futures) {
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++pending;
        }
    }
    return pending;
}

void JobScheduler::shutdown() {
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (impl_->pool) {
        impl_->pool->stop(false);  // graceful: wait for running jobs
        SLUICE_LOG_DEBUG(LogCategory::Core, "job scheduler stopped");
    }
}

} // namespace sluice::foundation

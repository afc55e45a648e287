/// @file periodic_task.cpp
/// @brief PeriodicTask timer loop.

#include "sluice/foundation/periodic_task.hpp"

#include "sluice/foundation/sluice_logger.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace sluice::foundation {

struct PeriodicTask::Impl {
    std::string name;
    std::chrono::milliseconds interval;
    Callback callback;

    std::thread timerThread;
    std::mutex mutex;
    std::condition_variable cv;
    bool stopRequested{false};
    std::atomic<bool> running{false};
    std::atomic<uint64_t> runs{0};

    void timerLoop() {
        std::unique_lock lock(mutex);
        while (!stopRequested) {
            if (cv.wait_for(lock, interval, [this] { return stopRequested; })) {
                break;
            }
            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                SLUICE_LOG_ERROR(LogCategory::Core,
                                 "periodic task '" + name + "' failed: " + e.what());
            }
            runs.fetch_add(1, std::memory_order_relaxed);
            lock.lock();
        }
    }
};

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           Callback callback)
    : impl_(std::make_unique<Impl>()) {
    impl_->name = std::move(name);
    impl_->interval = interval;
    impl_->callback = std::move(callback);
}

PeriodicTask::~PeriodicTask() {
    stop();
}

SluiceResult<void> PeriodicTask::start() {
    if (impl_->running.exchange(true)) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TaskAlreadyRunning,
                        "periodic task '" + impl_->name + "' is already running"));
    }
    {
        std::lock_guard lock(impl_->mutex);
        impl_->stopRequested = false;
    }
    impl_->timerThread = std::thread([this]() { impl_->timerLoop(); });
    return SluiceResult<void>::ok();
}

void PeriodicTask::stop() {
    if (!impl_->running.load()) {
        return;
    }
    {
        std::lock_guard lock(impl_->mutex);
        impl_->stopRequested = true;
    }
    impl_->cv.notify_all();
    if (impl_->timerThread.joinable()) {
        impl_->timerThread.join();
    }
    impl_->running.store(false);
}

bool PeriodicTask::isRunning() const {
    return impl_->running.load();
}

uint64_t PeriodicTask::runCount() const {
    return impl_->runs.load(std::memory_order_relaxed);
}

const std::string& PeriodicTask::name() const {
    return impl_->name;
}

}  // namespace sluice::foundation

/// @file request_batcher.cpp
/// @brief RequestBatcher implementation.

#include "sluice/service/request_batcher.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::ErrorCode;
using sluice::foundation::LogCategory;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds kPollSlice{10};

struct PendingCall {
    ModelCall call;
    std::promise<SluiceResult<std::string>> promise;
    Clock::time_point flushAt;
};

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct RequestBatcher::Impl {
    RequestBatcherConfig config;
    ModelClient& client;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<PendingCall> pending;
    bool running = false;
    bool stopRequested = false;
    std::thread flusher;

    uint64_t batches = 0;
    uint64_t batchedCalls = 0;

    Impl(RequestBatcherConfig cfg, ModelClient& c)
        : config(cfg), client(c) {}

    [[nodiscard]] Clock::time_point nextFlush() const {
        auto next = Clock::time_point::max();
        for (const auto& p : pending) {
            next = std::min(next, p.flushAt);
        }
        return next;
    }

    void run() {
        std::unique_lock lock(mutex);
        while (!stopRequested) {
            if (pending.empty()) {
                cv.wait(lock, [this] { return stopRequested || !pending.empty(); });
                continue;
            }

            if (pending.size() < config.maxBatchSize && Clock::now() < nextFlush()) {
                cv.wait_until(lock, nextFlush(), [this] {
                    return stopRequested || pending.size() >= config.maxBatchSize;
                });
                continue;
            }

            // Most urgent first, so the call that triggered the flush is in it.
            std::stable_sort(pending.begin(), pending.end(),
                             [](const PendingCall& a, const PendingCall& b) {
                                 return a.flushAt < b.flushAt;
                             });
            std::vector<PendingCall> batch;
            auto take = std::min(pending.size(), config.maxBatchSize);
            batch.reserve(take);
            for (std::size_t i = 0; i < take; ++i) {
                batch.push_back(std::move(pending.front()));
                pending.pop_front();
            }
            ++batches;
            batchedCalls += batch.size();

            lock.unlock();
            flush(batch);
            lock.lock();
        }

        // Calls still waiting at shutdown are failed, never dropped silently.
        for (auto& p : pending) {
            p.promise.set_value(SluiceResult<std::string>::err(
                SluiceError(ErrorCode::Cancelled, "request batcher stopped",
                            p.call.requestContext.requestId)));
        }
        pending.clear();
    }

    void flush(std::vector<PendingCall>& batch) {
        std::vector<ModelCall> calls;
        calls.reserve(batch.size());
        for (const auto& p : batch) {
            calls.push_back(p.call);
        }

        SLUICE_LOG_DEBUG(LogCategory::Optimizer,
                         "flushing batch of " + std::to_string(calls.size()) + " model calls");

        try {
            auto results = client.generateBatch(calls);
            for (std::size_t i = 0; i < batch.size(); ++i) {
                if (i < results.size()) {
                    batch[i].promise.set_value(std::move(results[i]));
                } else {
                    batch[i].promise.set_value(SluiceResult<std::string>::err(
                        SluiceError(ErrorCode::DownstreamError, "batch returned too few results")));
                }
            }
        } catch (const std::exception& e) {
            SLUICE_LOG_ERROR(LogCategory::Optimizer, std::string("batched model call threw: ") + e.what());
            for (auto& p : batch) {
                p.promise.set_value(SluiceResult<std::string>::err(
                    SluiceError(ErrorCode::DownstreamError, e.what())));
            }
        }
    }
};

// ── Construction / lifecycle ────────────────────────────────────────────────

RequestBatcher::RequestBatcher(RequestBatcherConfig config, ModelClient& client)
    : impl_(std::make_unique<Impl>(config, client)) {
    if (impl_->config.maxBatchSize == 0) {
        impl_->config.maxBatchSize = 1;
    }
}

RequestBatcher::~RequestBatcher() {
    stop();
}

SluiceResult<void> RequestBatcher::start() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->running) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TaskAlreadyRunning, "request batcher already running"));
    }
    impl_->running = true;
    impl_->stopRequested = false;
    impl_->flusher = std::thread([this] { impl_->run(); });
    return SluiceResult<void>::ok();
}

void RequestBatcher::stop() {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->running) {
            return;
        }
        impl_->stopRequested = true;
        impl_->running = false;
    }
    impl_->cv.notify_all();
    if (impl_->flusher.joinable()) {
        impl_->flusher.join();
    }
}

// ── enqueue() / submit() ────────────────────────────────────────────────────

std::future<SluiceResult<std::string>> RequestBatcher::enqueue(ModelCall call) {
    std::promise<SluiceResult<std::string>> promise;
    auto future = promise.get_future();

    const auto now = Clock::now();
    auto flushAt = now + impl_->config.maxBatchDelay;
    const auto& deadline = call.requestContext.deadline;
    if (deadline != Clock::time_point::max()) {
        flushAt = std::min(flushAt, deadline - impl_->config.deadlineMargin);
    }

    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->running) {
            promise.set_value(SluiceResult<std::string>::err(
                SluiceError(ErrorCode::SchedulerStopped, "request batcher not running")));
            return future;
        }
        impl_->pending.push_back(PendingCall{std::move(call), std::move(promise), flushAt});
    }
    impl_->cv.notify_one();
    return future;
}

SluiceResult<std::string> RequestBatcher::submit(ModelCall call) {
    const RequestContext ctx = call.requestContext;
    auto future = enqueue(std::move(call));

    while (future.wait_for(kPollSlice) != std::future_status::ready) {
        if (ctx.cancelled()) {
            return SluiceResult<std::string>::err(
                SluiceError(ErrorCode::Cancelled, "batched call cancelled", ctx.requestId));
        }
        if (ctx.expired()) {
            return SluiceResult<std::string>::err(
                SluiceError(ErrorCode::TimedOut, "batched call exceeded request deadline",
                            ctx.requestId));
        }
    }
    return future.get();
}

// ── Stats ───────────────────────────────────────────────────────────────────

std::size_t RequestBatcher::pending() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->pending.size();
}

uint64_t RequestBatcher::batchesFlushed() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->batches;
}

uint64_t RequestBatcher::callsBatched() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->batchedCalls;
}

const RequestBatcherConfig& RequestBatcher::config() const noexcept {
    return impl_->config;
}

} // namespace sluice::service

#pragma once

/// @file request_batcher.hpp
/// @brief Groups low-priority model calls into batched downstream calls.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "sluice/foundation/sluice_result.hpp"
#include "sluice/service/model_client.hpp"

namespace sluice::service {

/// Configuration for RequestBatcher.
struct RequestBatcherConfig {
    /// Flush as soon as this many calls are waiting.
    std::size_t maxBatchSize = 10;

    /// Flush once the oldest call has waited this long.
    std::chrono::milliseconds maxBatchDelay{2000};

    /// A call is flushed at the latest this long before its own deadline.
    std::chrono::milliseconds deadlineMargin{50};
};

/// Collects ModelCalls and hands them to ModelClient::generateBatch().
///
/// A batch is flushed when it reaches maxBatchSize, when its oldest call
/// has waited maxBatchDelay, or when any call is about to reach its
/// deadline. A flush takes the calls with the earliest flush times first.
/// One background thread performs all flushes.
///
/// Example:
/// @code
///   RequestBatcher batcher(RequestBatcherConfig{}, modelClient);
///   batcher.start();
///   auto text = batcher.submit(ModelCall{prompt, ModelTier::FreeFast, "", ctx});
///   batcher.stop();
/// @endcode
class RequestBatcher {
public:
    RequestBatcher(RequestBatcherConfig config, ModelClient& client);
    ~RequestBatcher();

    RequestBatcher(const RequestBatcher&) = delete;
    RequestBatcher& operator=(const RequestBatcher&) = delete;

    /// Start the flush thread.
    /// @return TaskAlreadyRunning if already started.
    [[nodiscard]] foundation::SluiceResult<void> start();

    /// Flush nothing further; fail waiting calls with Cancelled and join.
    void stop();

    /// Queue @p call; the future resolves when its batch completes.
    [[nodiscard]] std::future<foundation::SluiceResult<std::string>> enqueue(ModelCall call);

    /// Queue @p call and wait for it, bounded by its deadline and cancel token.
    [[nodiscard]] foundation::SluiceResult<std::string> submit(ModelCall call);

    /// Calls currently waiting for a flush.
    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] uint64_t batchesFlushed() const;

    [[nodiscard]] uint64_t callsBatched() const;

    [[nodiscard]] const RequestBatcherConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

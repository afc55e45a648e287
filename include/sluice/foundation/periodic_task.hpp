#pragma once

/// @file periodic_task.hpp
/// @brief Fixed-interval background task with an explicit, awaited stop.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "sluice/foundation/sluice_result.hpp"

namespace sluice::foundation {

/// Runs a callback every @c interval on a dedicated thread.
///
/// stop() signals the loop and joins the thread before returning, so the
/// callback is guaranteed not to be running once stop() completes. The
/// first run happens one interval after start().
///
/// Example:
/// @code
///   PeriodicTask maintenance("pool-maintenance", std::chrono::seconds(60),
///                            [&] { pool.runMaintenance(); });
///   maintenance.start();
///   // ...
///   maintenance.stop();
/// @endcode
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the background loop.
    /// @return TaskAlreadyRunning if start() was already called.
    [[nodiscard]] SluiceResult<void> start();

    /// Signal the loop to exit and wait for it. Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Number of completed callback invocations.
    [[nodiscard]] uint64_t runCount() const;

    [[nodiscard]] const std::string& name() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sluice::foundation

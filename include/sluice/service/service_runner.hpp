#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signal handling, configuration loading,
///        graceful shutdown coordination and CLI argument parsing.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/foundation/config_manager.hpp"
#include "sluice/foundation/sluice_result.hpp"

namespace sluice::service {

/// Default configuration file location.
inline constexpr std::string_view kDefaultConfigPath = "/etc/sluice/config.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// Default handlers are restored on destruction so that a second signal
/// during teardown terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, fatal startup paths).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// The service registers, in order: readiness off, scheduler stop (which
/// cancels queued and in-flight requests), batcher stop, cache shutdown,
/// pool shutdown, stats server stop.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("ready",     [&]() { stats.setReady(false); });
///   shutdown.addHook("scheduler", [&]() { scheduler.stop(); });
///   shutdown.addHook("pool",      [&]() { pool.shutdown(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all hooks in order.
    ///
    /// A hook that throws is logged and does not prevent later hooks from
    /// running. Hooks still running past the drain timeout are reported.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    void setDrainTimeout(std::chrono::seconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
};

/// Load a YAML configuration file into @p config, then apply the
/// environment overrides.
///
/// The config file path is resolved in order:
///   1. @p explicitPath (from `--config`), if not empty
///   2. SLUICE_CONFIG_PATH environment variable, if set
///   3. kDefaultConfigPath
///
/// A missing file at the default location is not an error: the service
/// then runs on built-in defaults plus the environment.
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::SluiceResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& explicitPath = {});

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace sluice::service

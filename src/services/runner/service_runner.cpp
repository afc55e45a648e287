/// @file service_runner.cpp
/// @brief Implementation of service entry-point utilities.

#include "sluice/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <thread>

#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::LogCategory;
using sluice::foundation::SluiceResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    const auto deadline = std::chrono::steady_clock::now() + drainTimeout_;

    for (const auto& hook : hooks_) {
        SLUICE_LOG_INFO(LogCategory::Core, "shutdown: " + hook.name);
        try {
            hook.callback();
        } catch (const std::exception& e) {
            SLUICE_LOG_ERROR(LogCategory::Core,
                             "shutdown hook '" + hook.name + "' failed: " + e.what());
        }

        if (std::chrono::steady_clock::now() > deadline) {
            SLUICE_LOG_WARN(LogCategory::Core,
                            "shutdown exceeded drain timeout of " +
                                std::to_string(drainTimeout_.count()) + "s at hook '" +
                                hook.name + "'");
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

SluiceResult<void> loadConfig(foundation::ConfigManager& config,
                              const std::filesystem::path& explicitPath) {
    std::filesystem::path configPath = explicitPath;
    bool required = !configPath.empty();

    if (configPath.empty()) {
        const char* envPath = std::getenv("SLUICE_CONFIG_PATH");
        if (envPath != nullptr && *envPath != '\0') {
            configPath = envPath;
            required = true;
        } else {
            configPath = std::filesystem::path(std::string(kDefaultConfigPath));
        }
    }

    std::error_code ec;
    if (!required && !std::filesystem::exists(configPath, ec)) {
        SLUICE_LOG_INFO(LogCategory::Config,
                        "no config file at " + configPath.string() + ", using defaults");
    } else {
        auto loaded = config.load(configPath);
        if (!loaded) {
            return loaded;
        }
        SLUICE_LOG_INFO(LogCategory::Config, "loaded config from " + configPath.string());
    }

    auto overridden = config.applyEnvironment();
    if (overridden > 0) {
        SLUICE_LOG_INFO(LogCategory::Config,
                        std::to_string(overridden) + " config keys overridden from environment");
    }
    return SluiceResult<void>::ok();
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace sluice::service

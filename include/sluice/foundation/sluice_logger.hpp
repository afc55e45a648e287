#pragma once

/// @file sluice_logger.hpp
/// @brief SluiceLogger wrapping the kcenon common_system logger registry.
///
/// Provides category-based filtering, structured logging with request
/// context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "sluice/foundation/sluice_result.hpp"
#include "sluice/foundation/types.hpp"

namespace sluice::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component of the request path.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Process lifecycle, wiring
    Admission = 1, ///< Rate limits, breakers, dedup
    Scheduler = 2, ///< Queue and worker pool
    Cache     = 3, ///< Response cache and its backends
    Pool      = 4, ///< Connection pool bookkeeping
    Optimizer = 5, ///< Classification, tiers, batching
    Store     = 6, ///< Store connections and queries
    Config    = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Admission", "Scheduler", "Cache", "Pool", "Optimizer", "Store", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "INFO", "warn", ...). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.requestId = RequestId(42);
///   ctx.userId = "alice";
///   ctx.extra["tier"] = "fast";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Optimizer,
///                         "cache miss", ctx);
/// @endcode
struct LogContext {
    std::optional<RequestId> requestId;
    std::optional<ConnectionId> connectionId;
    std::optional<std::string> userId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger facade over kcenon's GlobalLoggerRegistry.
///
/// Each category logs through a named logger "sluice.<Category>", falling
/// back to the registry default logger. Uses PIMPL to keep kcenon headers
/// out of the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Admission | Info          |
/// | Scheduler | Info          |
/// | Cache     | Info          |
/// | Pool      | Info          |
/// | Optimizer | Debug         |
/// | Store     | Warning       |
/// | Config    | Info          |
class SluiceLogger {
public:
    SluiceLogger();
    ~SluiceLogger();

    SluiceLogger(const SluiceLogger&) = delete;
    SluiceLogger& operator=(const SluiceLogger&) = delete;
    SluiceLogger(SluiceLogger&&) noexcept;
    SluiceLogger& operator=(SluiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setGlobalLevel(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Emit single-line JSON (JsonLogFormatter) instead of "[Category] msg".
    void setJsonOutput(bool enabled);

    [[nodiscard]] bool jsonOutput() const;

    /// Flush all buffered log messages.
    SluiceResult<void> flush();

    static SluiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace — macros are global)
// ---------------------------------------------------------------------------

/// @name SLUICE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// SLUICE_MIN_LOG_LEVEL can be defined before including this header to
/// drop logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef SLUICE_MIN_LOG_LEVEL
    #define SLUICE_MIN_LOG_LEVEL 0
#endif

#define SLUICE_LOG(level, cat, msg)                                                    \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= SLUICE_MIN_LOG_LEVEL &&                         \
            ::sluice::foundation::SluiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                              \
            ::sluice::foundation::SluiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define SLUICE_LOG_DEBUG(cat, msg) \
    SLUICE_LOG(::sluice::foundation::LogLevel::Debug, (cat), (msg))

#define SLUICE_LOG_INFO(cat, msg) \
    SLUICE_LOG(::sluice::foundation::LogLevel::Info, (cat), (msg))

#define SLUICE_LOG_WARN(cat, msg) \
    SLUICE_LOG(::sluice::foundation::LogLevel::Warning, (cat), (msg))

#define SLUICE_LOG_ERROR(cat, msg) \
    SLUICE_LOG(::sluice::foundation::LogLevel::Error, (cat), (msg))

/// @}

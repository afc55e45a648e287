#pragma once

/// @file json_log_formatter.hpp
/// @brief Structured JSON log lines with per-thread correlation IDs.

#include "sluice/foundation/sluice_logger.hpp"

#include <string>
#include <string_view>

namespace sluice::foundation {

/// Generate a UUID v4 string (e.g., "550e8400-e29b-41d4-a716-446655440000").
[[nodiscard]] std::string generateCorrelationId();

/// RAII guard that sets the current thread's correlation ID and restores
/// the previous one on destruction.
///
/// Scheduler workers open one scope per dispatched request so every log
/// line emitted while serving it carries the same ID.
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// The current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Append @p value to @p out as a quoted, escaped JSON string.
void appendJsonString(std::string& out, std::string_view value);

/// Stateless JSON log formatter.
///
/// Output format:
/// @code
///   {"timestamp":"2026-02-14T12:00:00.000Z","level":"INFO",
///    "category":"Scheduler","correlation_id":"uuid","message":"...",
///    "request_id":42,"user_id":"alice"}
/// @endcode
class JsonLogFormatter {
public:
    /// Format a log entry as a single-line JSON object.
    ///
    /// LogContext::traceId wins over the thread's CorrelationScope.
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

}  // namespace sluice::foundation

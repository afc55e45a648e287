/// @file sluice_logger.cpp
/// @brief SluiceLogger implementation wrapping kcenon common_system loggers.

#include "sluice/foundation/sluice_logger.hpp"
#include "sluice/foundation/json_log_formatter.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace sluice::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: sluice -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Admission
    LogLevel::Info,    // Scheduler
    LogLevel::Info,    // Cache
    LogLevel::Info,    // Pool
    LogLevel::Debug,   // Optimizer
    LogLevel::Warning, // Store
    LogLevel::Info     // Config
};

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization for the plain-text format
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.requestId && ctx.requestId->isValid()) {
        append("request_id", std::to_string(ctx.requestId->value()));
    }
    if (ctx.connectionId && ctx.connectionId->isValid()) {
        append("connection_id", std::to_string(ctx.connectionId->value()));
    }
    if (ctx.userId && !ctx.userId->empty()) {
        append("user_id", *ctx.userId);
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    } else if (!CorrelationScope::current().empty()) {
        append("trace_id", CorrelationScope::current());
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SluiceLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;
    std::atomic<bool> json{false};

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("sluice.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (registry.has_logger(loggerNames[idx])) {
            return registry.get_logger(loggerNames[idx]);
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              const LogContext& ctx) const {
        auto logger = getLogger(cat);

        if (json.load(std::memory_order_relaxed)) {
            logger->log(mapLevel(level),
                        JsonLogFormatter::format(level, cat, msg, ctx));
            return;
        }

        std::string ctxStr = formatContext(ctx);

        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        logger->log(mapLevel(level), formatted);
    }
};

SluiceLogger::SluiceLogger() : impl_(std::make_unique<Impl>()) {}

SluiceLogger::~SluiceLogger() = default;

SluiceLogger::SluiceLogger(SluiceLogger&&) noexcept = default;
SluiceLogger& SluiceLogger::operator=(SluiceLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void SluiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, LogContext{});
}

void SluiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, ctx);
}

// ---------------------------------------------------------------------------
// Level control
// ---------------------------------------------------------------------------
void SluiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void SluiceLogger::setGlobalLevel(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel SluiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool SluiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

void SluiceLogger::setJsonOutput(bool enabled) {
    impl_->json.store(enabled, std::memory_order_relaxed);
}

bool SluiceLogger::jsonOutput() const {
    return impl_->json.load(std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
SluiceResult<void> SluiceLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return SluiceResult<void>::ok();
}

SluiceLogger& SluiceLogger::instance() {
    static SluiceLogger inst;
    return inst;
}

} // namespace sluice::foundation

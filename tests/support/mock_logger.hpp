#pragma once

/// @file mock_logger.hpp
/// @brief Recording kcenon ILogger installed into GlobalLoggerRegistry by
///        tests that assert on emitted log lines.

#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace sluice::test {

struct LogRecord {
    kcenon::common::interfaces::log_level level;
    std::string message;
};

class MockLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        ++flushes_;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    int flushCount() const {
        std::lock_guard lock(mutex_);
        return flushes_;
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    int flushes_ = 0;
};

} // namespace sluice::test

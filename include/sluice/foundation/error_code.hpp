#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the request-serving core.

#include <cstdint>
#include <string_view>

namespace sluice::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Admission (0x0100 - 0x01FF): rejected synchronously at submit()
    QueueFull = 0x0100,
    RateLimited = 0x0101,
    CircuitOpen = 0x0102,

    // Request execution (0x0200 - 0x02FF): recorded on the request
    RequestNotFound = 0x0200,
    TimedOut = 0x0201,
    Cancelled = 0x0202,
    DownstreamError = 0x0203,
    HandlerMissing = 0x0204,
    SchedulerStopped = 0x0205,

    // Store / connection pool (0x0300 - 0x03FF)
    StoreError = 0x0300,
    QueryFailed = 0x0301,
    TransactionFailed = 0x0302,
    PoolExhausted = 0x0303,
    PoolShutdown = 0x0304,
    NotConnected = 0x0305,

    // Cache (0x0400 - 0x04FF)
    CacheUnavailable = 0x0400,
    CacheBackendError = 0x0401,

    // Server (0x0500 - 0x05FF)
    ListenFailed = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    TaskAlreadyRunning = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Admission";
        case 0x0200: return "Request";
        case 0x0300: return "Store";
        case 0x0400: return "Cache";
        case 0x0500: return "Server";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Short snake_case label for an error code, used in metrics labels and
/// the stats payload.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:            return "success";
        case ErrorCode::Unknown:            return "unknown";
        case ErrorCode::InvalidArgument:    return "invalid_argument";
        case ErrorCode::NotFound:           return "not_found";
        case ErrorCode::AlreadyExists:      return "already_exists";
        case ErrorCode::NotImplemented:     return "not_implemented";
        case ErrorCode::QueueFull:          return "queue_full";
        case ErrorCode::RateLimited:        return "rate_limited";
        case ErrorCode::CircuitOpen:        return "circuit_open";
        case ErrorCode::RequestNotFound:    return "request_not_found";
        case ErrorCode::TimedOut:           return "timed_out";
        case ErrorCode::Cancelled:          return "cancelled";
        case ErrorCode::DownstreamError:    return "downstream_error";
        case ErrorCode::HandlerMissing:     return "handler_missing";
        case ErrorCode::SchedulerStopped:   return "scheduler_stopped";
        case ErrorCode::StoreError:         return "store_error";
        case ErrorCode::QueryFailed:        return "query_failed";
        case ErrorCode::TransactionFailed:  return "transaction_failed";
        case ErrorCode::PoolExhausted:      return "pool_exhausted";
        case ErrorCode::PoolShutdown:       return "pool_shutdown";
        case ErrorCode::NotConnected:       return "not_connected";
        case ErrorCode::CacheUnavailable:   return "cache_unavailable";
        case ErrorCode::CacheBackendError:  return "cache_backend_error";
        case ErrorCode::ListenFailed:       return "listen_failed";
        case ErrorCode::ConfigLoadFailed:   return "config_load_failed";
        case ErrorCode::ConfigKeyNotFound:  return "config_key_not_found";
        case ErrorCode::ConfigTypeMismatch: return "config_type_mismatch";
        case ErrorCode::ThreadError:        return "thread_error";
        case ErrorCode::JobScheduleFailed:  return "job_schedule_failed";
        case ErrorCode::TaskAlreadyRunning: return "task_already_running";
        case ErrorCode::LoggerError:        return "logger_error";
        case ErrorCode::LoggerFlushFailed:  return "logger_flush_failed";
    }
    return "unknown";
}

} // namespace sluice::foundation

/// @file json_log_formatter.cpp
/// @brief Structured JSON log formatter implementation.

#include "sluice/foundation/json_log_formatter.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sluice::foundation {

// ---------------------------------------------------------------------------
// JSON string escaping (control chars, quotes, backslashes)
// ---------------------------------------------------------------------------
void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

// ---------------------------------------------------------------------------
// ISO 8601 timestamp with millisecond precision (UTC)
// ---------------------------------------------------------------------------
static std::string formatTimestamp() {
    using Clock = std::chrono::system_clock;
    auto now = Clock::now();
    auto epoch = now.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(epoch - seconds);

    std::time_t tt = Clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char buf[96];  // Oversized to satisfy GCC -Wformat-truncation
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(millis.count()));
    return buf;
}

// ---------------------------------------------------------------------------
// UUID v4 generation (thread-local PRNG)
// ---------------------------------------------------------------------------
std::string generateCorrelationId() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 1

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(hi >> 32),
                  static_cast<uint16_t>((hi >> 16) & 0xFFFF),
                  static_cast<uint16_t>(hi & 0xFFFF),
                  static_cast<uint16_t>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0x0000FFFFFFFFFFFFULL));
    return buf;
}

// ---------------------------------------------------------------------------
// Thread-local correlation ID
// ---------------------------------------------------------------------------
static thread_local std::string tl_correlationId;

CorrelationScope::CorrelationScope(std::string correlationId)
    : previous_(std::move(tl_correlationId)) {
    tl_correlationId = std::move(correlationId);
}

CorrelationScope::~CorrelationScope() {
    tl_correlationId = std::move(previous_);
}

const std::string& CorrelationScope::current() {
    return tl_correlationId;
}

// ---------------------------------------------------------------------------
// JsonLogFormatter::format()
// ---------------------------------------------------------------------------
std::string JsonLogFormatter::format(LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    std::string out;
    out.reserve(256);

    out += "{\"timestamp\":";
    appendJsonString(out, formatTimestamp());

    out += ",\"level\":";
    appendJsonString(out, logLevelName(level));

    out += ",\"category\":";
    appendJsonString(out, logCategoryName(category));

    const auto& corrId =
        (ctx.traceId && !ctx.traceId->empty()) ? *ctx.traceId : tl_correlationId;
    if (!corrId.empty()) {
        out += ",\"correlation_id\":";
        appendJsonString(out, corrId);
    }

    out += ",\"message\":";
    appendJsonString(out, message);

    if (ctx.requestId && ctx.requestId->isValid()) {
        out += ",\"request_id\":";
        out += std::to_string(ctx.requestId->value());
    }
    if (ctx.connectionId && ctx.connectionId->isValid()) {
        out += ",\"connection_id\":";
        out += std::to_string(ctx.connectionId->value());
    }
    if (ctx.userId && !ctx.userId->empty()) {
        out += ",\"user_id\":";
        appendJsonString(out, *ctx.userId);
    }

    if (!ctx.extra.empty()) {
        // Sorted so identical contexts render identical lines.
        std::vector<const std::pair<const std::string, std::string>*> fields;
        fields.reserve(ctx.extra.size());
        for (const auto& field : ctx.extra) {
            fields.push_back(&field);
        }
        std::sort(fields.begin(), fields.end(),
                  [](const auto* a, const auto* b) { return a->first < b->first; });

        out += ",\"extra\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            appendJsonString(out, fields[i]->first);
            out += ':';
            appendJsonString(out, fields[i]->second);
        }
        out += '}';
    }

    out += '}';
    return out;
}

}  // namespace sluice::foundation

/// @file json_log_formatter_test.cpp
/// @brief Unit tests for JsonLogFormatter and correlation ID utilities.

#include <gtest/gtest.h>

#include <atomic>
#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "sluice/foundation/json_log_formatter.hpp"
#include "support/mock_logger.hpp"

using namespace sluice::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using sluice::test::MockLogger;

// ===========================================================================
// JsonLogFormatter
// ===========================================================================

TEST(JsonLogFormatterTest, ContainsLevelCategoryAndMessage) {
    auto json = JsonLogFormatter::format(LogLevel::Error, LogCategory::Pool, "connection lost");

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"Pool\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"connection lost\""), std::string::npos);
}

TEST(JsonLogFormatterTest, TimestampIsIso8601) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "test");

    std::regex isoPattern(
        R"RE("timestamp":"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")RE");
    EXPECT_TRUE(std::regex_search(json, isoPattern)) << json;
}

TEST(JsonLogFormatterTest, IncludesContextFields) {
    LogContext ctx;
    ctx.requestId = RequestId(100);
    ctx.connectionId = ConnectionId(3);
    ctx.userId = "bob";
    ctx.extra["tier"] = "premium";

    auto json = JsonLogFormatter::format(LogLevel::Debug, LogCategory::Optimizer, "routed", ctx);

    EXPECT_NE(json.find("\"request_id\":100"), std::string::npos);
    EXPECT_NE(json.find("\"connection_id\":3"), std::string::npos);
    EXPECT_NE(json.find("\"user_id\":\"bob\""), std::string::npos);
    EXPECT_NE(json.find("\"extra\":{\"tier\":\"premium\"}"), std::string::npos);
}

TEST(JsonLogFormatterTest, ExtraFieldsAreSortedByKey) {
    LogContext ctx;
    ctx.extra["tier"] = "fast";
    ctx.extra["attempt"] = "2";
    ctx.extra["cache"] = "miss";

    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Scheduler, "retry", ctx);

    EXPECT_NE(json.find("\"extra\":{\"attempt\":\"2\",\"cache\":\"miss\",\"tier\":\"fast\"}"),
              std::string::npos)
        << json;
}

TEST(JsonLogFormatterTest, OmitsEmptyContextFields) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "plain", {});

    EXPECT_EQ(json.find("\"request_id\""), std::string::npos);
    EXPECT_EQ(json.find("\"user_id\""), std::string::npos);
    EXPECT_EQ(json.find("\"extra\""), std::string::npos);
    EXPECT_EQ(json.find("\"correlation_id\""), std::string::npos);
}

TEST(JsonLogFormatterTest, EscapesSpecialCharacters) {
    auto json = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core,
                                         "prompt \"hi\" \\ and\nnewline\x01");

    EXPECT_NE(json.find("\\\"hi\\\""), std::string::npos);
    EXPECT_NE(json.find("\\\\"), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\u0001"), std::string::npos);
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

TEST(JsonLogFormatterTest, AppendJsonStringQuotes) {
    std::string out;
    appendJsonString(out, "a\tb");
    EXPECT_EQ(out, "\"a\\tb\"");
}

// ===========================================================================
// Correlation IDs
// ===========================================================================

TEST(CorrelationIdTest, GeneratesUuidV4Format) {
    auto id = generateCorrelationId();
    std::regex uuidPattern(
        R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");
    EXPECT_TRUE(std::regex_match(id, uuidPattern)) << id;
}

TEST(CorrelationIdTest, UniqueAcrossThreads) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;

    std::vector<std::vector<std::string>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&results, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[static_cast<std::size_t>(t)].push_back(generateCorrelationId());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<std::string> all;
    for (const auto& ids : results) {
        all.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(CorrelationScopeTest, NestingRestoresOuterScope) {
    EXPECT_TRUE(CorrelationScope::current().empty());
    {
        CorrelationScope outer("outer-id");
        {
            CorrelationScope inner("inner-id");
            EXPECT_EQ(CorrelationScope::current(), "inner-id");
        }
        EXPECT_EQ(CorrelationScope::current(), "outer-id");
    }
    EXPECT_TRUE(CorrelationScope::current().empty());
}

TEST(CorrelationScopeTest, ThreadLocalIsolation) {
    CorrelationScope scope("main-thread-id");
    std::string seen = "unset";

    std::thread t([&] { seen = CorrelationScope::current(); });
    t.join();

    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(CorrelationScope::current(), "main-thread-id");
}

TEST(CorrelationScopeTest, ContextTraceIdTakesPrecedence) {
    CorrelationScope scope("thread-id");

    auto implicit = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "a");
    EXPECT_NE(implicit.find("\"correlation_id\":\"thread-id\""), std::string::npos);

    LogContext ctx;
    ctx.traceId = "explicit-id";
    auto explicitJson = JsonLogFormatter::format(LogLevel::Info, LogCategory::Core, "b", ctx);
    EXPECT_NE(explicitJson.find("\"correlation_id\":\"explicit-id\""), std::string::npos);
    EXPECT_EQ(explicitJson.find("thread-id"), std::string::npos);
}

// ===========================================================================
// SluiceLogger JSON output
// ===========================================================================

class SluiceLoggerJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

TEST_F(SluiceLoggerJsonTest, JsonOutputDefaultsToOff) {
    SluiceLogger logger;
    EXPECT_FALSE(logger.jsonOutput());

    logger.log(LogLevel::Info, LogCategory::Core, "Text test");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] Text test");
}

TEST_F(SluiceLoggerJsonTest, JsonOutputEmitsOneObjectPerLine) {
    SluiceLogger logger;
    logger.setJsonOutput(true);

    CorrelationScope scope("req-9");
    LogContext ctx;
    ctx.requestId = RequestId(9);
    logger.logWithContext(LogLevel::Info, LogCategory::Scheduler, "completed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(msg.front(), '{');
    EXPECT_EQ(msg.back(), '}');
    EXPECT_NE(msg.find("\"category\":\"Scheduler\""), std::string::npos);
    EXPECT_NE(msg.find("\"correlation_id\":\"req-9\""), std::string::npos);
    EXPECT_NE(msg.find("\"request_id\":9"), std::string::npos);
}

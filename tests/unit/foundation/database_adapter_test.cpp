#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "sluice/foundation/store_connection.hpp"

using namespace sluice::foundation;

// ===========================================================================
// ErrorCode: Store subsystem lookup
// ===========================================================================

TEST(StoreErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreError), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueryFailed), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::TransactionFailed), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::PoolExhausted), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::PoolShutdown), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotConnected), "Store");
}

// ===========================================================================
// StoreConfig: default values
// ===========================================================================

TEST(StoreConfigTest, DefaultValues) {
    StoreConfig config;
    EXPECT_EQ(config.connectionString, "sluice.db");
    EXPECT_EQ(config.type, StoreType::SQLite);
}

// ===========================================================================
// KcenonStoreConnection: open through the factory
// ===========================================================================

TEST(KcenonStoreConnectionTest, FactoryOpensInMemorySqlite) {
    auto factory = makeStoreConnectionFactory({":memory:", StoreType::SQLite});
    auto conn = factory();
    ASSERT_TRUE(conn.hasValue()) << conn.error().describe();
    ASSERT_NE(conn.value(), nullptr);
    EXPECT_TRUE(conn.value()->isHealthy());

    conn.value()->close();
    EXPECT_FALSE(conn.value()->isHealthy());
}

// ===========================================================================
// Statement: positional binding and resolve
// ===========================================================================

TEST(StatementTest, IntegerBinding) {
    Statement stmt("SELECT * FROM interactions WHERE id = ?");
    stmt.bind(std::int64_t{42});
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(), "SELECT * FROM interactions WHERE id = 42");
}

TEST(StatementTest, StringBindingEscapesSingleQuotes) {
    Statement stmt("SELECT * FROM interactions WHERE user_id = ?");
    stmt.bind(std::string("O'Brien"));
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(), "SELECT * FROM interactions WHERE user_id = 'O''Brien'");
}

TEST(StatementTest, InjectionAttemptStaysInsideLiteral) {
    Statement stmt("DELETE FROM interactions WHERE user_id = ?");
    stmt.bind(std::string("x'; DROP TABLE interactions; --"));
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(),
              "DELETE FROM interactions WHERE user_id = 'x''; DROP TABLE interactions; --'");
}

TEST(StatementTest, NullAndBool) {
    Statement stmt("INSERT INTO t (a, b, c) VALUES (?, ?, ?)",
                   {DbNull{}, true, false});
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(), "INSERT INTO t (a, b, c) VALUES (NULL, 1, 0)");
}

TEST(StatementTest, ChainedBinding) {
    Statement stmt("SELECT * FROM interactions WHERE user_id = ? LIMIT ?");
    stmt.bind(std::string("alice")).bind(std::int64_t{50});
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(), "SELECT * FROM interactions WHERE user_id = 'alice' LIMIT 50");
}

TEST(StatementTest, QuestionMarkInsideLiteralIsNotAPlaceholder) {
    Statement stmt("SELECT * FROM t WHERE note = 'why?' AND id = ?");
    EXPECT_EQ(stmt.placeholderCount(), 1u);
    stmt.bind(std::int64_t{7});
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasValue());
    EXPECT_EQ(sql.value(), "SELECT * FROM t WHERE note = 'why?' AND id = 7");
}

TEST(StatementTest, CountMismatchIsInvalidArgument) {
    Statement stmt("SELECT * FROM t WHERE a = ? AND b = ?");
    stmt.bind(std::int64_t{1});
    auto sql = stmt.resolve();
    ASSERT_TRUE(sql.hasError());
    EXPECT_EQ(sql.error().code(), ErrorCode::InvalidArgument);
}

TEST(StatementTest, ClearBindings) {
    Statement stmt("SELECT ?");
    stmt.bind(std::int64_t{1});
    stmt.clearBindings();
    EXPECT_TRUE(stmt.resolve().hasError());

    stmt.bind(std::string("x"));
    EXPECT_EQ(stmt.resolve().value(), "SELECT 'x'");
}

// ===========================================================================
// toText
// ===========================================================================

TEST(DbValueTest, ToText) {
    EXPECT_EQ(toText(DbNull{}), "");
    EXPECT_EQ(toText(std::string("hello")), "hello");
    EXPECT_EQ(toText(std::int64_t{-12}), "-12");
    EXPECT_EQ(toText(true), "true");
    EXPECT_EQ(toText(false), "false");
}

#pragma once

/// @file store_connection.hpp
/// @brief Single connection to the transactional store, wrapping kcenon
///        database_system, plus positional statement binding.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "sluice/foundation/sluice_result.hpp"

namespace sluice::foundation {

// ── Value types ─────────────────────────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {
    bool operator==(const DbNull&) const = default;
};

/// A single column value.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name -> value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set of a SELECT.
using QueryResult = std::vector<DbRow>;

/// Positional parameter list for a Statement.
using DbParams = std::vector<DbValue>;

/// Render a DbValue as text ("" for NULL), e.g. for logs and profiles.
[[nodiscard]] std::string toText(const DbValue& value);

// ── Statement ───────────────────────────────────────────────────────────────

/// SQL text with positional `?` placeholders.
///
/// resolve() substitutes bound values in order; strings are quoted with
/// single quotes doubled, so values never terminate the literal. A `?`
/// inside a quoted literal in the template is left untouched.
///
/// Example:
/// @code
///   Statement stmt("SELECT * FROM interactions WHERE user_id = ? LIMIT ?");
///   stmt.bind(std::string("alice")).bind(std::int64_t{50});
///   auto sql = stmt.resolve();
/// @endcode
class Statement {
public:
    explicit Statement(std::string sql);
    Statement(std::string sql, DbParams params);

    Statement& bind(DbValue value);

    [[nodiscard]] std::string_view sql() const noexcept;

    [[nodiscard]] std::size_t placeholderCount() const;

    /// SQL with every placeholder replaced.
    /// @return InvalidArgument if the bound count differs from the placeholders.
    [[nodiscard]] SluiceResult<std::string> resolve() const;

    void clearBindings();

private:
    std::string sql_;
    DbParams params_;
};

// ── StoreConnection ─────────────────────────────────────────────────────────

/// Supported store backends.
enum class StoreType : uint8_t {
    SQLite,
    PostgreSQL,
    MySQL
};

struct StoreConfig {
    std::string connectionString = "sluice.db";
    StoreType type = StoreType::SQLite;
};

/// One exclusive handle to the store.
///
/// Not thread-safe: the connection pool guarantees a single owner while a
/// connection is checked out.
class StoreConnection {
public:
    virtual ~StoreConnection() = default;

    /// Run a SELECT and return its rows.
    [[nodiscard]] virtual SluiceResult<QueryResult> query(std::string_view sql) = 0;

    /// Run INSERT/UPDATE/DELETE/DDL and return affected rows where the
    /// backend reports them (0 otherwise).
    [[nodiscard]] virtual SluiceResult<uint64_t> execute(std::string_view sql) = 0;

    [[nodiscard]] virtual SluiceResult<void> begin() = 0;
    [[nodiscard]] virtual SluiceResult<void> commit() = 0;
    [[nodiscard]] virtual SluiceResult<void> rollback() = 0;

    /// False once the connection is known to be unusable.
    [[nodiscard]] virtual bool isHealthy() const = 0;

    virtual void close() = 0;
};

/// Creates new store connections for the pool.
using StoreConnectionFactory =
    std::function<SluiceResult<std::unique_ptr<StoreConnection>>()>;

/// StoreConnection backed by kcenon database_system's database_manager.
///
/// Uses PIMPL to hide all kcenon headers.
class KcenonStoreConnection final : public StoreConnection {
    struct Impl;
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Use open(); the key keeps construction inside this class.
    KcenonStoreConnection(Passkey, std::unique_ptr<Impl> impl);
    ~KcenonStoreConnection() override;

    KcenonStoreConnection(const KcenonStoreConnection&) = delete;
    KcenonStoreConnection& operator=(const KcenonStoreConnection&) = delete;

    /// Open a connection using @p config.
    [[nodiscard]] static SluiceResult<std::unique_ptr<StoreConnection>> open(
        const StoreConfig& config);

    [[nodiscard]] SluiceResult<QueryResult> query(std::string_view sql) override;
    [[nodiscard]] SluiceResult<uint64_t> execute(std::string_view sql) override;
    [[nodiscard]] SluiceResult<void> begin() override;
    [[nodiscard]] SluiceResult<void> commit() override;
    [[nodiscard]] SluiceResult<void> rollback() override;
    [[nodiscard]] bool isHealthy() const override;
    void close() override;

private:
    std::unique_ptr<Impl> impl_;
};

/// Factory producing KcenonStoreConnection instances for @p config.
[[nodiscard]] StoreConnectionFactory makeStoreConnectionFactory(StoreConfig config);

} // namespace sluice::foundation

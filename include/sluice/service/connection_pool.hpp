#pragma once

/// @file connection_pool.hpp
/// @brief Bounded pool of store connections with scoped acquisition,
///        explicit transactions, and idle-connection maintenance.

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/foundation/sluice_result.hpp"
#include "sluice/foundation/store_connection.hpp"
#include "sluice/foundation/types.hpp"

namespace sluice::service {

/// Configuration for ConnectionPool.
struct ConnectionPoolConfig {
    /// Connections created at initialize() and kept through maintenance.
    uint32_t minSize = 20;

    /// Hard upper bound on open connections.
    uint32_t maxSize = 50;

    /// Maximum time acquire() waits for an idle connection before trying
    /// to grow the pool.
    std::chrono::milliseconds connectionTimeout{30000};

    /// Idle connections older than this are closed by maintenance.
    std::chrono::seconds idleTimeout{300};

    /// Interval of the background maintenance pass.
    std::chrono::milliseconds maintenanceInterval{60000};

    /// Waits longer than this are counted as connection waits in stats.
    std::chrono::milliseconds slowWaitThreshold{100};
};

/// How many rows a query should hand back.
enum class FetchMode : uint8_t {
    One,      ///< First row only
    All,      ///< Every row
    Many,     ///< Up to the requested limit
    RowCount  ///< No rows; affected-row count only
};

/// Result of PooledConnection::execute().
struct QueryOutcome {
    foundation::QueryResult rows;
    uint64_t affectedRows{0};
};

/// Pool bookkeeping snapshot.
struct PoolStats {
    uint64_t totalCreated{0};
    uint64_t totalDestroyed{0};
    uint64_t acquisitions{0};
    uint64_t connectionWaits{0};
    uint64_t timeouts{0};
    uint64_t queriesExecuted{0};
    uint64_t queryErrors{0};
    double averageQueryMs{0.0};
    std::size_t active{0};
    std::size_t available{0};
    std::size_t total{0};
};

/// One store connection owned by the pool.
///
/// While checked out it belongs exclusively to the lease holder. The
/// connection's own lock serializes its bookkeeping and store calls.
class PooledConnection {
    /// Only ConnectionPool can name this, so only it can construct.
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    using Clock = std::chrono::steady_clock;
    using QueryObserver = std::function<void(std::chrono::microseconds, bool)>;

    PooledConnection(Passkey,
                     foundation::ConnectionId id,
                     std::unique_ptr<foundation::StoreConnection> handle,
                     QueryObserver observer);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /// Run @p sql with positional `?` parameters.
    ///
    /// @param limit Row cap for FetchMode::Many (ignored otherwise).
    [[nodiscard]] foundation::SluiceResult<QueryOutcome> execute(
        std::string_view sql,
        const foundation::DbParams& params = {},
        FetchMode mode = FetchMode::All,
        std::size_t limit = 0);

    /// Start a transaction. Fails if one is already active.
    [[nodiscard]] foundation::SluiceResult<void> begin();

    [[nodiscard]] foundation::SluiceResult<void> commit();

    [[nodiscard]] foundation::SluiceResult<void> rollback();

    /// Roll back after a failed unit of work, logging (not returning) any
    /// rollback error. No-op without an active transaction.
    void abandonTransaction(std::string_view reason);

    [[nodiscard]] foundation::ConnectionId id() const noexcept { return id_; }
    [[nodiscard]] Clock::time_point createdAt() const noexcept { return createdAt_; }
    [[nodiscard]] Clock::time_point lastUsedAt() const;
    [[nodiscard]] uint64_t queryCount() const;
    [[nodiscard]] bool transactionActive() const;
    [[nodiscard]] bool isHealthy() const;

private:
    friend class ConnectionPool;

    void touch();
    void close();

    foundation::ConnectionId id_;
    std::unique_ptr<foundation::StoreConnection> handle_;
    QueryObserver observer_;
    Clock::time_point createdAt_;
    Clock::time_point lastUsedAt_;
    uint64_t queryCount_{0};
    bool transactionActive_{false};
    mutable std::mutex mutex_;
};

class ConnectionPool;

/// RAII checkout of a PooledConnection. Returns the connection to the
/// pool (or destroys it) when it goes out of scope.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    PooledConnection& operator*() const noexcept { return *connection_; }
    PooledConnection* operator->() const noexcept { return connection_.get(); }

    [[nodiscard]] bool valid() const noexcept { return connection_ != nullptr; }

    /// Return the connection now instead of at scope exit.
    void release();

private:
    friend class ConnectionPool;
    ConnectionLease(ConnectionPool* pool, std::shared_ptr<PooledConnection> connection);

    ConnectionPool* pool_{nullptr};
    std::shared_ptr<PooledConnection> connection_;
};

/// Bounded pool of store connections.
///
/// Acquire: take an idle connection, waiting up to connectionTimeout; once
/// the wait runs out, open a new one if fewer than maxSize exist, else fail
/// with PoolExhausted. Below minSize a new connection is opened right away.
///
/// Release: a healthy connection without an open transaction goes back to
/// the idle queue; anything else is rolled back, closed and forgotten.
///
/// Example:
/// @code
///   ConnectionPool pool(config, makeStoreConnectionFactory(storeConfig));
///   pool.initialize();
///   auto rows = pool.withConnection([](PooledConnection& conn) {
///       return conn.execute("SELECT * FROM interactions WHERE user_id = ?",
///                           {std::string("alice")});
///   });
///   pool.shutdown();
/// @endcode
class ConnectionPool {
public:
    ConnectionPool(ConnectionPoolConfig config,
                   foundation::StoreConnectionFactory factory,
                   foundation::SluiceMetrics& metrics = foundation::SluiceMetrics::instance());
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Open minSize connections and start the maintenance task.
    [[nodiscard]] foundation::SluiceResult<void> initialize();

    /// Stop maintenance, fail pending and future acquisitions with
    /// PoolShutdown, and close idle connections. Checked-out connections
    /// are closed when their leases end.
    void shutdown();

    /// Check out a connection.
    /// @return PoolExhausted, PoolShutdown, or the factory's error.
    [[nodiscard]] foundation::SluiceResult<ConnectionLease> acquire();

    /// Same as acquire(), waiting at most min(@p maxWait, connectionTimeout)
    /// for an idle connection. A non-positive @p maxWait does not wait.
    [[nodiscard]] foundation::SluiceResult<ConnectionLease> acquire(std::chrono::milliseconds maxWait);

    /// Run @p fn with an exclusively owned connection.
    ///
    /// @p fn takes PooledConnection& and returns a SluiceResult<T>. The
    /// connection is released on every exit path, including exceptions.
    /// @p maxWait caps the acquire wait (see acquire(maxWait)).
    template <typename Fn>
    auto withConnection(Fn&& fn, std::optional<std::chrono::milliseconds> maxWait = std::nullopt)
        -> std::invoke_result_t<Fn, PooledConnection&> {
        using R = std::invoke_result_t<Fn, PooledConnection&>;
        auto lease = maxWait ? acquire(*maxWait) : acquire();
        if (!lease) {
            return R::err(lease.error());
        }
        return std::forward<Fn>(fn)(*lease.value());
    }

    /// Run @p fn inside a transaction.
    ///
    /// Commits when @p fn returns a value; rolls back when it returns an
    /// error or throws (the exception is rethrown after rollback).
    template <typename Fn>
    auto withTransaction(Fn&& fn, std::optional<std::chrono::milliseconds> maxWait = std::nullopt)
        -> std::invoke_result_t<Fn, PooledConnection&> {
        using R = std::invoke_result_t<Fn, PooledConnection&>;
        auto lease = maxWait ? acquire(*maxWait) : acquire();
        if (!lease) {
            return R::err(lease.error());
        }
        PooledConnection& conn = *lease.value();

        auto began = conn.begin();
        if (!began) {
            return R::err(began.error());
        }

        try {
            R result = std::forward<Fn>(fn)(conn);
            if (!result) {
                conn.abandonTransaction(result.error().message());
                return result;
            }
            auto committed = conn.commit();
            if (!committed) {
                conn.abandonTransaction(committed.error().message());
                return R::err(committed.error());
            }
            return result;
        } catch (const std::exception& e) {
            conn.abandonTransaction(e.what());
            throw;
        }
    }

    /// Execute one statement on a pooled connection.
    [[nodiscard]] foundation::SluiceResult<QueryOutcome> execute(
        std::string_view sql,
        const foundation::DbParams& params = {},
        FetchMode mode = FetchMode::All,
        std::size_t limit = 0);

    /// Execute @p statements in one transaction; rolls back on the first error.
    [[nodiscard]] foundation::SluiceResult<std::vector<QueryOutcome>> executeTransaction(
        const std::vector<foundation::Statement>& statements);

    /// Close idle connections past idleTimeout while more than minSize remain.
    /// @return Number of connections closed.
    std::size_t runMaintenance();

    [[nodiscard]] PoolStats stats() const;

    /// Tuning advice derived from stats (waits, timeouts, slow queries).
    [[nodiscard]] std::vector<std::string> recommendations() const;

    [[nodiscard]] std::size_t totalConnections() const;
    [[nodiscard]] std::size_t availableConnections() const;
    [[nodiscard]] std::size_t activeConnections() const;

    [[nodiscard]] const ConnectionPoolConfig& config() const noexcept;

private:
    friend class ConnectionLease;

    void release(std::shared_ptr<PooledConnection> connection);

    /// Open a connection through the factory. Called without the pool lock.
    [[nodiscard]] foundation::SluiceResult<std::shared_ptr<PooledConnection>> openConnection();

    void publishGauges() const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

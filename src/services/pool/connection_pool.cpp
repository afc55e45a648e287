/// @file connection_pool.cpp
/// @brief ConnectionPool, PooledConnection and ConnectionLease implementation.

#include "sluice/service/connection_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <unordered_map>

#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/periodic_task.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"

namespace sluice::service {

using sluice::foundation::ConnectionId;
using sluice::foundation::DbParams;
using sluice::foundation::ErrorCode;
using sluice::foundation::HealthStatus;
using sluice::foundation::LogCategory;
using sluice::foundation::PeriodicTask;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;
using sluice::foundation::Statement;

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr const char* kPoolActiveGauge = "sluice_pool_active";
constexpr const char* kPoolAvailableGauge = "sluice_pool_available";
constexpr const char* kPoolComponent = "pool";

/// True when the statement produces a result set worth fetching.
bool returnsRows(std::string_view sql) {
    auto pos = sql.find_first_not_of(" \t\r\n(");
    if (pos == std::string_view::npos) {
        return false;
    }
    std::string head;
    for (auto i = pos; i < sql.size() && std::isalpha(static_cast<unsigned char>(sql[i])); ++i) {
        head += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[i])));
    }
    return head == "SELECT" || head == "WITH" || head == "PRAGMA" || head == "SHOW";
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// PooledConnection
// ═══════════════════════════════════════════════════════════════════════════

PooledConnection::PooledConnection(Passkey,
                                   ConnectionId id,
                                   std::unique_ptr<foundation::StoreConnection> handle,
                                   QueryObserver observer)
    : id_(id),
      handle_(std::move(handle)),
      observer_(std::move(observer)),
      createdAt_(Clock::now()),
      lastUsedAt_(createdAt_) {}

PooledConnection::~PooledConnection() {
    close();
}

SluiceResult<QueryOutcome> PooledConnection::execute(std::string_view sql,
                                                     const DbParams& params,
                                                     FetchMode mode,
                                                     std::size_t limit) {
    Statement stmt(std::string(sql), params);
    auto resolved = stmt.resolve();
    if (!resolved) {
        return SluiceResult<QueryOutcome>::err(resolved.error());
    }

    std::lock_guard lock(mutex_);
    if (!handle_) {
        return SluiceResult<QueryOutcome>::err(
            SluiceError(ErrorCode::NotConnected, "connection closed", id_));
    }

    auto start = Clock::now();
    QueryOutcome outcome;
    bool ok = true;
    SluiceError failure;

    if (mode == FetchMode::RowCount) {
        auto affected = handle_->execute(resolved.value());
        if (affected) {
            outcome.affectedRows = affected.value();
        } else {
            ok = false;
            failure = affected.error();
        }
    } else {
        auto rows = handle_->query(resolved.value());
        if (rows) {
            outcome.rows = std::move(rows).value();
            if (mode == FetchMode::One && outcome.rows.size() > 1) {
                outcome.rows.resize(1);
            } else if (mode == FetchMode::Many && outcome.rows.size() > limit) {
                outcome.rows.resize(limit);
            }
            outcome.affectedRows = outcome.rows.size();
        } else {
            ok = false;
            failure = rows.error();
        }
    }

    ++queryCount_;
    lastUsedAt_ = Clock::now();
    if (observer_) {
        observer_(std::chrono::duration_cast<std::chrono::microseconds>(lastUsedAt_ - start), ok);
    }

    if (!ok) {
        return SluiceResult<QueryOutcome>::err(
            SluiceError(ErrorCode::QueryFailed, std::string(failure.message()), id_));
    }
    return SluiceResult<QueryOutcome>::ok(std::move(outcome));
}

SluiceResult<void> PooledConnection::begin() {
    std::lock_guard lock(mutex_);
    if (!handle_) {
        return SluiceResult<void>::err(SluiceError(ErrorCode::NotConnected, "connection closed", id_));
    }
    if (transactionActive_) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed, "transaction already active", id_));
    }
    auto result = handle_->begin();
    if (result) {
        transactionActive_ = true;
        lastUsedAt_ = Clock::now();
    }
    return result;
}

SluiceResult<void> PooledConnection::commit() {
    std::lock_guard lock(mutex_);
    if (!handle_ || !transactionActive_) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed, "no active transaction", id_));
    }
    auto result = handle_->commit();
    if (result) {
        transactionActive_ = false;
        lastUsedAt_ = Clock::now();
    }
    return result;
}

SluiceResult<void> PooledConnection::rollback() {
    std::lock_guard lock(mutex_);
    if (!handle_ || !transactionActive_) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed, "no active transaction", id_));
    }
    auto result = handle_->rollback();
    if (result) {
        transactionActive_ = false;
        lastUsedAt_ = Clock::now();
    }
    return result;
}

void PooledConnection::abandonTransaction(std::string_view reason) {
    if (!transactionActive()) {
        return;
    }
    auto result = rollback();
    if (!result) {
        SLUICE_LOG_ERROR(LogCategory::Pool,
                         "rollback failed on connection " + std::to_string(id_.value()) +
                             " after '" + std::string(reason) + "': " +
                             std::string(result.error().message()));
    } else {
        SLUICE_LOG_DEBUG(LogCategory::Pool,
                         "rolled back connection " + std::to_string(id_.value()) + ": " +
                             std::string(reason));
    }
}

PooledConnection::Clock::time_point PooledConnection::lastUsedAt() const {
    std::lock_guard lock(mutex_);
    return lastUsedAt_;
}

uint64_t PooledConnection::queryCount() const {
    std::lock_guard lock(mutex_);
    return queryCount_;
}

bool PooledConnection::transactionActive() const {
    std::lock_guard lock(mutex_);
    return transactionActive_;
}

bool PooledConnection::isHealthy() const {
    std::lock_guard lock(mutex_);
    return handle_ && handle_->isHealthy();
}

void PooledConnection::touch() {
    std::lock_guard lock(mutex_);
    lastUsedAt_ = Clock::now();
}

void PooledConnection::close() {
    std::unique_ptr<foundation::StoreConnection> handle;
    {
        std::lock_guard lock(mutex_);
        handle = std::move(handle_);
        transactionActive_ = false;
    }
    if (handle) {
        handle->close();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionLease
// ═══════════════════════════════════════════════════════════════════════════

ConnectionLease::ConnectionLease(ConnectionPool* pool, std::shared_ptr<PooledConnection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionLease::~ConnectionLease() {
    release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      connection_(std::move(other.connection_)) {}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        connection_ = std::move(other.connection_);
    }
    return *this;
}

void ConnectionLease::release() {
    if (pool_ && connection_) {
        pool_->release(std::move(connection_));
    }
    connection_.reset();
    pool_ = nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionPool
// ═══════════════════════════════════════════════════════════════════════════

// ── Impl ────────────────────────────────────────────────────────────────────

struct ConnectionPool::Impl {
    ConnectionPoolConfig config;
    foundation::StoreConnectionFactory factory;
    foundation::SluiceMetrics& metrics;

    mutable std::mutex mutex;
    std::condition_variable available_cv;

    std::deque<std::shared_ptr<PooledConnection>> available;
    std::unordered_map<ConnectionId, std::shared_ptr<PooledConnection>> all;

    // Connections being opened outside the lock; counted against maxSize.
    std::size_t pendingCreates = 0;
    uint64_t nextId = 1;
    bool initialized = false;
    bool shutdown = false;
    bool degraded = false;

    std::unique_ptr<PeriodicTask> maintenance;

    // Stats (guarded by mutex)
    uint64_t totalCreated = 0;
    uint64_t totalDestroyed = 0;
    uint64_t acquisitions = 0;
    uint64_t connectionWaits = 0;
    uint64_t timeouts = 0;

    // Query stats are fed from connections without the pool lock.
    std::atomic<uint64_t> queriesExecuted{0};
    std::atomic<uint64_t> queryErrors{0};
    std::atomic<uint64_t> queryMicros{0};

    Impl(ConnectionPoolConfig cfg, foundation::StoreConnectionFactory f,
         foundation::SluiceMetrics& m)
        : config(std::move(cfg)), factory(std::move(f)), metrics(m) {}

    [[nodiscard]] std::size_t activeCount() const {
        return all.size() - available.size();
    }
};

// ── Construction / destruction ──────────────────────────────────────────────

ConnectionPool::ConnectionPool(ConnectionPoolConfig config,
                               foundation::StoreConnectionFactory factory,
                               foundation::SluiceMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(factory), metrics)) {
    if (impl_->config.maxSize < impl_->config.minSize) {
        impl_->config.maxSize = impl_->config.minSize;
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

// ── openConnection() ────────────────────────────────────────────────────────

SluiceResult<std::shared_ptr<PooledConnection>> ConnectionPool::openConnection() {
    using R = SluiceResult<std::shared_ptr<PooledConnection>>;

    if (!impl_->factory) {
        return R::err(SluiceError(ErrorCode::StoreError, "no connection factory configured"));
    }

    auto handle = impl_->factory();
    if (!handle) {
        SLUICE_LOG_ERROR(LogCategory::Pool,
                         "failed to open store connection: " + handle.error().describe());
        return R::err(handle.error());
    }

    ConnectionId id;
    {
        std::lock_guard lock(impl_->mutex);
        id = ConnectionId(impl_->nextId++);
    }

    auto* impl = impl_.get();
    auto observer = [impl](std::chrono::microseconds elapsed, bool ok) {
        impl->queriesExecuted.fetch_add(1, std::memory_order_relaxed);
        impl->queryMicros.fetch_add(static_cast<uint64_t>(elapsed.count()),
                                    std::memory_order_relaxed);
        if (!ok) {
            impl->queryErrors.fetch_add(1, std::memory_order_relaxed);
        }
    };

    auto conn = std::make_shared<PooledConnection>(PooledConnection::Passkey{}, id,
                                                   std::move(handle).value(), std::move(observer));

    SLUICE_LOG_DEBUG(LogCategory::Pool, "opened connection " + std::to_string(id.value()));
    return R::ok(std::move(conn));
}

// ── initialize() ────────────────────────────────────────────────────────────

SluiceResult<void> ConnectionPool::initialize() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->initialized) {
            return SluiceResult<void>::err(
                SluiceError(ErrorCode::AlreadyExists, "connection pool already initialized"));
        }
        if (impl_->shutdown) {
            return SluiceResult<void>::err(
                SluiceError(ErrorCode::PoolShutdown, "connection pool is shut down"));
        }
    }

    std::vector<std::shared_ptr<PooledConnection>> created;
    created.reserve(impl_->config.minSize);
    for (uint32_t i = 0; i < impl_->config.minSize; ++i) {
        auto conn = openConnection();
        if (!conn) {
            for (auto& c : created) {
                c->close();
            }
            impl_->metrics.setComponentHealth(kPoolComponent, HealthStatus::Unhealthy);
            SLUICE_LOG_ERROR(LogCategory::Pool,
                             "connection pool initialization failed: " + conn.error().describe());
            return SluiceResult<void>::err(conn.error());
        }
        created.push_back(std::move(conn).value());
    }

    {
        std::lock_guard lock(impl_->mutex);
        for (auto& conn : created) {
            impl_->all.emplace(conn->id(), conn);
            impl_->available.push_back(std::move(conn));
            ++impl_->totalCreated;
        }
        impl_->initialized = true;
        publishGauges();
    }

    impl_->maintenance = std::make_unique<PeriodicTask>(
        "pool-maintenance", impl_->config.maintenanceInterval, [this] { runMaintenance(); });
    auto started = impl_->maintenance->start();
    if (!started) {
        return started;
    }

    impl_->metrics.setComponentHealth(kPoolComponent, HealthStatus::Healthy);
    SLUICE_LOG_INFO(LogCategory::Pool,
                    "connection pool initialized with " + std::to_string(impl_->config.minSize) +
                        " connections (max " + std::to_string(impl_->config.maxSize) + ")");
    return SluiceResult<void>::ok();
}

// ── shutdown() ──────────────────────────────────────────────────────────────

void ConnectionPool::shutdown() {
    std::vector<std::shared_ptr<PooledConnection>> idle;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shutdown) {
            return;
        }
        impl_->shutdown = true;
        for (auto& conn : impl_->available) {
            impl_->all.erase(conn->id());
            ++impl_->totalDestroyed;
        }
        idle.assign(impl_->available.begin(), impl_->available.end());
        impl_->available.clear();
        publishGauges();
    }
    impl_->available_cv.notify_all();

    if (impl_->maintenance) {
        impl_->maintenance->stop();
    }

    for (auto& conn : idle) {
        conn->close();
    }

    impl_->metrics.setComponentHealth(kPoolComponent, HealthStatus::Unhealthy);
    SLUICE_LOG_INFO(LogCategory::Pool,
                    "connection pool shut down, closed " + std::to_string(idle.size()) +
                        " idle connections");
}

// ── acquire() ───────────────────────────────────────────────────────────────

SluiceResult<ConnectionLease> ConnectionPool::acquire() {
    return acquire(impl_->config.connectionTimeout);
}

SluiceResult<ConnectionLease> ConnectionPool::acquire(std::chrono::milliseconds maxWait) {
    using R = SluiceResult<ConnectionLease>;
    using Clock = std::chrono::steady_clock;

    const auto wait = std::clamp(maxWait, std::chrono::milliseconds(0), impl_->config.connectionTimeout);
    const auto start = Clock::now();
    const auto deadline = start + wait;

    std::unique_lock lock(impl_->mutex);

    auto checkout = [&](std::shared_ptr<PooledConnection> conn) {
        ++impl_->acquisitions;
        if (Clock::now() - start > impl_->config.slowWaitThreshold) {
            ++impl_->connectionWaits;
        }
        if (impl_->degraded) {
            impl_->degraded = false;
            impl_->metrics.setComponentHealth(kPoolComponent, HealthStatus::Healthy);
        }
        publishGauges();
        return R::ok(ConnectionLease(this, std::move(conn)));
    };

    auto grow = [&]() -> R {
        ++impl_->pendingCreates;
        lock.unlock();
        auto opened = openConnection();
        lock.lock();
        --impl_->pendingCreates;
        if (!opened) {
            impl_->available_cv.notify_one();
            return R::err(opened.error());
        }
        auto conn = std::move(opened).value();
        if (impl_->shutdown) {
            lock.unlock();
            conn->close();
            return R::err(SluiceError(ErrorCode::PoolShutdown, "connection pool is shut down"));
        }
        impl_->all.emplace(conn->id(), conn);
        ++impl_->totalCreated;
        return checkout(std::move(conn));
    };

    auto occupancy = [&] { return impl_->all.size() + impl_->pendingCreates; };

    if (impl_->shutdown) {
        return R::err(SluiceError(ErrorCode::PoolShutdown, "connection pool is shut down"));
    }

    // Below the floor there is nothing to wait for.
    if (impl_->available.empty() && occupancy() < impl_->config.minSize) {
        return grow();
    }

    impl_->available_cv.wait_until(lock, deadline, [&] {
        return impl_->shutdown || !impl_->available.empty();
    });

    if (impl_->shutdown) {
        return R::err(SluiceError(ErrorCode::PoolShutdown, "connection pool is shut down"));
    }

    if (!impl_->available.empty()) {
        auto conn = std::move(impl_->available.front());
        impl_->available.pop_front();
        return checkout(std::move(conn));
    }

    if (occupancy() < impl_->config.maxSize) {
        return grow();
    }

    ++impl_->timeouts;
    if (!impl_->degraded) {
        impl_->degraded = true;
        impl_->metrics.setComponentHealth(kPoolComponent, HealthStatus::Degraded);
    }
    SLUICE_LOG_WARN(LogCategory::Pool,
                    "connection pool exhausted (" + std::to_string(impl_->all.size()) + "/" +
                        std::to_string(impl_->config.maxSize) + " in use)");
    return R::err(SluiceError(ErrorCode::PoolExhausted,
                              "no connection available within " +
                                  std::to_string(wait.count()) + " ms"));
}

// ── release() ───────────────────────────────────────────────────────────────

void ConnectionPool::release(std::shared_ptr<PooledConnection> connection) {
    if (!connection) {
        return;
    }

    const bool openTransaction = connection->transactionActive();
    if (openTransaction) {
        connection->abandonTransaction("released with an open transaction");
    }
    // A connection that had to be rolled back on release is never reused.
    const bool reusable = !openTransaction && connection->isHealthy();

    bool shuttingDown = false;
    {
        std::lock_guard lock(impl_->mutex);
        shuttingDown = impl_->shutdown;
        if (reusable && !shuttingDown) {
            connection->touch();
            impl_->available.push_back(std::move(connection));
            publishGauges();
            impl_->available_cv.notify_one();
            return;
        }
        if (impl_->all.erase(connection->id()) > 0) {
            ++impl_->totalDestroyed;
        }
        publishGauges();
    }
    // Frees a slot for a waiter that may grow the pool.
    impl_->available_cv.notify_one();

    if (!shuttingDown) {
        SLUICE_LOG_WARN(LogCategory::Pool,
                        "discarding connection " + std::to_string(connection->id().value()) +
                            (openTransaction ? " (open transaction)" : " (unhealthy)"));
    }
    connection->close();
}

// ── execute() / executeTransaction() ────────────────────────────────────────

SluiceResult<QueryOutcome> ConnectionPool::execute(std::string_view sql,
                                                   const DbParams& params,
                                                   FetchMode mode,
                                                   std::size_t limit) {
    return withConnection([&](PooledConnection& conn) {
        return conn.execute(sql, params, mode, limit);
    });
}

SluiceResult<std::vector<QueryOutcome>> ConnectionPool::executeTransaction(
    const std::vector<Statement>& statements) {
    using R = SluiceResult<std::vector<QueryOutcome>>;

    return withTransaction([&](PooledConnection& conn) -> R {
        std::vector<QueryOutcome> outcomes;
        outcomes.reserve(statements.size());
        for (const auto& stmt : statements) {
            auto sql = stmt.resolve();
            if (!sql) {
                return R::err(sql.error());
            }
            auto mode = returnsRows(sql.value()) ? FetchMode::All : FetchMode::RowCount;
            auto outcome = conn.execute(sql.value(), {}, mode);
            if (!outcome) {
                return R::err(SluiceError(ErrorCode::TransactionFailed,
                                          std::string(outcome.error().message())));
            }
            outcomes.push_back(std::move(outcome).value());
        }
        return R::ok(std::move(outcomes));
    });
}

// ── runMaintenance() ────────────────────────────────────────────────────────

std::size_t ConnectionPool::runMaintenance() {
    std::vector<std::shared_ptr<PooledConnection>> expired;
    const auto now = PooledConnection::Clock::now();
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shutdown) {
            return 0;
        }
        auto it = impl_->available.begin();
        while (it != impl_->available.end() && impl_->all.size() > impl_->config.minSize) {
            if (now - (*it)->lastUsedAt() > impl_->config.idleTimeout) {
                impl_->all.erase((*it)->id());
                ++impl_->totalDestroyed;
                expired.push_back(std::move(*it));
                it = impl_->available.erase(it);
            } else {
                ++it;
            }
        }
        publishGauges();
    }

    for (auto& conn : expired) {
        conn->close();
    }
    if (!expired.empty()) {
        SLUICE_LOG_INFO(LogCategory::Pool,
                        "maintenance closed " + std::to_string(expired.size()) +
                            " idle connections");
    }
    return expired.size();
}

// ── Stats ───────────────────────────────────────────────────────────────────

PoolStats ConnectionPool::stats() const {
    PoolStats s;
    {
        std::lock_guard lock(impl_->mutex);
        s.totalCreated = impl_->totalCreated;
        s.totalDestroyed = impl_->totalDestroyed;
        s.acquisitions = impl_->acquisitions;
        s.connectionWaits = impl_->connectionWaits;
        s.timeouts = impl_->timeouts;
        s.active = impl_->activeCount();
        s.available = impl_->available.size();
        s.total = impl_->all.size();
    }
    s.queriesExecuted = impl_->queriesExecuted.load(std::memory_order_relaxed);
    s.queryErrors = impl_->queryErrors.load(std::memory_order_relaxed);
    if (s.queriesExecuted > 0) {
        auto micros = impl_->queryMicros.load(std::memory_order_relaxed);
        s.averageQueryMs =
            static_cast<double>(micros) / 1000.0 / static_cast<double>(s.queriesExecuted);
    }
    return s;
}

std::vector<std::string> ConnectionPool::recommendations() const {
    auto s = stats();
    std::vector<std::string> advice;

    const auto attempts = static_cast<double>(std::max<uint64_t>(s.acquisitions + s.timeouts, 1));
    const double waitRatio = static_cast<double>(s.connectionWaits) / attempts;
    const double timeoutRatio = static_cast<double>(s.timeouts) / attempts;

    if (waitRatio > 0.1) {
        advice.push_back("Frequent connection waits: increase minSize (suggested " +
                         std::to_string(std::min(impl_->config.minSize * 2, 50U)) + ")");
    }
    if (timeoutRatio > 0.01) {
        advice.push_back("Pool often exhausted: increase maxSize (suggested " +
                         std::to_string(impl_->config.maxSize * 2) + ")");
    }
    if (s.averageQueryMs > 100.0) {
        advice.push_back("Average query time above 100 ms: optimize queries or add indexes");
    }
    return advice;
}

std::size_t ConnectionPool::totalConnections() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->all.size();
}

std::size_t ConnectionPool::availableConnections() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->available.size();
}

std::size_t ConnectionPool::activeConnections() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->activeCount();
}

const ConnectionPoolConfig& ConnectionPool::config() const noexcept {
    return impl_->config;
}

// Caller holds impl_->mutex.
void ConnectionPool::publishGauges() const {
    impl_->metrics.setGauge(kPoolActiveGauge, static_cast<double>(impl_->activeCount()));
    impl_->metrics.setGauge(kPoolAvailableGauge, static_cast<double>(impl_->available.size()));
}

} // namespace sluice::service

/// @file store_connection.cpp
/// @brief KcenonStoreConnection and Statement implementation.

#include "sluice/foundation/store_connection.hpp"

#include "sluice/foundation/sluice_logger.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <sstream>
#include <type_traits>

namespace sluice::foundation {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ::database::database_types toKcenon(StoreType type) {
    switch (type) {
        case StoreType::PostgreSQL: return ::database::database_types::postgres;
        case StoreType::MySQL:      return ::database::database_types::mysql;
        case StoreType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::sqlite;
}

static QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

static std::string sqlLiteral(const DbValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string escaped;
            escaped.reserve(arg.size() + 2);
            escaped += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    escaped += "''";
                } else {
                    escaped += c;
                }
            }
            escaped += '\'';
            return escaped;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss.precision(17);
            oss << arg;
            return oss.str();
        } else {
            return arg ? "1" : "0";
        }
    }, value);
}

std::string toText(const DbValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
    }, value);
}

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::Statement(std::string sql)
    : sql_(std::move(sql)) {}

Statement::Statement(std::string sql, DbParams params)
    : sql_(std::move(sql)), params_(std::move(params)) {}

Statement& Statement::bind(DbValue value) {
    params_.push_back(std::move(value));
    return *this;
}

std::string_view Statement::sql() const noexcept {
    return sql_;
}

std::size_t Statement::placeholderCount() const {
    std::size_t count = 0;
    bool inLiteral = false;
    for (char c : sql_) {
        if (c == '\'') {
            inLiteral = !inLiteral;
        } else if (c == '?' && !inLiteral) {
            ++count;
        }
    }
    return count;
}

SluiceResult<std::string> Statement::resolve() const {
    auto expected = placeholderCount();
    if (expected != params_.size()) {
        return SluiceResult<std::string>::err(
            SluiceError(ErrorCode::InvalidArgument,
                        "statement expects " + std::to_string(expected) +
                            " parameters, got " + std::to_string(params_.size())));
    }

    std::string resolved;
    resolved.reserve(sql_.size() + params_.size() * 8);
    std::size_t next = 0;
    bool inLiteral = false;
    for (char c : sql_) {
        if (c == '\'') {
            inLiteral = !inLiteral;
            resolved += c;
        } else if (c == '?' && !inLiteral) {
            resolved += sqlLiteral(params_[next++]);
        } else {
            resolved += c;
        }
    }
    return SluiceResult<std::string>::ok(std::move(resolved));
}

void Statement::clearBindings() {
    params_.clear();
}

// ---------------------------------------------------------------------------
// KcenonStoreConnection::Impl
// ---------------------------------------------------------------------------

struct KcenonStoreConnection::Impl {
    StoreConfig config;
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool open = false;
    bool broken = false;

    uint64_t affectedRows() {
        const char* probe = nullptr;
        switch (config.type) {
            case StoreType::SQLite: probe = "SELECT changes() AS affected"; break;
            case StoreType::MySQL:  probe = "SELECT ROW_COUNT() AS affected"; break;
            case StoreType::PostgreSQL: return 0;
        }
        auto result = manager->select_query_result(probe);
        if (!result.is_ok() || result.value().empty()) {
            return 0;
        }
        auto rows = convertResult(result.value());
        auto it = rows.front().find("affected");
        if (it == rows.front().end()) {
            return 0;
        }
        if (const auto* n = std::get_if<std::int64_t>(&it->second)) {
            return *n < 0 ? 0 : static_cast<uint64_t>(*n);
        }
        return 0;
    }
};

KcenonStoreConnection::KcenonStoreConnection(Passkey, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

KcenonStoreConnection::~KcenonStoreConnection() {
    if (impl_) {
        close();
    }
}

SluiceResult<std::unique_ptr<StoreConnection>> KcenonStoreConnection::open(
    const StoreConfig& config) {
    auto impl = std::make_unique<Impl>();
    impl->config = config;
    impl->context = std::make_shared<::database::database_context>();
    impl->manager = std::make_shared<::database::database_manager>(impl->context);

    if (!impl->manager->set_mode(toKcenon(config.type))) {
        return SluiceResult<std::unique_ptr<StoreConnection>>::err(
            SluiceError(ErrorCode::StoreError, "unsupported store backend"));
    }

    auto result = impl->manager->connect_result(config.connectionString);
    if (!result.is_ok()) {
        return SluiceResult<std::unique_ptr<StoreConnection>>::err(
            SluiceError(ErrorCode::NotConnected,
                        "store connect failed: " + result.error().message));
    }
    impl->open = true;

    std::unique_ptr<StoreConnection> conn =
        std::make_unique<KcenonStoreConnection>(Passkey{}, std::move(impl));
    return SluiceResult<std::unique_ptr<StoreConnection>>::ok(std::move(conn));
}

SluiceResult<QueryResult> KcenonStoreConnection::query(std::string_view sql) {
    if (!impl_->open) {
        return SluiceResult<QueryResult>::err(
            SluiceError(ErrorCode::NotConnected, "connection is closed"));
    }

    auto result = impl_->manager->select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return SluiceResult<QueryResult>::err(
            SluiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return SluiceResult<QueryResult>::ok(convertResult(result.value()));
}

SluiceResult<uint64_t> KcenonStoreConnection::execute(std::string_view sql) {
    if (!impl_->open) {
        return SluiceResult<uint64_t>::err(
            SluiceError(ErrorCode::NotConnected, "connection is closed"));
    }

    auto result = impl_->manager->execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return SluiceResult<uint64_t>::err(
            SluiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return SluiceResult<uint64_t>::ok(impl_->affectedRows());
}

SluiceResult<void> KcenonStoreConnection::begin() {
    if (!impl_->open) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::NotConnected, "connection is closed"));
    }
    auto result = impl_->manager->begin_transaction();
    if (!result.is_ok()) {
        impl_->broken = true;
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed,
                        "failed to begin transaction: " + result.error().message));
    }
    return SluiceResult<void>::ok();
}

SluiceResult<void> KcenonStoreConnection::commit() {
    auto result = impl_->manager->commit_transaction();
    if (!result.is_ok()) {
        impl_->broken = true;
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed,
                        "commit failed: " + result.error().message));
    }
    return SluiceResult<void>::ok();
}

SluiceResult<void> KcenonStoreConnection::rollback() {
    auto result = impl_->manager->rollback_transaction();
    if (!result.is_ok()) {
        impl_->broken = true;
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::TransactionFailed,
                        "rollback failed: " + result.error().message));
    }
    return SluiceResult<void>::ok();
}

bool KcenonStoreConnection::isHealthy() const {
    return impl_->open && !impl_->broken;
}

void KcenonStoreConnection::close() {
    if (!impl_->open) {
        return;
    }
    impl_->open = false;
    auto result = impl_->manager->disconnect_result();
    if (!result.is_ok()) {
        SLUICE_LOG_WARN(LogCategory::Store,
                        "store disconnect failed: " + result.error().message);
    }
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

StoreConnectionFactory makeStoreConnectionFactory(StoreConfig config) {
    return [config = std::move(config)]() {
        return KcenonStoreConnection::open(config);
    };
}

} // namespace sluice::foundation

#pragma once

/// @file fake_store.hpp
/// @brief In-memory StoreConnection for pool and optimizer tests.
///
/// Every connection created by one FakeStore shares its FakeStoreState, so
/// a test can script failures and inspect the statements that ran.

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/foundation/store_connection.hpp"

namespace sluice::test {

struct FakeStoreState {
    std::mutex mutex;
    std::vector<std::string> statements;
    foundation::QueryResult rows;         ///< Returned by every query()
    std::string failOn;                   ///< query/execute containing this fails
    std::atomic<bool> failOpen{false};
    std::atomic<bool> healthy{true};
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> begins{0};
    std::atomic<int> commits{0};
    std::atomic<int> rollbacks{0};

    std::vector<std::string> executed() {
        std::lock_guard lock(mutex);
        return statements;
    }
};

class FakeStoreConnection final : public foundation::StoreConnection {
public:
    explicit FakeStoreConnection(std::shared_ptr<FakeStoreState> state)
        : state_(std::move(state)) {}

    foundation::SluiceResult<foundation::QueryResult> query(std::string_view sql) override {
        if (auto failed = record(sql); failed) {
            return foundation::SluiceResult<foundation::QueryResult>::err(*failed);
        }
        std::lock_guard lock(state_->mutex);
        return foundation::SluiceResult<foundation::QueryResult>::ok(state_->rows);
    }

    foundation::SluiceResult<uint64_t> execute(std::string_view sql) override {
        if (auto failed = record(sql); failed) {
            return foundation::SluiceResult<uint64_t>::err(*failed);
        }
        return foundation::SluiceResult<uint64_t>::ok(1);
    }

    foundation::SluiceResult<void> begin() override {
        ++state_->begins;
        return foundation::SluiceResult<void>::ok();
    }

    foundation::SluiceResult<void> commit() override {
        ++state_->commits;
        return foundation::SluiceResult<void>::ok();
    }

    foundation::SluiceResult<void> rollback() override {
        ++state_->rollbacks;
        return foundation::SluiceResult<void>::ok();
    }

    bool isHealthy() const override { return !closed_ && state_->healthy.load(); }

    void close() override {
        if (!closed_) {
            closed_ = true;
            ++state_->closed;
        }
    }

private:
    std::optional<foundation::SluiceError> record(std::string_view sql) {
        std::lock_guard lock(state_->mutex);
        state_->statements.emplace_back(sql);
        if (!state_->failOn.empty() && sql.find(state_->failOn) != std::string_view::npos) {
            return foundation::SluiceError(foundation::ErrorCode::QueryFailed, "scripted failure");
        }
        return std::nullopt;
    }

    std::shared_ptr<FakeStoreState> state_;
    bool closed_ = false;
};

/// Factory bound to @p state.
inline foundation::StoreConnectionFactory makeFakeStoreFactory(
    std::shared_ptr<FakeStoreState> state) {
    return [state]() -> foundation::SluiceResult<std::unique_ptr<foundation::StoreConnection>> {
        using R = foundation::SluiceResult<std::unique_ptr<foundation::StoreConnection>>;
        if (state->failOpen.load()) {
            return R::err(foundation::SluiceError(foundation::ErrorCode::NotConnected,
                                                  "store unreachable"));
        }
        ++state->opened;
        return R::ok(std::make_unique<FakeStoreConnection>(state));
    };
}

} // namespace sluice::test

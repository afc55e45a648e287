/// @file model_client.cpp
/// @brief ModelClient batch default and SimulatedModelClient.

#include "sluice/service/model_client.hpp"

#include <algorithm>
#include <thread>

#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/sluice_error.hpp"

namespace sluice::service {

using sluice::foundation::ErrorCode;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{5};

/// Error for a call that could not finish, or nullopt if it still may.
std::optional<SluiceError> interruption(const RequestContext& ctx) {
    if (ctx.cancelled()) {
        return SluiceError(ErrorCode::Cancelled, "model call cancelled", ctx.requestId);
    }
    if (ctx.expired()) {
        return SluiceError(ErrorCode::TimedOut, "model call exceeded request deadline",
                           ctx.requestId);
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<ModelTier> parseModelTier(std::string_view name) {
    for (std::size_t i = 0; i < kModelTierCount; ++i) {
        if (kTierSpecs[i].name == name) {
            return static_cast<ModelTier>(i);
        }
    }
    return std::nullopt;
}

// ── ModelClient ─────────────────────────────────────────────────────────────

std::vector<SluiceResult<std::string>> ModelClient::generateBatch(const std::vector<ModelCall>& calls) {
    std::vector<SluiceResult<std::string>> results;
    results.reserve(calls.size());
    for (const auto& call : calls) {
        results.push_back(generate(call.prompt, call.tier, call.context, call.requestContext));
    }
    return results;
}

// ── SimulatedModelClient ────────────────────────────────────────────────────

SimulatedModelClient::SimulatedModelClient(SimulatedModelConfig config)
    : config_(config) {}

std::string SimulatedModelClient::render(std::string_view prompt, ModelTier tier) const {
    std::string out = "[";
    out += toString(tier);
    out += "] ";
    out += prompt.substr(0, config_.echoChars);
    return out;
}

SluiceResult<std::string> SimulatedModelClient::generate(std::string_view prompt,
                                                         ModelTier tier,
                                                         std::string_view /*context*/,
                                                         const RequestContext& ctx) {
    calls_.fetch_add(1, std::memory_order_relaxed);

    const auto done = std::chrono::steady_clock::now() + config_.latency;
    while (std::chrono::steady_clock::now() < done) {
        if (auto err = interruption(ctx)) {
            return SluiceResult<std::string>::err(std::move(*err));
        }
        auto left = done - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, kWaitSlice));
    }
    if (auto err = interruption(ctx)) {
        return SluiceResult<std::string>::err(std::move(*err));
    }
    return SluiceResult<std::string>::ok(render(prompt, tier));
}

std::vector<SluiceResult<std::string>> SimulatedModelClient::generateBatch(
    const std::vector<ModelCall>& calls) {
    batches_.fetch_add(1, std::memory_order_relaxed);

    auto allInterrupted = [&] {
        return std::all_of(calls.begin(), calls.end(), [](const ModelCall& c) {
            return interruption(c.requestContext).has_value();
        });
    };

    const auto done = std::chrono::steady_clock::now() + config_.batchLatency;
    while (std::chrono::steady_clock::now() < done && !allInterrupted()) {
        auto left = done - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, kWaitSlice));
    }

    std::vector<SluiceResult<std::string>> results;
    results.reserve(calls.size());
    for (const auto& call : calls) {
        if (auto err = interruption(call.requestContext)) {
            results.push_back(SluiceResult<std::string>::err(std::move(*err)));
        } else {
            results.push_back(SluiceResult<std::string>::ok(render(call.prompt, call.tier)));
        }
    }
    return results;
}

} // namespace sluice::service

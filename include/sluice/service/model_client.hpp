#pragma once

/// @file model_client.hpp
/// @brief Execution tiers and the downstream model-call interface.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/foundation/sluice_result.hpp"
#include "sluice/service/request_types.hpp"

namespace sluice::service {

// ── Tiers ───────────────────────────────────────────────────────────────────

/// Downstream execution strategy, cheapest first.
enum class ModelTier : uint8_t {
    FreeFast,
    Fast,
    Premium,
    PremiumAlt
};

inline constexpr std::size_t kModelTierCount = 4;

/// Cost and relative speed/quality of a tier (scores out of 10).
struct TierSpec {
    std::string_view name;
    double costPerCall;
    int speedScore;
    int qualityScore;
};

inline constexpr std::array<TierSpec, kModelTierCount> kTierSpecs = {{
    {"free_fast", 0.0, 10, 7},
    {"fast", 0.25, 9, 8},
    {"premium", 3.0, 6, 10},
    {"premium_alt", 10.0, 7, 9},
}};

[[nodiscard]] constexpr const TierSpec& tierSpec(ModelTier tier) noexcept {
    return kTierSpecs[static_cast<std::size_t>(tier)];
}

[[nodiscard]] constexpr std::string_view toString(ModelTier tier) noexcept {
    return tierSpec(tier).name;
}

[[nodiscard]] std::optional<ModelTier> parseModelTier(std::string_view name);

// ── ModelClient ─────────────────────────────────────────────────────────────

/// One entry of a batched model call.
struct ModelCall {
    std::string prompt;
    ModelTier tier{ModelTier::FreeFast};
    std::string context;
    RequestContext requestContext;
};

/// Downstream generation interface.
///
/// Implementations must return within the context's remaining deadline and
/// stop early once its cancel token is set. Errors: DownstreamError
/// (retryable), TimedOut, Cancelled.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    [[nodiscard]] virtual foundation::SluiceResult<std::string> generate(
        std::string_view prompt,
        ModelTier tier,
        std::string_view context,
        const RequestContext& ctx) = 0;

    /// One result per call, in order. The default runs generate() for each.
    [[nodiscard]] virtual std::vector<foundation::SluiceResult<std::string>> generateBatch(
        const std::vector<ModelCall>& calls);
};

// ── SimulatedModelClient ────────────────────────────────────────────────────

/// Configuration for SimulatedModelClient.
struct SimulatedModelConfig {
    /// Time a single generate() takes.
    std::chrono::milliseconds latency{50};

    /// Time a whole generateBatch() takes.
    std::chrono::milliseconds batchLatency{80};

    /// Characters of the prompt echoed back.
    std::size_t echoChars = 100;
};

/// Stand-in model that echoes a truncated prompt after a fixed latency.
///
/// The wait is sliced so that deadline expiry and cancellation are noticed
/// within a few milliseconds.
class SimulatedModelClient final : public ModelClient {
public:
    explicit SimulatedModelClient(SimulatedModelConfig config = {});

    [[nodiscard]] foundation::SluiceResult<std::string> generate(
        std::string_view prompt,
        ModelTier tier,
        std::string_view context,
        const RequestContext& ctx) override;

    [[nodiscard]] std::vector<foundation::SluiceResult<std::string>> generateBatch(
        const std::vector<ModelCall>& calls) override;

    /// Number of generate() calls, batched calls excluded.
    [[nodiscard]] uint64_t callCount() const noexcept { return calls_.load(); }

    [[nodiscard]] uint64_t batchCount() const noexcept { return batches_.load(); }

private:
    [[nodiscard]] std::string render(std::string_view prompt, ModelTier tier) const;

    SimulatedModelConfig config_;
    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> batches_{0};
};

} // namespace sluice::service

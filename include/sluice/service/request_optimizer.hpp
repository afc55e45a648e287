#pragma once

/// @file request_optimizer.hpp
/// @brief Request optimizer/router: templates, complexity classification,
///        tier selection, cache lookup, model execution and user profiles.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/foundation/sluice_metrics.hpp"
#include "sluice/foundation/sluice_result.hpp"
#include "sluice/foundation/types.hpp"
#include "sluice/service/model_client.hpp"
#include "sluice/service/request_types.hpp"

namespace sluice::service {

class ConnectionPool;
class RequestBatcher;
class ResponseCache;

// ── Enums ───────────────────────────────────────────────────────────────────

/// Prompt complexity class, in ascending order.
enum class QueryComplexity : uint8_t {
    Simple,
    Moderate,
    Complex,
    Creative
};

inline constexpr std::size_t kQueryComplexityCount = 4;

[[nodiscard]] constexpr std::string_view toString(QueryComplexity c) {
    switch (c) {
        case QueryComplexity::Simple:
            return "simple";
        case QueryComplexity::Moderate:
            return "moderate";
        case QueryComplexity::Complex:
            return "complex";
        case QueryComplexity::Creative:
            return "creative";
    }
    return "unknown";
}

[[nodiscard]] std::optional<QueryComplexity> parseQueryComplexity(std::string_view name);

/// What the caller wants optimized.
enum class PriorityHint : uint8_t {
    Speed,
    Balanced,
    Quality
};

[[nodiscard]] constexpr std::string_view toString(PriorityHint p) {
    switch (p) {
        case PriorityHint::Speed:
            return "speed";
        case PriorityHint::Balanced:
            return "balanced";
        case PriorityHint::Quality:
            return "quality";
    }
    return "unknown";
}

[[nodiscard]] std::optional<PriorityHint> parsePriorityHint(std::string_view name);

// ── Value types ─────────────────────────────────────────────────────────────

/// Input of RequestOptimizer::resolve().
struct ResolveRequest {
    std::string prompt;
    std::string context;
    std::string userId = "anonymous";
    PriorityHint priorityHint = PriorityHint::Balanced;

    /// Cache misses of low-priority requests are batched.
    bool lowPriority = false;
};

/// Output of RequestOptimizer::resolve().
struct OptimizedResponse {
    std::string text;
    ModelTier tier{ModelTier::FreeFast};
    QueryComplexity complexity{QueryComplexity::Simple};
    bool cacheHit{false};
    bool fromTemplate{false};
    bool batched{false};

    /// Name of the matched template, when fromTemplate.
    std::string templateName;

    double confidence{0.0};
    std::chrono::milliseconds latency{0};
};

/// Canned reply for a recognizable prompt.
struct TemplateMatch {
    std::string_view name;
    std::string_view response;
    double confidence;
};

/// Classification history summary for one user.
struct UserProfile {
    std::string userId;
    std::size_t sampleCount{0};

    /// Most frequent class; unset for a user with no history.
    std::optional<QueryComplexity> preferredComplexity;

    PriorityHint priority{PriorityHint::Balanced};
    ModelTier suggestedTier{ModelTier::Fast};
    std::map<QueryComplexity, std::size_t> counts;

    [[nodiscard]] bool isNewUser() const noexcept { return sampleCount == 0; }
};

/// One conversation turn, for optimizeConversation().
struct ConversationMessage {
    std::string role;
    std::string content;
    bool isSummary{false};
};

/// Optimizer counters.
struct OptimizerMetrics {
    uint64_t totalRequests{0};
    uint64_t templateHits{0};
    uint64_t cacheHits{0};
    uint64_t fastTierUses{0};
    uint64_t batchOptimizations{0};
    double timeSavedSeconds{0.0};
    double costSaved{0.0};

    /// (cache hits + template hits + fast-tier uses) / total, in percent.
    [[nodiscard]] double effectiveness() const noexcept {
        if (totalRequests == 0) {
            return 0.0;
        }
        return static_cast<double>(cacheHits + templateHits + fastTierUses) * 100.0 /
               static_cast<double>(totalRequests);
    }
};

/// Configuration for RequestOptimizer.
struct RequestOptimizerConfig {
    /// Classifications kept per user.
    std::size_t profileWindow = 50;

    /// Time a cache hit is assumed to save.
    std::chrono::milliseconds assumedCallLatency{2000};

    /// Reference latency an executed call is compared against.
    std::chrono::milliseconds baselineLatency{3000};

    /// Record executed interactions when a pool is attached.
    bool persistInteractions = true;

    /// Time left before the request deadline that recording may not use.
    /// Recording waits for a connection only until then and is skipped when
    /// the deadline is closer than this.
    std::chrono::milliseconds persistMargin{50};
};

// ── RequestOptimizer ────────────────────────────────────────────────────────

/// Routes a prompt to the cheapest adequate path.
///
/// Order: template match, classification and tier selection, cache lookup,
/// then model execution (batched for low-priority requests when a batcher
/// is attached). Executed results are cached and, with a pool attached,
/// recorded in the `interactions` table.
///
/// The cache, model client, pool and batcher are borrowed and must outlive
/// the optimizer.
class RequestOptimizer {
public:
    RequestOptimizer(RequestOptimizerConfig config,
                     ResponseCache& cache,
                     ModelClient& client,
                     ConnectionPool* pool = nullptr,
                     RequestBatcher* batcher = nullptr,
                     foundation::SluiceMetrics& metrics = foundation::SluiceMetrics::instance());
    ~RequestOptimizer();

    RequestOptimizer(const RequestOptimizer&) = delete;
    RequestOptimizer& operator=(const RequestOptimizer&) = delete;

    /// Create the interactions table when a pool is attached.
    [[nodiscard]] foundation::SluiceResult<void> initialize();

    /// Resolve @p request within @p ctx's deadline.
    [[nodiscard]] foundation::SluiceResult<OptimizedResponse> resolve(const ResolveRequest& request,
                                                                     const RequestContext& ctx);

    /// Scheduler entry point. Reads `prompt`, `context` and `priority`
    /// from @p payload and maps resolve() errors to retryable or fatal.
    [[nodiscard]] HandlerOutcome handle(const RequestContext& ctx,
                                        const foundation::Payload& payload);

    // ── Routing primitives ──────────────────────────────────────────────

    [[nodiscard]] static std::optional<TemplateMatch> matchTemplate(std::string_view prompt);

    /// Highest number of matching patterns wins; ties go to the later class.
    [[nodiscard]] static QueryComplexity classify(std::string_view prompt);

    [[nodiscard]] static ModelTier selectTier(QueryComplexity complexity, PriorityHint hint);

    [[nodiscard]] static ModelTier suggestedTierFor(QueryComplexity complexity);

    // ── Profiles / conversation ─────────────────────────────────────────

    /// Profile from stored interactions (pool attached) or the in-memory window.
    [[nodiscard]] UserProfile analyzeUserPatterns(const std::string& userId);

    /// Keep the first 2 and last 6 of more than 10 messages, with one
    /// system summary in between.
    [[nodiscard]] static std::vector<ConversationMessage> optimizeConversation(
        std::vector<ConversationMessage> messages);

    [[nodiscard]] OptimizerMetrics metrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sluice::service

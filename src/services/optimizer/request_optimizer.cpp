/// @file request_optimizer.cpp
/// @brief RequestOptimizer implementation.

#include "sluice/service/request_optimizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <iterator>
#include <mutex>
#include <regex>
#include <unordered_map>

#include "sluice/foundation/error_code.hpp"
#include "sluice/foundation/sluice_error.hpp"
#include "sluice/foundation/sluice_logger.hpp"
#include "sluice/service/connection_pool.hpp"
#include "sluice/service/request_batcher.hpp"
#include "sluice/service/response_cache.hpp"

namespace sluice::service {

using sluice::foundation::DbParams;
using sluice::foundation::ErrorCode;
using sluice::foundation::LogCategory;
using sluice::foundation::Payload;
using sluice::foundation::SluiceError;
using sluice::foundation::SluiceResult;

// ── Tables ──────────────────────────────────────────────────────────────────

namespace {

constexpr const char* kRoutedCounter = "sluice_optimizer_requests_total";

struct TemplateSpec {
    std::string_view name;
    const char* pattern;
    std::string_view response;
    double confidence;
};

constexpr std::array<TemplateSpec, 3> kTemplates = {{
    {"greeting", R"(\b(hi|hello|hey|greetings)\b)",
     "Hello! I'm ready to help. What would you like to work on?", 0.95},
    {"status", R"(\b(status|how are you|are you working)\b)",
     "All systems are operational and ready to assist.", 0.90},
    {"capabilities", R"(\b(what can you do|capabilities|features)\b)",
     "I can answer questions, analyze and summarize documents, write and review code, "
     "and keep track of our conversation.",
     0.85},
}};

/// Four patterns per class, indexed by QueryComplexity.
constexpr std::array<std::array<const char*, 4>, kQueryComplexityCount> kComplexityPatterns = {{
    {R"(\b(what is|define|explain simply)\b)",
     R"(\b(yes|no|true|false)\b)",
     R"(\b(list|name|count)\b)",
     R"(\b(when|where|who)\b)"},
    {R"(\b(how to|explain how|analyze|compare)\b)",
     R"(\b(code|program|function|algorithm)\b)",
     R"(\b(solve|calculate|compute)\b)",
     R"(\b(summarize|outline|describe)\b)"},
    {R"(\b(design|architect|strategy|plan)\b)",
     R"(\b(evaluate|critique|assess)\b)",
     R"(\b(research|investigate|analyze deeply)\b)",
     R"(\b(optimize|improve|enhance)\b)"},
    {R"(\b(create|generate|write|compose)\b)",
     R"(\b(story|poem|creative|artistic)\b)",
     R"(\b(imagine|brainstorm|innovate)\b)",
     R"(\b(design something new|invent)\b)"},
}};

const auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

/// Compiled once; std::regex matching is safe from multiple threads.
const std::vector<std::regex>& templateRegexes() {
    static const std::vector<std::regex> compiled = [] {
        std::vector<std::regex> out;
        for (const auto& t : kTemplates) {
            out.emplace_back(t.pattern, kRegexFlags);
        }
        return out;
    }();
    return compiled;
}

const std::array<std::vector<std::regex>, kQueryComplexityCount>& complexityRegexes() {
    static const auto compiled = [] {
        std::array<std::vector<std::regex>, kQueryComplexityCount> out;
        for (std::size_t c = 0; c < kQueryComplexityCount; ++c) {
            for (const char* pattern : kComplexityPatterns[c]) {
                out[c].emplace_back(pattern, kRegexFlags);
            }
        }
        return out;
    }();
    return compiled;
}

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isFastTier(ModelTier tier) {
    return tier == ModelTier::FreeFast || tier == ModelTier::Fast;
}

int64_t epochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Fold classification counts into a profile.
UserProfile buildProfile(const std::string& userId,
                         const std::array<std::size_t, kQueryComplexityCount>& counts) {
    UserProfile profile;
    profile.userId = userId;

    std::size_t total = 0;
    std::size_t best = 0;
    for (std::size_t c = 0; c < kQueryComplexityCount; ++c) {
        total += counts[c];
        if (counts[c] > 0) {
            profile.counts[static_cast<QueryComplexity>(c)] = counts[c];
        }
        if (counts[c] > best) {
            best = counts[c];
            profile.preferredComplexity = static_cast<QueryComplexity>(c);
        }
    }
    profile.sampleCount = total;
    if (total == 0) {
        return profile;
    }

    const auto share = [&](QueryComplexity c) {
        return static_cast<double>(counts[static_cast<std::size_t>(c)]) / static_cast<double>(total);
    };
    if (share(QueryComplexity::Simple) > 0.6) {
        profile.priority = PriorityHint::Speed;
    } else if (share(QueryComplexity::Creative) > 0.3) {
        profile.priority = PriorityHint::Quality;
    }
    profile.suggestedTier = RequestOptimizer::suggestedTierFor(*profile.preferredComplexity);
    return profile;
}

/// Errors that a later attempt may not hit again.
bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::Cancelled:
        case ErrorCode::TimedOut:
            return false;
        default:
            return true;
    }
}

} // anonymous namespace

std::optional<QueryComplexity> parseQueryComplexity(std::string_view name) {
    for (std::size_t c = 0; c < kQueryComplexityCount; ++c) {
        if (toString(static_cast<QueryComplexity>(c)) == name) {
            return static_cast<QueryComplexity>(c);
        }
    }
    return std::nullopt;
}

std::optional<PriorityHint> parsePriorityHint(std::string_view name) {
    for (auto hint : {PriorityHint::Speed, PriorityHint::Balanced, PriorityHint::Quality}) {
        if (toString(hint) == name) {
            return hint;
        }
    }
    return std::nullopt;
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct RequestOptimizer::Impl {
    RequestOptimizerConfig config;
    ResponseCache& cache;
    ModelClient& client;
    ConnectionPool* pool;
    RequestBatcher* batcher;
    foundation::SluiceMetrics& metrics;

    mutable std::mutex profileMutex;
    std::unordered_map<std::string, std::deque<QueryComplexity>> history;

    mutable std::mutex metricsMutex;
    OptimizerMetrics counters;

    Impl(RequestOptimizerConfig cfg, ResponseCache& c, ModelClient& m, ConnectionPool* p,
         RequestBatcher* b, foundation::SluiceMetrics& mx)
        : config(cfg), cache(c), client(m), pool(p), batcher(b), metrics(mx) {}

    void remember(const std::string& userId, QueryComplexity complexity) {
        std::lock_guard lock(profileMutex);
        auto& window = history[userId];
        window.push_back(complexity);
        while (window.size() > config.profileWindow) {
            window.pop_front();
        }
    }

    UserProfile memoryProfile(const std::string& userId) const {
        std::array<std::size_t, kQueryComplexityCount> counts{};
        {
            std::lock_guard lock(profileMutex);
            auto it = history.find(userId);
            if (it != history.end()) {
                for (auto c : it->second) {
                    ++counts[static_cast<std::size_t>(c)];
                }
            }
        }
        return buildProfile(userId, counts);
    }

    void countRoute(std::string_view path) {
        metrics.incrementCounter(std::string(kRoutedCounter) + "{path=\"" + std::string(path) + "\"}");
    }

    /// Persist an executed interaction; failures are logged, never returned.
    void record(const ResolveRequest& request, const OptimizedResponse& response,
                const RequestContext& ctx) {
        if (!pool || !config.persistInteractions) {
            return;
        }
        const auto budget = ctx.remaining() - config.persistMargin;
        if (budget <= std::chrono::milliseconds(0)) {
            SLUICE_LOG_DEBUG(LogCategory::Optimizer,
                             "deadline too close, interaction for request " +
                                 std::to_string(ctx.requestId.value()) + " not recorded");
            return;
        }
        auto recorded = pool->withTransaction([&](PooledConnection& conn) -> SluiceResult<void> {
            auto inserted = conn.execute(
                "INSERT INTO interactions (user_id, prompt, response, tier, complexity, "
                "latency_ms, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)",
                DbParams{request.userId, request.prompt, response.text,
                         std::string(toString(response.tier)),
                         std::string(toString(response.complexity)),
                         static_cast<int64_t>(response.latency.count()), epochMillis()},
                FetchMode::RowCount);
            if (!inserted) {
                return SluiceResult<void>::err(inserted.error());
            }
            return SluiceResult<void>::ok();
        }, budget);
        if (!recorded) {
            SLUICE_LOG_WARN(LogCategory::Optimizer,
                            "failed to record interaction: " + recorded.error().describe());
        }
    }
};

// ── Construction ────────────────────────────────────────────────────────────

RequestOptimizer::RequestOptimizer(RequestOptimizerConfig config,
                                   ResponseCache& cache,
                                   ModelClient& client,
                                   ConnectionPool* pool,
                                   RequestBatcher* batcher,
                                   foundation::SluiceMetrics& metrics)
    : impl_(std::make_unique<Impl>(config, cache, client, pool, batcher, metrics)) {
    // Compile the pattern tables before the first request.
    (void)templateRegexes();
    (void)complexityRegexes();
}

RequestOptimizer::~RequestOptimizer() = default;

SluiceResult<void> RequestOptimizer::initialize() {
    if (!impl_->pool) {
        return SluiceResult<void>::ok();
    }
    auto created = impl_->pool->executeTransaction({
        foundation::Statement(
            "CREATE TABLE IF NOT EXISTS interactions ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "user_id TEXT NOT NULL, "
            "prompt TEXT NOT NULL, "
            "response TEXT, "
            "tier TEXT, "
            "complexity TEXT, "
            "latency_ms INTEGER, "
            "created_at INTEGER)"),
        foundation::Statement(
            "CREATE INDEX IF NOT EXISTS idx_interactions_user ON interactions (user_id, id)"),
    });
    if (!created) {
        return SluiceResult<void>::err(created.error());
    }
    return SluiceResult<void>::ok();
}

// ── Routing primitives ──────────────────────────────────────────────────────

std::optional<TemplateMatch> RequestOptimizer::matchTemplate(std::string_view prompt) {
    const auto lowered = toLower(prompt);
    const auto& regexes = templateRegexes();
    for (std::size_t i = 0; i < kTemplates.size(); ++i) {
        if (std::regex_search(lowered, regexes[i])) {
            return TemplateMatch{kTemplates[i].name, kTemplates[i].response, kTemplates[i].confidence};
        }
    }
    return std::nullopt;
}

QueryComplexity RequestOptimizer::classify(std::string_view prompt) {
    const auto lowered = toLower(prompt);
    const auto& regexes = complexityRegexes();

    auto result = QueryComplexity::Simple;
    std::size_t bestScore = 0;
    for (std::size_t c = 0; c < kQueryComplexityCount; ++c) {
        std::size_t score = 0;
        for (const auto& re : regexes[c]) {
            if (std::regex_search(lowered, re)) {
                ++score;
            }
        }
        // >= so that later classes win ties.
        if (score > 0 && score >= bestScore) {
            bestScore = score;
            result = static_cast<QueryComplexity>(c);
        }
    }
    return result;
}

ModelTier RequestOptimizer::selectTier(QueryComplexity complexity, PriorityHint hint) {
    switch (complexity) {
        case QueryComplexity::Simple:
            return hint == PriorityHint::Quality ? ModelTier::Premium : ModelTier::FreeFast;
        case QueryComplexity::Moderate:
            return hint == PriorityHint::Quality ? ModelTier::Premium : ModelTier::Fast;
        case QueryComplexity::Complex:
        case QueryComplexity::Creative:
            return hint == PriorityHint::Speed ? ModelTier::Fast : ModelTier::Premium;
    }
    return ModelTier::Fast;
}

ModelTier RequestOptimizer::suggestedTierFor(QueryComplexity complexity) {
    switch (complexity) {
        case QueryComplexity::Simple:
            return ModelTier::FreeFast;
        case QueryComplexity::Moderate:
            return ModelTier::Fast;
        case QueryComplexity::Complex:
        case QueryComplexity::Creative:
            return ModelTier::Premium;
    }
    return ModelTier::Fast;
}

// ── resolve() ───────────────────────────────────────────────────────────────

SluiceResult<OptimizedResponse> RequestOptimizer::resolve(const ResolveRequest& request,
                                                          const RequestContext& ctx) {
    using R = SluiceResult<OptimizedResponse>;
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    {
        std::lock_guard lock(impl_->metricsMutex);
        ++impl_->counters.totalRequests;
    }

    // 1. Templates
    if (auto match = matchTemplate(request.prompt)) {
        {
            std::lock_guard lock(impl_->metricsMutex);
            ++impl_->counters.templateHits;
        }
        impl_->countRoute("template");
        SLUICE_LOG_DEBUG(LogCategory::Optimizer, "template response '" + std::string(match->name) + "'");

        OptimizedResponse response;
        response.text = std::string(match->response);
        response.fromTemplate = true;
        response.templateName = std::string(match->name);
        response.confidence = match->confidence;
        response.latency = elapsed();
        return R::ok(std::move(response));
    }

    // 2-3. Classification and tier
    OptimizedResponse response;
    response.complexity = classify(request.prompt);

    auto hint = request.priorityHint;
    if (hint == PriorityHint::Balanced) {
        auto profile = impl_->memoryProfile(request.userId);
        if (!profile.isNewUser()) {
            hint = profile.priority;
        }
    }
    response.tier = selectTier(response.complexity, hint);
    impl_->remember(request.userId, response.complexity);

    // 4. Cache
    if (auto cached = impl_->cache.getModelResponse(request.prompt, toString(response.tier),
                                                    request.context)) {
        {
            std::lock_guard lock(impl_->metricsMutex);
            ++impl_->counters.cacheHits;
            impl_->counters.timeSavedSeconds +=
                std::chrono::duration<double>(impl_->config.assumedCallLatency).count();
            impl_->counters.costSaved += tierSpec(response.tier).costPerCall;
        }
        impl_->countRoute("cache");

        response.text = std::move(*cached);
        response.cacheHit = true;
        response.confidence = 1.0;
        response.latency = elapsed();
        return R::ok(std::move(response));
    }

    if (ctx.cancelled()) {
        return R::err(SluiceError(ErrorCode::Cancelled, "request cancelled", ctx.requestId));
    }
    if (ctx.expired()) {
        return R::err(SluiceError(ErrorCode::TimedOut, "deadline passed before model call",
                                  ctx.requestId));
    }

    // 5-6. Execution
    response.batched = request.lowPriority && impl_->batcher != nullptr;
    auto generated = response.batched
                         ? impl_->batcher->submit(
                               ModelCall{request.prompt, response.tier, request.context, ctx})
                         : impl_->client.generate(request.prompt, response.tier, request.context, ctx);

    if (!generated) {
        SLUICE_LOG_WARN(LogCategory::Optimizer,
                        "model call failed on tier " + std::string(toString(response.tier)) +
                            ": " + generated.error().describe());
        return R::err(generated.error());
    }

    response.text = std::move(generated).value();
    response.confidence = 0.85;
    response.latency = elapsed();

    impl_->cache.cacheModelResponse(request.prompt, toString(response.tier), request.context,
                                    response.text);
    impl_->record(request, response, ctx);

    {
        std::lock_guard lock(impl_->metricsMutex);
        if (isFastTier(response.tier)) {
            ++impl_->counters.fastTierUses;
        }
        if (response.batched) {
            ++impl_->counters.batchOptimizations;
        }
        auto saved = std::chrono::duration<double>(impl_->config.baselineLatency - response.latency).count();
        if (saved > 0.0) {
            impl_->counters.timeSavedSeconds += saved;
        }
    }
    impl_->countRoute(response.batched ? "batch" : "model");

    SLUICE_LOG_DEBUG(LogCategory::Optimizer,
                     "executed " + std::string(toString(response.complexity)) + " prompt on " +
                         std::string(toString(response.tier)) + " in " +
                         std::to_string(response.latency.count()) + " ms");
    return R::ok(std::move(response));
}

// ── handle() ────────────────────────────────────────────────────────────────

HandlerOutcome RequestOptimizer::handle(const RequestContext& ctx, const Payload& payload) {
    auto promptIt = payload.find("prompt");
    if (promptIt == payload.end() || promptIt->second.empty()) {
        return HandlerOutcome::fatal(
            SluiceError(ErrorCode::InvalidArgument, "payload has no prompt", ctx.requestId));
    }

    ResolveRequest request;
    request.prompt = promptIt->second;
    request.userId = ctx.userId;
    request.lowPriority = ctx.priority >= RequestPriority::Low;
    if (auto it = payload.find("context"); it != payload.end()) {
        request.context = it->second;
    }
    if (auto it = payload.find("priority"); it != payload.end()) {
        request.priorityHint = parsePriorityHint(it->second).value_or(PriorityHint::Balanced);
    }

    auto resolved = resolve(request, ctx);
    if (!resolved) {
        const auto& error = resolved.error();
        return isRetryable(error.code()) ? HandlerOutcome::retryable(error)
                                         : HandlerOutcome::fatal(error);
    }
    auto response = std::move(resolved).value();
    return HandlerOutcome::ok(std::move(response.text), response.cacheHit);
}

// ── Profiles / conversation ─────────────────────────────────────────────────

UserProfile RequestOptimizer::analyzeUserPatterns(const std::string& userId) {
    if (!impl_->pool) {
        return impl_->memoryProfile(userId);
    }

    auto rows = impl_->pool->execute(
        "SELECT prompt FROM interactions WHERE user_id = ? ORDER BY id DESC LIMIT ?",
        DbParams{userId, static_cast<int64_t>(impl_->config.profileWindow)});
    if (!rows) {
        SLUICE_LOG_WARN(LogCategory::Optimizer,
                        "user pattern query failed, using in-memory history: " +
                            rows.error().describe());
        return impl_->memoryProfile(userId);
    }

    std::array<std::size_t, kQueryComplexityCount> counts{};
    for (const auto& row : rows.value().rows) {
        auto it = row.find("prompt");
        if (it == row.end()) {
            continue;
        }
        ++counts[static_cast<std::size_t>(classify(foundation::toText(it->second)))];
    }
    return buildProfile(userId, counts);
}

std::vector<ConversationMessage> RequestOptimizer::optimizeConversation(
    std::vector<ConversationMessage> messages) {
    constexpr std::size_t kThreshold = 10;
    constexpr std::size_t kHead = 2;
    constexpr std::size_t kTail = 6;

    if (messages.size() <= kThreshold) {
        return messages;
    }

    const auto omitted = messages.size() - kHead - kTail;
    std::vector<ConversationMessage> out;
    out.reserve(kHead + 1 + kTail);
    std::move(messages.begin(), messages.begin() + kHead, std::back_inserter(out));
    out.push_back(ConversationMessage{
        "system",
        "[Conversation summary: " + std::to_string(omitted) +
            " messages exchanged covering various topics]",
        true});
    std::move(messages.end() - kTail, messages.end(), std::back_inserter(out));

    SLUICE_LOG_DEBUG(LogCategory::Optimizer,
                     "compacted conversation from " + std::to_string(messages.size()) + " to " +
                         std::to_string(out.size()) + " messages");
    return out;
}

OptimizerMetrics RequestOptimizer::metrics() const {
    std::lock_guard lock(impl_->metricsMutex);
    return impl_->counters;
}

} // namespace sluice::service

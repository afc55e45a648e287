#include "sluice/foundation/config_manager.hpp"

#include "sluice/foundation/sluice_logger.hpp"

#include <array>
#include <cstdlib>

namespace sluice::foundation {

namespace {

constexpr std::array<EnvBinding, 14> kEnvBindings = {{
    {"SLUICE_CACHE_URL", "cache.url"},
    {"SLUICE_POOL_MIN_SIZE", "pool.min_size"},
    {"SLUICE_POOL_MAX_SIZE", "pool.max_size"},
    {"SLUICE_POOL_IDLE_TIMEOUT", "pool.idle_timeout_seconds"},
    {"SLUICE_POOL_CONNECTION_TIMEOUT", "pool.connection_timeout_seconds"},
    {"SLUICE_STORE_CONNECTION_STRING", "store.connection_string"},
    {"SLUICE_RATE_LIMIT_PER_MINUTE", "admission.rate_limit_per_minute"},
    {"SLUICE_RATE_LIMIT_PER_HOUR", "admission.rate_limit_per_hour"},
    {"SLUICE_BREAKER_FAILURE_THRESHOLD", "admission.breaker_failure_threshold"},
    {"SLUICE_BREAKER_RECOVERY_TIMEOUT", "admission.breaker_recovery_timeout_seconds"},
    {"SLUICE_WORKERS", "scheduler.workers"},
    {"SLUICE_MAX_QUEUE_SIZE", "scheduler.max_queue_size"},
    {"SLUICE_STATS_PORT", "stats.port"},
    {"SLUICE_LOG_LEVEL", "logging.level"},
}};

}  // namespace

std::span<const EnvBinding> defaultEnvBindings() {
    return kEnvBindings;
}

SluiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

SluiceResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return SluiceResult<void>::err(
            SluiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

SluiceResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsDefined() && !root.IsNull()) {
        flatten("", root);
    }
    return SluiceResult<void>::ok();
}

std::size_t ConfigManager::applyEnvironment(std::span<const EnvBinding> bindings) {
    std::size_t applied = 0;
    for (const auto& binding : bindings) {
        const char* value = std::getenv(std::string(binding.variable).c_str());
        if (value == nullptr) {
            continue;
        }
        set(binding.key, std::string(value));
        ++applied;
        SLUICE_LOG_DEBUG(LogCategory::Config,
                         std::string(binding.key) + " overridden by " +
                             std::string(binding.variable));
    }
    return applied;
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace sluice::foundation

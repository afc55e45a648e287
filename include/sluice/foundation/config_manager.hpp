#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with typed access, environment overrides and watches.

#include <filesystem>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "sluice/foundation/sluice_result.hpp"

namespace sluice::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Maps one environment variable onto a dotted configuration key.
struct EnvBinding {
    std::string_view variable;
    std::string_view key;
};

/// The environment variables recognized by the service, each bound to
/// the dotted key it overrides (e.g. SLUICE_POOL_MAX_SIZE -> pool.max_size).
[[nodiscard]] std::span<const EnvBinding> defaultEnvBindings();

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from file or string, dotted-key access
/// (e.g., "pool.max_size"), environment overrides, runtime set(), and
/// change callbacks.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    SluiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    SluiceResult<void> loadString(std::string_view yaml);

    /// Overlay values from the process environment.
    ///
    /// For every binding whose variable is set, the variable's text is
    /// stored under the bound key (watchers fire as for set()).
    /// @return Number of keys overridden.
    std::size_t applyEnvironment(std::span<const EnvBinding> bindings = defaultEnvBindings());

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    SluiceResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when missing or mistyped.
    template <typename T>
    [[nodiscard]] T getOr(std::string_view key, T fallback) const {
        return get<T>(key).valueOr(std::move(fallback));
    }

    /// Set a value by dotted key. Notifies any registered watchers.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    SluiceResult<void> replaceWith(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
SluiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return SluiceResult<T>::err(
            SluiceError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return SluiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return SluiceResult<T>::err(
            SluiceError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace sluice::foundation

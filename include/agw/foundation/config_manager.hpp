#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "agw/foundation/gateway_result.hpp"

namespace agw::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration with dotted-key access (e.g. "ledger.store_deadline_ms").
///
/// The YAML tree is flattened into a key-value map on load; mappings become
/// dotted prefixes and every scalar or sequence is stored as a leaf. Rule
/// lists (`tiers.standard`) and upstream lists (`upstreams`) therefore come
/// back whole through node().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    GatewayResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GatewayResult<void> loadString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GatewayResult<T> get(std::string_view key) const;

    /// Typed value by dotted key, or @p fallback when the key is absent.
    /// A present key with the wrong type is still an error.
    template <typename T>
    GatewayResult<T> getOr(std::string_view key, T fallback) const;

    /// Raw leaf node (typically a sequence) by dotted key.
    GatewayResult<YAML::Node> node(std::string_view key) const;

    /// Direct child names below @p prefix, e.g. childKeys("tiers") -> {"free", "standard"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

    /// Set a value by dotted key and notify watchers for it.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    GatewayResult<void> loadNode(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GatewayResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GatewayResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GatewayResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GatewayResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace agw::foundation

#include "agw/foundation/config_manager.hpp"

#include <set>

namespace agw::foundation {

GatewayResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GatewayResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GatewayResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return GatewayResult<void>::ok();
}

GatewayResult<YAML::Node> ConfigManager::node(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GatewayResult<YAML::Node>::err(
            GatewayError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    return GatewayResult<YAML::Node>::ok(YAML::Clone(it->second));
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::string head(prefix);
    head += '.';

    std::set<std::string> children;
    std::lock_guard lock(mutex_);
    for (const auto& [key, _] : entries_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        children.insert(rest.substr(0, rest.find('.')));
    }
    return {children.begin(), children.end()};
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
        // Scalars, sequences and nulls are leaves.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked without the lock so callbacks may read the config back.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace agw::foundation

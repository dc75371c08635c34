/// @file config_manager.cpp
/// @brief ConfigManager implementation backed by yaml-cpp.

#include "cas/foundation/config_manager.hpp"

namespace cas::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return replaceRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }
}

ServiceResult<void> ConfigManager::replaceRoot(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return ServiceResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view prefix) const {
    std::string head(prefix);
    head += '.';

    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, node] : entries_) {
        if (key.size() > head.size() && key.compare(0, head.size(), head) == 0) {
            keys.push_back(key.substr(head.size()));
        }
    }
    return keys;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
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

} // namespace cas::foundation

#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cas/foundation/service_result.hpp"

namespace cas::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// The YAML tree is flattened into dotted keys on load ("auth.access_token_ttl",
/// "geo.prefixes.10.0."). Sequences and scalars are stored as leaves.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed error.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent or mistyped.
    template <typename T>
    [[nodiscard]] T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers for that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys starting with "<prefix>.", with the prefix and dot removed.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    ServiceResult<void> replaceRoot(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError()) {
        return fallback;
    }
    return std::move(result).value();
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace cas::foundation

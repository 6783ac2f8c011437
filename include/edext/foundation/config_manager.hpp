#pragma once

/// @file config_manager.hpp
/// @brief YAML-based engine configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "edext/foundation/engine_result.hpp"

namespace edext::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration store.
///
/// The YAML tree is flattened into dotted keys ("plugins.root") on load so
/// lookups never touch yaml-cpp's reference-semantic nodes.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    EngineResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    EngineResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    EngineResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when missing or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
EngineResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EngineResult<T>::ok(it->second.as<T>());
    } catch (const YAML::Exception&) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigTypeMismatch,
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

} // namespace edext::foundation

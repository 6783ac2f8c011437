#pragma once

/// @file engine_config.hpp
/// @brief Typed engine settings resolved from a ConfigManager.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "edext/foundation/config_manager.hpp"
#include "edext/foundation/engine_logger.hpp"

namespace edext::foundation {

/// Environment variable overriding the configuration file location.
inline constexpr const char* kConfigPathEnv = "EDEXT_CONFIG_PATH";

/// Settings consumed by the registry, executor and script engines.
struct EngineConfig {
    std::filesystem::path pluginRoot;
    bool createPluginRoot = true;
    bool autoReload = false;
    uint32_t reloadDebounceMs = 200;

    std::string shell = "/bin/sh";
    std::size_t outputLimitBytes = 4 * 1024 * 1024;

    std::string dateFormat = "%Y-%m-%d";
    std::string timeFormat = "%H:%M:%S";
    std::string untitledPlaceholder = "untitled";

    bool luaEnabled = true;
    bool pythonEnabled = true;

    LogLevel logLevel = LogLevel::Info;

    /// Build settings from @p config; missing keys keep their defaults.
    static EngineConfig FromConfig(const ConfigManager& config);
};

/// Default plugin root: $XDG_CONFIG_HOME/edext/plugins, else
/// ~/.config/edext/plugins, else ./plugins.
[[nodiscard]] std::filesystem::path defaultPluginRoot();

/// Resolve the configuration file: @p cliPath > EDEXT_CONFIG_PATH > @p fallback.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath,
                                                      const std::filesystem::path& fallback);

} // namespace edext::foundation

#include "edext/foundation/engine_config.hpp"

#include <cstdlib>

namespace edext::foundation {

namespace fs = std::filesystem;

fs::path defaultPluginRoot() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "edext" / "plugins";
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return fs::path(home) / ".config" / "edext" / "plugins";
    }
    return fs::path("plugins");
}

fs::path resolveConfigPath(const fs::path& cliPath, const fs::path& fallback) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        return fs::path(envPath);
    }
    return fallback;
}

EngineConfig EngineConfig::FromConfig(const ConfigManager& config) {
    EngineConfig cfg;

    auto root = config.get<std::string>("plugins.root");
    if (root && !root.value().empty()) {
        cfg.pluginRoot = std::move(root).value();
    } else {
        cfg.pluginRoot = defaultPluginRoot();
    }

    cfg.createPluginRoot = config.getOr<bool>("plugins.create_root", cfg.createPluginRoot);
    cfg.autoReload = config.getOr<bool>("plugins.auto_reload", cfg.autoReload);
    cfg.reloadDebounceMs = config.getOr<uint32_t>("plugins.reload_debounce_ms",
                                                  cfg.reloadDebounceMs);

    cfg.shell = config.getOr<std::string>("actions.shell", cfg.shell);
    cfg.outputLimitBytes = config.getOr<std::size_t>("actions.output_limit_bytes",
                                                     cfg.outputLimitBytes);

    cfg.dateFormat = config.getOr<std::string>("snippet.date_format", cfg.dateFormat);
    cfg.timeFormat = config.getOr<std::string>("snippet.time_format", cfg.timeFormat);
    cfg.untitledPlaceholder = config.getOr<std::string>("snippet.untitled",
                                                        cfg.untitledPlaceholder);

    cfg.luaEnabled = config.getOr<bool>("scripts.lua.enabled", cfg.luaEnabled);
    cfg.pythonEnabled = config.getOr<bool>("scripts.python.enabled", cfg.pythonEnabled);

    auto level = config.get<std::string>("logging.level");
    if (level) {
        if (auto parsed = parseLogLevel(level.value())) {
            cfg.logLevel = *parsed;
        }
    }

    return cfg;
}

} // namespace edext::foundation

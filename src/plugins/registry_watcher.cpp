/// @file registry_watcher.cpp
/// @brief Automatic registry reload driven by FileWatcher polling.

#include "edext/plugin/registry_watcher.hpp"

#include "edext/foundation/engine_logger.hpp"
#include "edext/plugin/plugin_loader.hpp"

namespace fs = std::filesystem;

using edext::foundation::LogCategory;

namespace edext::plugin {

RegistryWatcher::RegistryWatcher(PluginRegistry& registry) : registry_(registry) {}

void RegistryWatcher::SetDebounceMs(uint32_t ms) {
    watcher_.SetDebounceMs(ms);
}

void RegistryWatcher::SetReloadCallback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void RegistryWatcher::SetReloadFailedCallback(ReloadFailedCallback callback) {
    failedCallback_ = std::move(callback);
}

void RegistryWatcher::Rearm() {
    watcher_.UnwatchAll();

    const auto& root = registry_.Root();
    if (!watcher_.Watch(root)) {
        return;
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        std::error_code typeEc;
        if (!entry.is_directory(typeEc)) {
            continue;
        }
        watcher_.Watch(entry.path());
        if (auto definition = findDefinitionFile(entry.path())) {
            watcher_.Watch(*definition);
        }
    }

    auto snapshot = registry_.Snapshot();
    for (const auto& plugin : snapshot->plugins()) {
        for (const auto& [id, action] : plugin->actions) {
            if (const auto* script = std::get_if<ScriptAction>(&action.spec);
                script != nullptr && script->file) {
                watcher_.Watch(plugin->directory / *script->file);
            }
        }
    }

    EDEXT_LOG_DEBUG(LogCategory::Registry,
                    "watching " + std::to_string(watcher_.WatchCount()) + " path(s) under " +
                        root.string());
}

bool RegistryWatcher::Poll() {
    auto changed = watcher_.Poll();
    if (changed.empty()) {
        return false;
    }

    EDEXT_LOG_INFO(LogCategory::Registry,
                   "change detected in " + changed.front().string() + ", reloading plugins");

    auto reloaded = registry_.Reload();
    Rearm();
    if (!reloaded) {
        if (failedCallback_) {
            failedCallback_(reloaded.error());
        }
        return false;
    }

    ++reloadCount_;
    if (callback_) {
        callback_(reloaded.value());
    }
    return true;
}

} // namespace edext::plugin

#pragma once

/// @file registry_watcher.hpp
/// @brief RegistryWatcher: reloads a PluginRegistry when its tree changes.

#include <cstdint>
#include <functional>

#include "edext/plugin/file_watcher.hpp"
#include "edext/plugin/plugin_registry.hpp"

namespace edext::plugin {

/// Invoked after a successful automatic reload with the new snapshot.
using ReloadCallback = std::function<void(const SnapshotPtr& snapshot)>;

/// Invoked when an automatic reload fails; the previous snapshot stays.
using ReloadFailedCallback = std::function<void(const foundation::EngineError& error)>;

/// Polls a plugin root and reloads the registry when it changes.
///
/// Watched paths: the root directory, every plugin subdirectory, every
/// definition file and every script file referenced by a loaded plugin.
/// The watch set is rebuilt after each reload. Poll() is meant to be called
/// from the host's event loop; reloads therefore happen between action
/// invocations, never during one.
class RegistryWatcher {
public:
    explicit RegistryWatcher(PluginRegistry& registry);

    RegistryWatcher(const RegistryWatcher&) = delete;
    RegistryWatcher& operator=(const RegistryWatcher&) = delete;

    void SetDebounceMs(uint32_t ms);

    void SetReloadCallback(ReloadCallback callback);

    void SetReloadFailedCallback(ReloadFailedCallback callback);

    /// Rebuild the watch set from the registry's current snapshot.
    void Rearm();

    /// Poll for changes; reload when something settled.
    /// @return true when a reload was performed and succeeded.
    bool Poll();

    [[nodiscard]] uint64_t ReloadCount() const noexcept { return reloadCount_; }

    [[nodiscard]] std::size_t WatchedPathCount() const { return watcher_.WatchCount(); }

private:
    PluginRegistry& registry_;
    FileWatcher watcher_;
    ReloadCallback callback_;
    ReloadFailedCallback failedCallback_;
    uint64_t reloadCount_ = 0;
};

} // namespace edext::plugin

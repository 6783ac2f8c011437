#pragma once

/// @file plugin_registry.hpp
/// @brief PluginRegistry: discovery, per-plugin validation and atomic reload.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/plugin_types.hpp"

namespace edext::plugin {

/// A plugin directory that was skipped during discovery.
struct PluginLoadError {
    std::filesystem::path directory;
    foundation::EngineError error;
};

/// Immutable result of one discovery pass.
///
/// Plugins are held in load order (plugin subdirectories sorted by name).
/// Snapshots are shared via std::shared_ptr<const RegistrySnapshot>; a
/// reload publishes a new snapshot and never mutates an existing one.
class RegistrySnapshot {
public:
    RegistrySnapshot(std::filesystem::path root,
                     uint64_t generation,
                     std::vector<std::shared_ptr<const Plugin>> plugins,
                     std::vector<PluginLoadError> errors);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// Monotonic counter; 1 for the first load, +1 per reload.
    [[nodiscard]] uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] const std::vector<std::shared_ptr<const Plugin>>& plugins() const noexcept {
        return plugins_;
    }

    /// Per-plugin failures recorded during discovery.
    [[nodiscard]] const std::vector<PluginLoadError>& errors() const noexcept { return errors_; }

    /// Look up a plugin by name (nullptr if absent).
    [[nodiscard]] std::shared_ptr<const Plugin> FindPlugin(std::string_view name) const;

    [[nodiscard]] std::size_t PluginCount() const noexcept { return plugins_.size(); }

    /// Same plugins (by value, in the same order) and the same failing
    /// directories with the same error codes. Generation is ignored.
    [[nodiscard]] bool EquivalentTo(const RegistrySnapshot& other) const;

private:
    std::filesystem::path root_;
    uint64_t generation_ = 0;
    std::vector<std::shared_ptr<const Plugin>> plugins_;
    std::vector<PluginLoadError> errors_;
};

using SnapshotPtr = std::shared_ptr<const RegistrySnapshot>;

/// Owns the current registry snapshot for a plugin root directory.
///
/// Discovery scans the immediate subdirectories of the root. Each
/// subdirectory with a definition file is one candidate plugin; candidates
/// are parsed and validated independently, so one malformed plugin is
/// recorded in the snapshot's error list without affecting its siblings.
///
/// Usage:
/// @code
///   PluginRegistry registry(root);
///   if (auto loaded = registry.Reload(); !loaded) { ... DiscoveryError ... }
///   auto snapshot = registry.Snapshot();   // hold for the whole invocation
/// @endcode
class PluginRegistry {
public:
    explicit PluginRegistry(std::filesystem::path root);

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /// Run one discovery pass over @p root without publishing it anywhere.
    ///
    /// @return DiscoveryError (PluginRootNotFound / PluginRootUnreadable) when
    ///         the root cannot be listed; otherwise a snapshot, possibly with
    ///         per-plugin errors.
    [[nodiscard]] static foundation::EngineResult<SnapshotPtr>
    Load(const std::filesystem::path& root, uint64_t generation = 1);

    /// Re-run discovery and atomically replace the current snapshot.
    ///
    /// On DiscoveryError the current snapshot is kept. Callers holding the
    /// previous snapshot keep using it unaffected.
    [[nodiscard]] foundation::EngineResult<SnapshotPtr> Reload();

    /// Current snapshot; an empty generation-0 snapshot before the first load.
    [[nodiscard]] SnapshotPtr Snapshot() const;

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    SnapshotPtr current_;
};

} // namespace edext::plugin

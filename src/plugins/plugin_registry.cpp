/// @file plugin_registry.cpp
/// @brief Plugin discovery and snapshot publication.

#include "edext/plugin/plugin_registry.hpp"

#include "edext/foundation/engine_logger.hpp"
#include "edext/plugin/plugin_loader.hpp"

#include <algorithm>
#include <unordered_set>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;
using edext::foundation::LogContext;
using edext::foundation::LogLevel;

namespace fs = std::filesystem;

namespace edext::plugin {

// ── RegistrySnapshot ────────────────────────────────────────────────────

RegistrySnapshot::RegistrySnapshot(fs::path root,
                                   uint64_t generation,
                                   std::vector<std::shared_ptr<const Plugin>> plugins,
                                   std::vector<PluginLoadError> errors)
    : root_(std::move(root)),
      generation_(generation),
      plugins_(std::move(plugins)),
      errors_(std::move(errors)) {}

std::shared_ptr<const Plugin> RegistrySnapshot::FindPlugin(std::string_view name) const {
    auto it = std::find_if(plugins_.begin(), plugins_.end(),
                           [&](const auto& p) { return p->name() == name; });
    return it != plugins_.end() ? *it : nullptr;
}

bool RegistrySnapshot::EquivalentTo(const RegistrySnapshot& other) const {
    if (root_ != other.root_ || plugins_.size() != other.plugins_.size() ||
        errors_.size() != other.errors_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < plugins_.size(); ++i) {
        if (!(*plugins_[i] == *other.plugins_[i])) {
            return false;
        }
    }
    for (std::size_t i = 0; i < errors_.size(); ++i) {
        if (errors_[i].directory != other.errors_[i].directory ||
            errors_[i].error.code() != other.errors_[i].error.code()) {
            return false;
        }
    }
    return true;
}

// ── PluginRegistry ──────────────────────────────────────────────────────

PluginRegistry::PluginRegistry(fs::path root)
    : root_(std::move(root)),
      current_(std::make_shared<const RegistrySnapshot>(
          root_, 0, std::vector<std::shared_ptr<const Plugin>>{}, std::vector<PluginLoadError>{})) {}

EngineResult<SnapshotPtr> PluginRegistry::Load(const fs::path& root, uint64_t generation) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return EngineResult<SnapshotPtr>::err(
            EngineError(ErrorCode::PluginRootNotFound, "plugin root not found: " + root.string()));
    }
    if (!fs::is_directory(root, ec)) {
        return EngineResult<SnapshotPtr>::err(EngineError(
            ErrorCode::PluginRootUnreadable, "plugin root is not a directory: " + root.string()));
    }

    // Collect candidate directories first so load order is by name.
    std::vector<fs::path> candidates;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return EngineResult<SnapshotPtr>::err(EngineError(
            ErrorCode::PluginRootUnreadable,
            "cannot read plugin root " + root.string() + ": " + ec.message()));
    }
    for (const auto& entry : it) {
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            candidates.push_back(entry.path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<std::shared_ptr<const Plugin>> plugins;
    std::vector<PluginLoadError> errors;
    std::unordered_set<std::string> names;

    for (const auto& dir : candidates) {
        if (!findDefinitionFile(dir)) {
            continue;
        }

        auto loaded = loadPluginDirectory(dir);
        if (loaded && !names.insert(loaded.value().name()).second) {
            loaded = EngineResult<Plugin>::err(EngineError(
                ErrorCode::ValidationFailed,
                "duplicate plugin name '" + loaded.value().name() + "'"));
        }

        if (!loaded) {
            LogContext ctx;
            ctx.extra["directory"] = dir.string();
            foundation::EngineLogger::instance().logWithContext(
                LogLevel::Warning, LogCategory::Registry,
                "plugin rejected: " + std::string(loaded.error().message()), ctx);
            errors.push_back({dir, loaded.error()});
            continue;
        }

        plugins.push_back(std::make_shared<const Plugin>(std::move(loaded).value()));
    }

    EDEXT_LOG_INFO(LogCategory::Registry,
                   "discovered " + std::to_string(plugins.size()) + " plugin(s), " +
                       std::to_string(errors.size()) + " rejected in " + root.string());

    return EngineResult<SnapshotPtr>::ok(std::make_shared<const RegistrySnapshot>(
        root, generation, std::move(plugins), std::move(errors)));
}

EngineResult<SnapshotPtr> PluginRegistry::Reload() {
    uint64_t next = 0;
    {
        std::lock_guard lock(mutex_);
        next = current_->generation() + 1;
    }

    auto loaded = Load(root_, next);
    if (!loaded) {
        EDEXT_LOG_ERROR(LogCategory::Registry,
                        "reload failed: " + std::string(loaded.error().message()));
        return loaded;
    }

    std::lock_guard lock(mutex_);
    current_ = loaded.value();
    return loaded;
}

SnapshotPtr PluginRegistry::Snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
}

} // namespace edext::plugin

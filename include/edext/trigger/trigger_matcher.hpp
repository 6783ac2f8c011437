#pragma once

/// @file trigger_matcher.hpp
/// @brief TriggerMatcher: selects registered triggers for a runtime event.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "edext/bridge/execution_context.hpp"
#include "edext/plugin/plugin_registry.hpp"

namespace edext::trigger {

/// A trigger selected for an event, with the plugin that owns it.
///
/// Holding the plugin's shared_ptr keeps it alive even if the registry is
/// reloaded while the match is being executed.
struct TriggerMatch {
    std::shared_ptr<const plugin::Plugin> plugin;
    const plugin::Trigger* trigger = nullptr;
};

/// A manual trigger as offered to the host's menu or key map.
struct CommandEntry {
    std::string pluginName;
    std::string triggerId;
    std::string label;
    std::string shortcut;
    plugin::TriggerKind kind = plugin::TriggerKind::Command;
};

/// Stateless matching over one registry snapshot.
///
/// Order is deterministic: plugins in registry load order, triggers in
/// declaration order within each plugin.
class TriggerMatcher {
public:
    explicit TriggerMatcher(plugin::SnapshotPtr snapshot);

    /// Triggers of @p kind whose context filter matches @p ctx.
    [[nodiscard]] std::vector<TriggerMatch>
    TriggersFor(plugin::TriggerKind kind, const bridge::ExecutionContext& ctx) const;

    /// All Command and Shortcut triggers, unfiltered. Triggers sharing a
    /// label across plugins are returned as separate entries.
    [[nodiscard]] std::vector<CommandEntry> Commands() const;

    /// Manual triggers whose context filter matches @p ctx.
    [[nodiscard]] std::vector<CommandEntry> CommandsFor(const bridge::ExecutionContext& ctx) const;

    /// Resolve a trigger by plugin name and trigger id.
    /// @return The match, or a match with a null trigger when not found.
    [[nodiscard]] TriggerMatch Find(std::string_view pluginName, std::string_view triggerId) const;

    [[nodiscard]] const plugin::SnapshotPtr& snapshot() const noexcept { return snapshot_; }

private:
    plugin::SnapshotPtr snapshot_;
};

} // namespace edext::trigger

#pragma once

/// @file plugin_host.hpp
/// @brief PluginHost: the facade an editor embeds to run plugins.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "edext/action/action_executor.hpp"
#include "edext/bridge/capability_bridge.hpp"
#include "edext/foundation/engine_config.hpp"
#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/plugin_registry.hpp"
#include "edext/plugin/registry_watcher.hpp"
#include "edext/script/script_engine_registry.hpp"
#include "edext/trigger/trigger_matcher.hpp"

namespace edext::host {

/// Result of one trigger fired by an editor event.
struct TriggerOutcome {
    std::string pluginName;
    std::string triggerId;
    std::string actionId;
    foundation::EngineResult<void> result;
};

/// Wires registry, matcher, executor and script engines to one bridge.
///
/// Failures never escape as exceptions and never abort sibling triggers:
/// each failed invocation is logged and reported to the user through
/// ICapabilityBridge::Notify, naming the plugin and action.
///
/// Usage:
/// @code
///   PluginHost host(config, bridge);
///   if (auto started = host.Start(); !started) { ... }
///   for (const auto& cmd : host.Commands()) { ... add menu entry ... }
///   (void)host.ExecuteTrigger("formatter", "format");
///   host.OnFileSaved();
/// @endcode
class PluginHost {
public:
    PluginHost(foundation::EngineConfig config, bridge::ICapabilityBridge& bridge);

    /// Use a caller-supplied engine set (tests, embedders with own engines).
    PluginHost(foundation::EngineConfig config, bridge::ICapabilityBridge& bridge,
               script::ScriptEngineRegistry engines);

    ~PluginHost();

    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    /// Create the plugin root if configured, run the first discovery and arm
    /// the watcher when plugins.auto_reload is set.
    /// @return DiscoveryError when the root is missing or unreadable.
    [[nodiscard]] foundation::EngineResult<plugin::SnapshotPtr> Start();

    /// Re-run discovery; the previous snapshot stays active on failure.
    [[nodiscard]] foundation::EngineResult<plugin::SnapshotPtr> Reload();

    /// Check the plugin tree for changes (auto reload only).
    /// @return true when a reload happened.
    bool Poll();

    /// Manual triggers of every loaded plugin, in load order.
    [[nodiscard]] std::vector<trigger::CommandEntry> Commands() const;

    /// Manual triggers whose context filter matches the current editor state.
    [[nodiscard]] foundation::EngineResult<std::vector<trigger::CommandEntry>>
    CommandsForCurrentFile() const;

    /// Run a command or shortcut trigger chosen by the user.
    ///
    /// @return TriggerNotFound for unknown names or event triggers,
    ///         otherwise the action's result (already notified on failure).
    foundation::EngineResult<void> ExecuteTrigger(std::string_view pluginName,
                                                  std::string_view triggerId);

    /// Fire all matching on_save triggers, continuing past failures.
    std::vector<TriggerOutcome> OnFileSaved();

    /// Fire all matching on_open triggers, continuing past failures.
    std::vector<TriggerOutcome> OnFileOpened();

    [[nodiscard]] plugin::SnapshotPtr Snapshot() const { return registry_.Snapshot(); }

    [[nodiscard]] const foundation::EngineConfig& config() const noexcept { return config_; }

    [[nodiscard]] script::ScriptEngineRegistry& engines() noexcept { return engines_; }

private:
    std::vector<TriggerOutcome> fireEvent(plugin::TriggerKind kind);

    foundation::EngineResult<void> invoke(const trigger::TriggerMatch& match,
                                          const bridge::ExecutionContext& ctx);

    void reportFailure(const plugin::Plugin& owner, const plugin::Trigger& trig,
                       const foundation::EngineError& error);

    /// Notify the rejected plugins of a load, or the load failure itself.
    void reportLoad(const foundation::EngineResult<plugin::SnapshotPtr>& loaded);

    void notify(const std::string& title, const std::string& message);

    foundation::EngineConfig config_;
    bridge::ICapabilityBridge& bridge_;
    script::ScriptEngineRegistry engines_;
    plugin::PluginRegistry registry_;
    action::ActionExecutor executor_;
    std::unique_ptr<plugin::RegistryWatcher> watcher_;
};

} // namespace edext::host

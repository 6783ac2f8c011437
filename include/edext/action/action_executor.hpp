#pragma once

/// @file action_executor.hpp
/// @brief ActionExecutor: runs one action of a plugin against a live bridge.

#include <string_view>

#include "edext/bridge/capability_bridge.hpp"
#include "edext/bridge/execution_context.hpp"
#include "edext/foundation/engine_config.hpp"
#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/plugin_types.hpp"
#include "edext/script/script_engine_registry.hpp"

namespace edext::action {

/// Dispatches on the closed action variant.
///
/// Buffer contents are always read live from the bridge, so each chain
/// member sees the edits of the members before it. The ExecutionContext
/// supplies the file path and language used for token expansion and the
/// external command's working directory.
///
/// A failing action leaves earlier edits in place; there is no rollback.
class ActionExecutor {
public:
    ActionExecutor(bridge::ICapabilityBridge& bridge,
                   script::ScriptEngineRegistry& engines,
                   foundation::EngineConfig config);

    /// Execute @p actionId of @p plugin.
    ///
    /// @return ActionNotFound for an unknown id, ChainAborted naming the
    ///         failing member for chains, otherwise the action's own error.
    [[nodiscard]] foundation::EngineResult<void>
    Execute(const plugin::Plugin& plugin, std::string_view actionId,
            const bridge::ExecutionContext& ctx);

    [[nodiscard]] const foundation::EngineConfig& config() const noexcept { return config_; }

private:
    foundation::EngineResult<void> run(const plugin::Plugin& plugin, const plugin::Action& action,
                                       const bridge::ExecutionContext& ctx);

    foundation::EngineResult<void> runExternalCommand(const plugin::Plugin& plugin,
                                                      const plugin::ExternalCommandAction& spec,
                                                      const bridge::ExecutionContext& ctx);
    foundation::EngineResult<void> runSnippet(const plugin::SnippetAction& spec,
                                              const bridge::ExecutionContext& ctx);
    foundation::EngineResult<void> runTransform(const plugin::TransformAction& spec);
    foundation::EngineResult<void> runNotify(const plugin::NotifyAction& spec);
    foundation::EngineResult<void> runChain(const plugin::Plugin& plugin, const plugin::Action& chain,
                                            const plugin::ChainAction& spec,
                                            const bridge::ExecutionContext& ctx);
    foundation::EngineResult<void> runScript(const plugin::Plugin& plugin, const plugin::Action& action,
                                             const plugin::ScriptAction& spec);

    bridge::ICapabilityBridge& bridge_;
    script::ScriptEngineRegistry& engines_;
    foundation::EngineConfig config_;
};

/// Canonical path of @p relative inside @p directory.
///
/// @return ScriptLoadFailed if the file cannot be resolved, ScriptPathRejected
///         if the canonical path (after symlinks) lies outside @p directory.
[[nodiscard]] foundation::EngineResult<std::filesystem::path>
resolveContainedPath(const std::filesystem::path& directory, const std::filesystem::path& relative);

} // namespace edext::action

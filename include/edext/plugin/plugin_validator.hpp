#pragma once

/// @file plugin_validator.hpp
/// @brief Cross-reference validation of a parsed Plugin.

#include <string>
#include <vector>

#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/plugin_types.hpp"

namespace edext::plugin {

/// Check the invariants that span triggers and actions:
///   - trigger ids are unique within the plugin,
///   - every trigger's action id resolves,
///   - every chain member resolves within the same plugin,
///   - no chain reaches itself through its member closure,
///   - script files are relative paths that stay inside the plugin directory.
///
/// The first violation is returned; a plugin is accepted only as a whole.
[[nodiscard]] foundation::EngineResult<void> validatePlugin(const Plugin& plugin);

/// Find a cycle among chain actions.
///
/// Depth-first over chain members, keeping the current resolution path;
/// revisiting an id already on the path is a cycle.
///
/// @return The cycle as an id path closed on its first element
///         (e.g. {"a", "b", "a"}), or an empty vector when acyclic.
[[nodiscard]] std::vector<std::string> findChainCycle(const Plugin& plugin);

/// True when @p relative is a relative path whose lexical normal form does
/// not climb out of its base directory.
[[nodiscard]] bool isContainedRelativePath(const std::filesystem::path& relative);

} // namespace edext::plugin

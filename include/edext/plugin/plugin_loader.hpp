#pragma once

/// @file plugin_loader.hpp
/// @brief Definition-file discovery and parsing for a single plugin directory.

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/plugin_types.hpp"

namespace edext::plugin {

/// Definition file names probed in each plugin directory, in order.
/// JSON is a subset of YAML, so plugin.json files parse with the same reader.
inline constexpr std::array<std::string_view, 3> kDefinitionFileNames = {
    "plugin.yaml", "plugin.yml", "plugin.json"};

/// Return the first definition file present in @p directory, if any.
[[nodiscard]] std::optional<std::filesystem::path>
findDefinitionFile(const std::filesystem::path& directory);

/// Parse a definition document into a Plugin rooted at @p directory.
///
/// Performs the structural checks: required fields present and correctly
/// typed, trigger kinds and action tags drawn from the closed sets, mode and
/// operation names known. Cross-reference checks live in validatePlugin().
///
/// @return The plugin, or a Validation-class error naming the offending
///         trigger/action and field.
[[nodiscard]] foundation::EngineResult<Plugin>
parsePluginDefinition(std::string_view document, const std::filesystem::path& directory);

/// Read the definition file found in @p directory, parse and fully validate
/// it (parsePluginDefinition + validatePlugin).
///
/// @return DefinitionUnreadable when no definition can be read, otherwise the
///         result of parsing and validation.
[[nodiscard]] foundation::EngineResult<Plugin>
loadPluginDirectory(const std::filesystem::path& directory);

} // namespace edext::plugin

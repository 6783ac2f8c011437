#pragma once

/// @file plugin_types.hpp
/// @brief Core plugin model: PluginInfo, Trigger, ContextFilter, Plugin.

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "edext/bridge/execution_context.hpp"
#include "edext/plugin/action_types.hpp"

namespace edext::plugin {

/// When a trigger fires.
enum class TriggerKind : uint8_t {
    Command,   ///< "command": menu entry, optional shortcut
    Shortcut,  ///< "shortcut": key binding only
    OnSave,    ///< "on_save": after the buffer is written
    OnOpen     ///< "on_open": after a file is opened
};

[[nodiscard]] std::string_view triggerKindName(TriggerKind kind) noexcept;
[[nodiscard]] std::optional<TriggerKind> parseTriggerKind(std::string_view name) noexcept;

/// True for kinds offered to the user through menus or key bindings.
[[nodiscard]] constexpr bool isManualKind(TriggerKind kind) noexcept {
    return kind == TriggerKind::Command || kind == TriggerKind::Shortcut;
}

/// Language / file-name predicate gating a trigger.
///
/// Matches when (no languages OR language is listed) AND (no patterns OR
/// the file name matches at least one glob). An empty list counts as
/// absent. Unsaved buffers never match a non-empty pattern list.
struct ContextFilter {
    std::vector<std::string> languages;
    std::vector<std::string> filePatterns;

    [[nodiscard]] bool Matches(const bridge::ExecutionContext& ctx) const;

    bool operator==(const ContextFilter&) const = default;
};

/// Shell-style glob match ("*.py", "test_?.cpp", "[Mm]akefile").
/// Patterns containing '/' are matched against the full path, others
/// against the file name only.
[[nodiscard]] bool matchesFilePattern(std::string_view pattern,
                                      const std::filesystem::path& path);

struct Trigger {
    std::string id;
    TriggerKind kind = TriggerKind::Command;
    std::string actionId;
    std::string commandName;  ///< Menu label (Command/Shortcut kinds).
    std::string shortcut;     ///< Key combination, e.g. "Ctrl+Shift+U".
    std::optional<ContextFilter> context;

    /// True when there is no filter or the filter matches.
    [[nodiscard]] bool Matches(const bridge::ExecutionContext& ctx) const {
        return !context || context->Matches(ctx);
    }

    /// Menu label: commandName, falling back to the trigger id.
    [[nodiscard]] const std::string& label() const noexcept {
        return commandName.empty() ? id : commandName;
    }

    bool operator==(const Trigger&) const = default;
};

/// Identity metadata from the definition file.
struct PluginInfo {
    std::string name;
    std::string version;
    std::string description;
    std::string author;

    bool operator==(const PluginInfo&) const = default;
};

/// A validated plugin. Immutable once published in a RegistrySnapshot.
struct Plugin {
    PluginInfo info;
    std::filesystem::path directory;
    std::vector<Trigger> triggers;
    std::map<std::string, Action> actions;

    [[nodiscard]] const std::string& name() const noexcept { return info.name; }

    /// nullptr when no such action.
    [[nodiscard]] const Action* FindAction(std::string_view id) const;

    /// nullptr when no such trigger.
    [[nodiscard]] const Trigger* FindTrigger(std::string_view id) const;

    bool operator==(const Plugin&) const = default;
};

} // namespace edext::plugin

/// @file plugin_types.cpp
/// @brief Name tables and context matching for the plugin model.

#include "edext/plugin/plugin_types.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fnmatch.h>

namespace edext::plugin {

namespace {

/// Linear lookup in a small (enum, name) table.
template <typename Enum, std::size_t N>
std::string_view nameOf(const std::array<std::pair<Enum, std::string_view>, N>& table,
                        Enum value) noexcept {
    for (const auto& [e, name] : table) {
        if (e == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> parseName(const std::array<std::pair<Enum, std::string_view>, N>& table,
                              std::string_view name) noexcept {
    for (const auto& [e, entry] : table) {
        if (entry == name) {
            return e;
        }
    }
    return std::nullopt;
}

constexpr std::array<std::pair<TriggerKind, std::string_view>, 4> kTriggerKinds = {{
    {TriggerKind::Command, "command"},
    {TriggerKind::Shortcut, "shortcut"},
    {TriggerKind::OnSave, "on_save"},
    {TriggerKind::OnOpen, "on_open"},
}};

constexpr std::array<std::pair<InputMode, std::string_view>, 3> kInputModes = {{
    {InputMode::None, "none"},
    {InputMode::WholeFile, "whole_file"},
    {InputMode::Selection, "selection"},
}};

constexpr std::array<std::pair<OutputMode, std::string_view>, 5> kOutputModes = {{
    {OutputMode::ReplaceFile, "replace_file"},
    {OutputMode::ReplaceSelection, "replace_selection"},
    {OutputMode::Insert, "insert"},
    {OutputMode::Discard, "discard"},
    {OutputMode::Notify, "notify"},
}};

constexpr std::array<std::pair<TransformOp, std::string_view>, 11> kTransformOps = {{
    {TransformOp::Uppercase, "uppercase"},
    {TransformOp::Lowercase, "lowercase"},
    {TransformOp::TitleCase, "title_case"},
    {TransformOp::SwapCase, "swap_case"},
    {TransformOp::Reverse, "reverse"},
    {TransformOp::Trim, "trim"},
    {TransformOp::TrimLines, "trim_lines"},
    {TransformOp::SortLines, "sort_lines"},
    {TransformOp::ReverseLines, "reverse_lines"},
    {TransformOp::UniqueLines, "unique_lines"},
    {TransformOp::RemoveEmptyLines, "remove_empty_lines"},
}};

constexpr std::array<std::pair<ScriptEngineKind, std::string_view>, 2> kScriptEngines = {{
    {ScriptEngineKind::Lua, "lua"},
    {ScriptEngineKind::Python, "python"},
}};

} // namespace

// ── Enum names ──────────────────────────────────────────────────────────

std::string_view triggerKindName(TriggerKind kind) noexcept {
    return nameOf(kTriggerKinds, kind);
}

std::optional<TriggerKind> parseTriggerKind(std::string_view name) noexcept {
    return parseName(kTriggerKinds, name);
}

std::string_view inputModeName(InputMode mode) noexcept {
    return nameOf(kInputModes, mode);
}

std::optional<InputMode> parseInputMode(std::string_view name) noexcept {
    return parseName(kInputModes, name);
}

std::string_view outputModeName(OutputMode mode) noexcept {
    return nameOf(kOutputModes, mode);
}

std::optional<OutputMode> parseOutputMode(std::string_view name) noexcept {
    return parseName(kOutputModes, name);
}

std::string_view transformOpName(TransformOp op) noexcept {
    return nameOf(kTransformOps, op);
}

std::optional<TransformOp> parseTransformOp(std::string_view name) noexcept {
    return parseName(kTransformOps, name);
}

std::string_view scriptEngineName(ScriptEngineKind kind) noexcept {
    return nameOf(kScriptEngines, kind);
}

std::optional<ScriptEngineKind> parseScriptEngine(std::string_view name) noexcept {
    return parseName(kScriptEngines, name);
}

std::string_view Action::typeName() const noexcept {
    struct Visitor {
        std::string_view operator()(const ExternalCommandAction&) const { return "external_command"; }
        std::string_view operator()(const SnippetAction&) const { return "snippet"; }
        std::string_view operator()(const TransformAction&) const { return "transform"; }
        std::string_view operator()(const NotifyAction&) const { return "notify"; }
        std::string_view operator()(const ChainAction&) const { return "chain"; }
        std::string_view operator()(const ScriptAction&) const { return "script"; }
    };
    return std::visit(Visitor{}, spec);
}

// ── Context matching ────────────────────────────────────────────────────

bool matchesFilePattern(std::string_view pattern, const std::filesystem::path& path) {
    std::string pat(pattern);
    if (pat.find('/') != std::string::npos) {
        return ::fnmatch(pat.c_str(), path.generic_string().c_str(), FNM_PATHNAME) == 0;
    }
    return ::fnmatch(pat.c_str(), path.filename().string().c_str(), 0) == 0;
}

bool ContextFilter::Matches(const bridge::ExecutionContext& ctx) const {
    if (!languages.empty() &&
        std::find(languages.begin(), languages.end(), ctx.language) == languages.end()) {
        return false;
    }

    if (filePatterns.empty()) {
        return true;
    }
    if (!ctx.filePath) {
        return false;
    }
    return std::any_of(filePatterns.begin(), filePatterns.end(),
                       [&](const std::string& p) { return matchesFilePattern(p, *ctx.filePath); });
}

// ── Plugin lookups ──────────────────────────────────────────────────────

const Action* Plugin::FindAction(std::string_view id) const {
    auto it = actions.find(std::string(id));
    return it != actions.end() ? &it->second : nullptr;
}

const Trigger* Plugin::FindTrigger(std::string_view id) const {
    auto it = std::find_if(triggers.begin(), triggers.end(),
                           [&](const Trigger& t) { return t.id == id; });
    return it != triggers.end() ? &*it : nullptr;
}

} // namespace edext::plugin

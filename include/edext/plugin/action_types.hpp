#pragma once

/// @file action_types.hpp
/// @brief Closed set of action variants a plugin may declare.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace edext::plugin {

/// Text fed to an external command's standard input.
enum class InputMode : uint8_t {
    None,       ///< stdin is closed immediately
    WholeFile,  ///< entire buffer
    Selection   ///< selected text (must be non-empty)
};

/// What happens to an external command's captured standard output.
enum class OutputMode : uint8_t {
    ReplaceFile,       ///< replace the whole buffer
    ReplaceSelection,  ///< replace the selection (inserts at cursor if empty)
    Insert,            ///< insert at the cursor
    Discard,           ///< ignore
    Notify             ///< show as a notification
};

/// Pure text operations available to `transform` actions.
enum class TransformOp : uint8_t {
    Uppercase,
    Lowercase,
    TitleCase,
    SwapCase,
    Reverse,
    Trim,
    TrimLines,
    SortLines,
    ReverseLines,
    UniqueLines,
    RemoveEmptyLines
};

/// Embedded interpreter selected by a `script` action.
enum class ScriptEngineKind : uint8_t {
    Lua,    ///< engine L
    Python  ///< engine P
};

struct ExternalCommandAction {
    std::string command;  ///< Shell command template.
    InputMode inputMode = InputMode::WholeFile;
    OutputMode outputMode = OutputMode::ReplaceFile;

    bool operator==(const ExternalCommandAction&) const = default;
};

struct SnippetAction {
    std::string text;  ///< Template with ${file_name}, ${file_path}, ${date}, ${time}.

    bool operator==(const SnippetAction&) const = default;
};

struct TransformAction {
    TransformOp operation = TransformOp::Uppercase;

    bool operator==(const TransformAction&) const = default;
};

struct NotifyAction {
    std::string title;
    std::string message;

    bool operator==(const NotifyAction&) const = default;
};

struct ChainAction {
    std::vector<std::string> members;  ///< Action ids, executed in order.

    bool operator==(const ChainAction&) const = default;
};

struct ScriptAction {
    ScriptEngineKind engine = ScriptEngineKind::Lua;
    std::optional<std::filesystem::path> file;  ///< Relative to the plugin directory.
    std::string code;                           ///< Inline source when no file.
    std::string entryPoint = "main";

    [[nodiscard]] bool isInline() const noexcept { return !file.has_value(); }

    bool operator==(const ScriptAction&) const = default;
};

using ActionSpec = std::variant<ExternalCommandAction,
                                SnippetAction,
                                TransformAction,
                                NotifyAction,
                                ChainAction,
                                ScriptAction>;

/// A named action inside a plugin.
struct Action {
    std::string id;
    ActionSpec spec;

    /// Definition-file tag of the variant ("external_command", "snippet", ...).
    [[nodiscard]] std::string_view typeName() const noexcept;

    bool operator==(const Action&) const = default;
};

// ── Name tables (definition-file spelling) ──────────────────────────────

[[nodiscard]] std::string_view inputModeName(InputMode mode) noexcept;
[[nodiscard]] std::optional<InputMode> parseInputMode(std::string_view name) noexcept;

[[nodiscard]] std::string_view outputModeName(OutputMode mode) noexcept;
[[nodiscard]] std::optional<OutputMode> parseOutputMode(std::string_view name) noexcept;

[[nodiscard]] std::string_view transformOpName(TransformOp op) noexcept;
[[nodiscard]] std::optional<TransformOp> parseTransformOp(std::string_view name) noexcept;

[[nodiscard]] std::string_view scriptEngineName(ScriptEngineKind kind) noexcept;
[[nodiscard]] std::optional<ScriptEngineKind> parseScriptEngine(std::string_view name) noexcept;

} // namespace edext::plugin

#pragma once

/// @file capability_bridge.hpp
/// @brief ICapabilityBridge: the only channel between plugins and the editor.
///
/// Implemented by the host application. Built-in actions and both script
/// engines observe and mutate editor state exclusively through this
/// interface; nothing in the engine holds a reference to the editor's own
/// buffer representation.

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "edext/foundation/engine_result.hpp"

namespace edext::bridge {

/// Cursor position, one-based line and column.
struct CursorPosition {
    int line = 1;
    int column = 1;

    bool operator==(const CursorPosition&) const = default;
};

/// Selection bounds as byte offsets into the buffer text, [start, end).
struct SelectionRange {
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] bool empty() const noexcept { return start == end; }

    bool operator==(const SelectionRange&) const = default;
};

/// Capability operations exposed to actions and scripts.
///
/// Every operation may fail with a Bridge-class error (NoActiveEditor when no
/// buffer is focused, NoFilePath for GetFilePath on an unsaved buffer,
/// InvalidCursor for out-of-range positions).
class ICapabilityBridge {
public:
    virtual ~ICapabilityBridge() = default;

    /// Whole buffer text.
    [[nodiscard]] virtual foundation::EngineResult<std::string> GetText() const = 0;

    /// Replace the whole buffer. Selection collapses, cursor is clamped.
    virtual foundation::EngineResult<void> SetText(std::string_view text) = 0;

    /// Selected text (empty string when nothing is selected).
    [[nodiscard]] virtual foundation::EngineResult<std::string> GetSelection() const = 0;

    [[nodiscard]] virtual foundation::EngineResult<SelectionRange> GetSelectionRange() const = 0;

    /// Replace the selection with @p text; the replacement stays selected.
    /// With an empty selection this inserts at the cursor.
    virtual foundation::EngineResult<void> ReplaceSelection(std::string_view text) = 0;

    /// Insert at the cursor and move the cursor to the end of the insertion.
    virtual foundation::EngineResult<void> InsertText(std::string_view text) = 0;

    [[nodiscard]] virtual foundation::EngineResult<CursorPosition> GetCursor() const = 0;

    virtual foundation::EngineResult<void> SetCursor(CursorPosition pos) = 0;

    /// Path of the current file; NoFilePath for unsaved buffers.
    [[nodiscard]] virtual foundation::EngineResult<std::filesystem::path> GetFilePath() const = 0;

    [[nodiscard]] virtual foundation::EngineResult<std::string> GetLanguage() const = 0;

    /// Show a notification to the user.
    virtual foundation::EngineResult<void> Notify(std::string_view title,
                                                  std::string_view message) = 0;
};

} // namespace edext::bridge

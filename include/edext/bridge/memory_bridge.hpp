#pragma once

/// @file memory_bridge.hpp
/// @brief MemoryBridge: in-memory ICapabilityBridge for headless hosts and tests.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "edext/bridge/capability_bridge.hpp"

namespace edext::bridge {

/// A notification recorded by MemoryBridge.
struct Notification {
    std::string title;
    std::string message;
};

/// Single-buffer editor model held entirely in memory.
///
/// Text is stored as UTF-8; cursor columns count bytes. The cursor is kept
/// at the end of the selection.
class MemoryBridge : public ICapabilityBridge {
public:
    MemoryBridge() = default;
    explicit MemoryBridge(std::string text,
                          std::optional<std::filesystem::path> path = std::nullopt,
                          std::string language = "text");

    // ── ICapabilityBridge ──────────────────────────────────────────────
    [[nodiscard]] foundation::EngineResult<std::string> GetText() const override;
    foundation::EngineResult<void> SetText(std::string_view text) override;
    [[nodiscard]] foundation::EngineResult<std::string> GetSelection() const override;
    [[nodiscard]] foundation::EngineResult<SelectionRange> GetSelectionRange() const override;
    foundation::EngineResult<void> ReplaceSelection(std::string_view text) override;
    foundation::EngineResult<void> InsertText(std::string_view text) override;
    [[nodiscard]] foundation::EngineResult<CursorPosition> GetCursor() const override;
    foundation::EngineResult<void> SetCursor(CursorPosition pos) override;
    [[nodiscard]] foundation::EngineResult<std::filesystem::path> GetFilePath() const override;
    [[nodiscard]] foundation::EngineResult<std::string> GetLanguage() const override;
    foundation::EngineResult<void> Notify(std::string_view title,
                                          std::string_view message) override;

    // ── Host-side controls ─────────────────────────────────────────────

    /// Select [start, end) (clamped to the text); cursor moves to @p end.
    void Select(std::size_t start, std::size_t end);

    /// Select the first occurrence of @p needle. Returns false if absent.
    bool SelectText(std::string_view needle);

    void SetFilePath(std::optional<std::filesystem::path> path);
    void SetLanguage(std::string language);

    /// Simulate "no editor focused": every capability fails with NoActiveEditor.
    void SetActive(bool active) noexcept { active_ = active; }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::vector<Notification>& notifications() const noexcept {
        return notifications_;
    }
    void ClearNotifications() { notifications_.clear(); }

    /// Incremented by every mutating call that changed the text.
    [[nodiscard]] std::size_t revision() const noexcept { return revision_; }

private:
    [[nodiscard]] foundation::EngineResult<void> requireActive() const;

    [[nodiscard]] std::size_t offsetOf(CursorPosition pos) const;
    [[nodiscard]] CursorPosition positionOf(std::size_t offset) const;

    std::string text_;
    std::optional<std::filesystem::path> path_;
    std::string language_ = "text";
    SelectionRange selection_;
    std::size_t cursor_ = 0;
    bool active_ = true;
    std::size_t revision_ = 0;
    std::vector<Notification> notifications_;
};

} // namespace edext::bridge

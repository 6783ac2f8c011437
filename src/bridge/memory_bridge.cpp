#include "edext/bridge/memory_bridge.hpp"

#include <algorithm>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;

namespace edext::bridge {

MemoryBridge::MemoryBridge(std::string text,
                           std::optional<std::filesystem::path> path,
                           std::string language)
    : text_(std::move(text)), path_(std::move(path)), language_(std::move(language)) {}

EngineResult<void> MemoryBridge::requireActive() const {
    if (!active_) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::NoActiveEditor, "no active editor"));
    }
    return EngineResult<void>::ok();
}

// ── Text ────────────────────────────────────────────────────────────────

EngineResult<std::string> MemoryBridge::GetText() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<std::string>::err(active.error());
    }
    return EngineResult<std::string>::ok(text_);
}

EngineResult<void> MemoryBridge::SetText(std::string_view text) {
    if (auto active = requireActive(); !active) {
        return active;
    }
    if (text_ != text) {
        text_.assign(text);
        ++revision_;
    }
    cursor_ = std::min(cursor_, text_.size());
    selection_ = {cursor_, cursor_};
    return EngineResult<void>::ok();
}

// ── Selection ───────────────────────────────────────────────────────────

EngineResult<std::string> MemoryBridge::GetSelection() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<std::string>::err(active.error());
    }
    return EngineResult<std::string>::ok(
        text_.substr(selection_.start, selection_.end - selection_.start));
}

EngineResult<SelectionRange> MemoryBridge::GetSelectionRange() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<SelectionRange>::err(active.error());
    }
    return EngineResult<SelectionRange>::ok(selection_);
}

EngineResult<void> MemoryBridge::ReplaceSelection(std::string_view text) {
    if (auto active = requireActive(); !active) {
        return active;
    }
    auto start = selection_.empty() ? cursor_ : selection_.start;
    auto length = selection_.empty() ? 0 : selection_.end - selection_.start;

    if (text_.compare(start, length, text) != 0) {
        text_.replace(start, length, text);
        ++revision_;
    }
    selection_ = {start, start + text.size()};
    cursor_ = selection_.end;
    return EngineResult<void>::ok();
}

EngineResult<void> MemoryBridge::InsertText(std::string_view text) {
    if (auto active = requireActive(); !active) {
        return active;
    }
    // Selected text stays; the selection collapses to the new cursor.
    text_.insert(cursor_, text);
    if (!text.empty()) {
        ++revision_;
    }
    cursor_ += text.size();
    selection_ = {cursor_, cursor_};
    return EngineResult<void>::ok();
}

void MemoryBridge::Select(std::size_t start, std::size_t end) {
    start = std::min(start, text_.size());
    end = std::min(end, text_.size());
    if (start > end) {
        std::swap(start, end);
    }
    selection_ = {start, end};
    cursor_ = end;
}

bool MemoryBridge::SelectText(std::string_view needle) {
    auto pos = text_.find(needle);
    if (pos == std::string::npos) {
        return false;
    }
    Select(pos, pos + needle.size());
    return true;
}

// ── Cursor ──────────────────────────────────────────────────────────────

EngineResult<CursorPosition> MemoryBridge::GetCursor() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<CursorPosition>::err(active.error());
    }
    return EngineResult<CursorPosition>::ok(positionOf(cursor_));
}

EngineResult<void> MemoryBridge::SetCursor(CursorPosition pos) {
    if (auto active = requireActive(); !active) {
        return active;
    }
    auto offset = offsetOf(pos);
    if (offset == std::string::npos) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::InvalidCursor,
            "cursor out of range: " + std::to_string(pos.line) + ":" +
                std::to_string(pos.column)));
    }
    cursor_ = offset;
    selection_ = {cursor_, cursor_};
    return EngineResult<void>::ok();
}

std::size_t MemoryBridge::offsetOf(CursorPosition pos) const {
    if (pos.line < 1 || pos.column < 1) {
        return std::string::npos;
    }
    std::size_t lineStart = 0;
    for (int line = 1; line < pos.line; ++line) {
        auto nl = text_.find('\n', lineStart);
        if (nl == std::string::npos) {
            return std::string::npos;
        }
        lineStart = nl + 1;
    }
    auto lineEnd = text_.find('\n', lineStart);
    if (lineEnd == std::string::npos) {
        lineEnd = text_.size();
    }
    auto offset = lineStart + static_cast<std::size_t>(pos.column - 1);
    return offset <= lineEnd ? offset : std::string::npos;
}

CursorPosition MemoryBridge::positionOf(std::size_t offset) const {
    CursorPosition pos;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset && i < text_.size(); ++i) {
        if (text_[i] == '\n') {
            ++pos.line;
            lineStart = i + 1;
        }
    }
    pos.column = static_cast<int>(offset - lineStart) + 1;
    return pos;
}

// ── File identity ───────────────────────────────────────────────────────

EngineResult<std::filesystem::path> MemoryBridge::GetFilePath() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<std::filesystem::path>::err(active.error());
    }
    if (!path_) {
        return EngineResult<std::filesystem::path>::err(
            EngineError(ErrorCode::NoFilePath, "buffer has not been saved"));
    }
    return EngineResult<std::filesystem::path>::ok(*path_);
}

EngineResult<std::string> MemoryBridge::GetLanguage() const {
    if (auto active = requireActive(); !active) {
        return EngineResult<std::string>::err(active.error());
    }
    return EngineResult<std::string>::ok(language_);
}

void MemoryBridge::SetFilePath(std::optional<std::filesystem::path> path) {
    path_ = std::move(path);
}

void MemoryBridge::SetLanguage(std::string language) {
    language_ = std::move(language);
}

// ── Notifications ───────────────────────────────────────────────────────

EngineResult<void> MemoryBridge::Notify(std::string_view title, std::string_view message) {
    if (auto active = requireActive(); !active) {
        return active;
    }
    notifications_.push_back({std::string(title), std::string(message)});
    return EngineResult<void>::ok();
}

} // namespace edext::bridge

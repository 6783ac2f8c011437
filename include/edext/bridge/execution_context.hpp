#pragma once

/// @file execution_context.hpp
/// @brief ExecutionContext: snapshot of editor state at invocation time.

#include <filesystem>
#include <optional>
#include <string>

#include "edext/bridge/capability_bridge.hpp"
#include "edext/foundation/engine_result.hpp"

namespace edext::bridge {

/// Editor state read when an action is invoked.
///
/// Owned by the invocation that captured it and never shared. Trigger
/// matching and snippet/command token expansion read from the snapshot;
/// actions that mutate the buffer go through the live bridge.
struct ExecutionContext {
    std::optional<std::filesystem::path> filePath;  ///< Empty for unsaved buffers.
    std::string language;
    std::string text;
    std::string selection;
    SelectionRange selectionRange;
    CursorPosition cursor;

    /// Read the current state from @p bridge. An unsaved buffer is not an
    /// error (filePath stays empty); any other bridge failure is returned.
    static foundation::EngineResult<ExecutionContext> Capture(const ICapabilityBridge& bridge);

    /// File name component, or nullopt for unsaved buffers.
    [[nodiscard]] std::optional<std::string> fileName() const;
};

} // namespace edext::bridge

#include "edext/bridge/execution_context.hpp"

using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;

namespace edext::bridge {

EngineResult<ExecutionContext> ExecutionContext::Capture(const ICapabilityBridge& bridge) {
    ExecutionContext ctx;

    auto path = bridge.GetFilePath();
    if (path) {
        ctx.filePath = std::move(path).value();
    } else if (path.error().code() != ErrorCode::NoFilePath) {
        return EngineResult<ExecutionContext>::err(path.error());
    }

    auto language = bridge.GetLanguage();
    if (!language) {
        return EngineResult<ExecutionContext>::err(language.error());
    }
    ctx.language = std::move(language).value();

    auto text = bridge.GetText();
    if (!text) {
        return EngineResult<ExecutionContext>::err(text.error());
    }
    ctx.text = std::move(text).value();

    auto selection = bridge.GetSelection();
    if (!selection) {
        return EngineResult<ExecutionContext>::err(selection.error());
    }
    ctx.selection = std::move(selection).value();

    auto range = bridge.GetSelectionRange();
    if (!range) {
        return EngineResult<ExecutionContext>::err(range.error());
    }
    ctx.selectionRange = range.value();

    auto cursor = bridge.GetCursor();
    if (!cursor) {
        return EngineResult<ExecutionContext>::err(cursor.error());
    }
    ctx.cursor = cursor.value();

    return EngineResult<ExecutionContext>::ok(std::move(ctx));
}

std::optional<std::string> ExecutionContext::fileName() const {
    if (!filePath) {
        return std::nullopt;
    }
    return filePath->filename().string();
}

} // namespace edext::bridge

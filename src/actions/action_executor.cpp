/// @file action_executor.cpp
/// @brief Variant dispatch for plugin actions.

#include "edext/action/action_executor.hpp"

#include "edext/action/process_runner.hpp"
#include "edext/action/snippet_expander.hpp"
#include "edext/action/text_transform.hpp"
#include "edext/foundation/engine_logger.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;
using edext::foundation::LogContext;
using edext::foundation::LogLevel;

namespace fs = std::filesystem;

namespace edext::action {

using namespace edext::plugin;

namespace {

EngineResult<void> fail(ErrorCode code, std::string message) {
    return EngineResult<void>::err(EngineError(code, std::move(message)));
}

std::string trimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

bool isWithin(const fs::path& base, const fs::path& candidate) {
    auto [baseEnd, candIt] =
        std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    return baseEnd == base.end() && candIt != candidate.end();
}

} // namespace

EngineResult<fs::path> resolveContainedPath(const fs::path& directory, const fs::path& relative) {
    std::error_code ec;
    auto base = fs::canonical(directory, ec);
    if (ec) {
        return EngineResult<fs::path>::err(EngineError(
            ErrorCode::ScriptLoadFailed,
            "cannot resolve plugin directory " + directory.string() + ": " + ec.message()));
    }
    auto target = fs::canonical(directory / relative, ec);
    if (ec) {
        return EngineResult<fs::path>::err(EngineError(
            ErrorCode::ScriptLoadFailed,
            "cannot resolve script " + relative.string() + ": " + ec.message()));
    }
    if (!isWithin(base, target)) {
        return EngineResult<fs::path>::err(EngineError(
            ErrorCode::ScriptPathRejected,
            "script " + relative.string() + " resolves outside the plugin directory"));
    }
    return EngineResult<fs::path>::ok(std::move(target));
}

ActionExecutor::ActionExecutor(bridge::ICapabilityBridge& bridge,
                               script::ScriptEngineRegistry& engines,
                               foundation::EngineConfig config)
    : bridge_(bridge), engines_(engines), config_(std::move(config)) {}

EngineResult<void> ActionExecutor::Execute(const Plugin& plugin, std::string_view actionId,
                                           const bridge::ExecutionContext& ctx) {
    const Action* action = plugin.FindAction(actionId);
    if (action == nullptr) {
        return fail(ErrorCode::ActionNotFound, "plugin '" + plugin.name() +
                                                   "' has no action '" + std::string(actionId) +
                                                   "'");
    }
    return run(plugin, *action, ctx);
}

EngineResult<void> ActionExecutor::run(const Plugin& plugin, const Action& action,
                                       const bridge::ExecutionContext& ctx) {
    auto& logger = foundation::EngineLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Action)) {
        LogContext lc;
        lc.plugin = plugin.name();
        lc.action = action.id;
        lc.extra["type"] = std::string(action.typeName());
        logger.logWithContext(LogLevel::Debug, LogCategory::Action, "executing action", lc);
    }

    if (const auto* spec = std::get_if<ExternalCommandAction>(&action.spec)) {
        return runExternalCommand(plugin, *spec, ctx);
    }
    if (const auto* spec = std::get_if<SnippetAction>(&action.spec)) {
        return runSnippet(*spec, ctx);
    }
    if (const auto* spec = std::get_if<TransformAction>(&action.spec)) {
        return runTransform(*spec);
    }
    if (const auto* spec = std::get_if<NotifyAction>(&action.spec)) {
        return runNotify(*spec);
    }
    if (const auto* spec = std::get_if<ChainAction>(&action.spec)) {
        return runChain(plugin, action, *spec, ctx);
    }
    return runScript(plugin, action, std::get<ScriptAction>(action.spec));
}

// ── external_command ────────────────────────────────────────────────────

EngineResult<void> ActionExecutor::runExternalCommand(const Plugin& plugin,
                                                      const ExternalCommandAction& spec,
                                                      const bridge::ExecutionContext& ctx) {
    CommandRequest request;
    request.shell = config_.shell;
    request.outputLimitBytes = config_.outputLimitBytes;

    switch (spec.inputMode) {
        case InputMode::None:
            break;
        case InputMode::WholeFile: {
            auto text = bridge_.GetText();
            if (!text) {
                return EngineResult<void>::err(text.error());
            }
            request.input = std::move(text).value();
            break;
        }
        case InputMode::Selection: {
            auto selection = bridge_.GetSelection();
            if (!selection) {
                return EngineResult<void>::err(selection.error());
            }
            if (selection.value().empty()) {
                return fail(ErrorCode::UnsupportedModeCombination,
                            "input_mode 'selection' requires a non-empty selection");
            }
            request.input = std::move(selection).value();
            break;
        }
    }

    SnippetFormat format{config_.dateFormat, config_.timeFormat, config_.untitledPlaceholder};
    request.command = expandCommand(spec.command, snippetTokensFor(ctx, format));

    if (ctx.filePath) {
        request.workingDirectory = ctx.filePath->parent_path();
    } else {
        request.workingDirectory = plugin.directory;
    }

    EDEXT_LOG_DEBUG(LogCategory::Action, "running command: " + request.command);
    auto ran = runCommand(request);
    if (!ran) {
        return EngineResult<void>::err(ran.error());
    }
    CommandOutput output = std::move(ran).value();

    if (!output.succeeded()) {
        std::string message = "command exited with status " + std::to_string(output.exitCode);
        auto stderrText = trimTrailingNewlines(output.stderrText);
        if (!stderrText.empty()) {
            message += ": " + stderrText;
        }
        return EngineResult<void>::err(
            EngineError(ErrorCode::CommandFailed, std::move(message), std::move(output)));
    }

    if (output.truncated && spec.outputMode != OutputMode::Discard) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::ActionFailed,
            "command output exceeded " + std::to_string(config_.outputLimitBytes) + " bytes",
            std::move(output)));
    }

    switch (spec.outputMode) {
        case OutputMode::ReplaceFile:
            return bridge_.SetText(output.stdoutText);
        case OutputMode::ReplaceSelection:
            return bridge_.ReplaceSelection(output.stdoutText);
        case OutputMode::Insert:
            return bridge_.InsertText(output.stdoutText);
        case OutputMode::Notify:
            return bridge_.Notify(plugin.name(), trimTrailingNewlines(output.stdoutText));
        case OutputMode::Discard:
            break;
    }
    return EngineResult<void>::ok();
}

// ── snippet / transform / notify ────────────────────────────────────────

EngineResult<void> ActionExecutor::runSnippet(const SnippetAction& spec,
                                              const bridge::ExecutionContext& ctx) {
    SnippetFormat format{config_.dateFormat, config_.timeFormat, config_.untitledPlaceholder};
    return bridge_.InsertText(expandSnippet(spec.text, snippetTokensFor(ctx, format)));
}

EngineResult<void> ActionExecutor::runTransform(const TransformAction& spec) {
    auto range = bridge_.GetSelectionRange();
    if (!range) {
        return EngineResult<void>::err(range.error());
    }

    if (!range.value().empty()) {
        auto selection = bridge_.GetSelection();
        if (!selection) {
            return EngineResult<void>::err(selection.error());
        }
        return bridge_.ReplaceSelection(applyTransform(spec.operation, selection.value()));
    }

    auto text = bridge_.GetText();
    if (!text) {
        return EngineResult<void>::err(text.error());
    }
    return bridge_.SetText(applyTransform(spec.operation, text.value()));
}

EngineResult<void> ActionExecutor::runNotify(const NotifyAction& spec) {
    return bridge_.Notify(spec.title, spec.message);
}

// ── chain ───────────────────────────────────────────────────────────────

EngineResult<void> ActionExecutor::runChain(const Plugin& plugin, const Action& chain,
                                            const ChainAction& spec,
                                            const bridge::ExecutionContext& ctx) {
    for (std::size_t i = 0; i < spec.members.size(); ++i) {
        const auto& memberId = spec.members[i];
        const Action* member = plugin.FindAction(memberId);

        EngineResult<void> step = member != nullptr
                                      ? run(plugin, *member, ctx)
                                      : fail(ErrorCode::ActionNotFound,
                                             "no action '" + memberId + "'");
        if (!step) {
            const EngineError& cause = step.error();
            std::string message = "chain '" + chain.id + "' failed at step " +
                                  std::to_string(i + 1) + " ('" + memberId +
                                  "'): " + std::string(cause.message());
            return EngineResult<void>::err(
                EngineError(ErrorCode::ChainAborted, std::move(message), cause));
        }
    }
    return EngineResult<void>::ok();
}

// ── script ──────────────────────────────────────────────────────────────

EngineResult<void> ActionExecutor::runScript(const Plugin& plugin, const Action& action,
                                             const ScriptAction& spec) {
    auto engine = engines_.Find(spec.engine);
    if (!engine) {
        return EngineResult<void>::err(engine.error());
    }

    std::string tag = "[" + std::string(engine.value()->name()) + "] ";
    script::ScriptSource source;
    source.notifyTitle = plugin.name();
    if (spec.isInline()) {
        source.code = spec.code;
        source.name = plugin.name() + ":" + action.id;
    } else {
        auto path = resolveContainedPath(plugin.directory, *spec.file);
        if (!path) {
            return EngineResult<void>::err(path.error().withPrefix(tag));
        }
        std::ifstream in(path.value(), std::ios::binary);
        if (!in) {
            return fail(ErrorCode::ScriptLoadFailed,
                        tag + "cannot read script " + path.value().string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        source.code = buffer.str();
        source.name = spec.file->generic_string();
    }

    return engine.value()->Run(source, spec.entryPoint, bridge_);
}

} // namespace edext::action

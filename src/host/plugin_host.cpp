/// @file plugin_host.cpp
/// @brief Event fan-out, failure reporting and reload wiring.

#include "edext/host/plugin_host.hpp"

#include "edext/foundation/engine_logger.hpp"

#include <filesystem>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;
using edext::foundation::LogContext;
using edext::foundation::LogLevel;
using edext::plugin::SnapshotPtr;
using edext::plugin::TriggerKind;

namespace fs = std::filesystem;

namespace edext::host {

namespace {

constexpr std::string_view kLoaderTitle = "Plugins";

} // namespace

PluginHost::PluginHost(foundation::EngineConfig config, bridge::ICapabilityBridge& bridge)
    : PluginHost(config, bridge, script::ScriptEngineRegistry::CreateDefault(config)) {}

PluginHost::PluginHost(foundation::EngineConfig config, bridge::ICapabilityBridge& bridge,
                       script::ScriptEngineRegistry engines)
    : config_(std::move(config)),
      bridge_(bridge),
      engines_(std::move(engines)),
      registry_(config_.pluginRoot),
      executor_(bridge_, engines_, config_) {}

PluginHost::~PluginHost() = default;

EngineResult<SnapshotPtr> PluginHost::Start() {
    std::error_code ec;
    if (config_.createPluginRoot && !fs::exists(config_.pluginRoot, ec)) {
        fs::create_directories(config_.pluginRoot, ec);
        if (ec) {
            return EngineResult<SnapshotPtr>::err(EngineError(
                ErrorCode::PluginRootUnreadable,
                "cannot create plugin root " + config_.pluginRoot.string() + ": " + ec.message()));
        }
        EDEXT_LOG_INFO(LogCategory::Core,
                       "created plugin root " + config_.pluginRoot.string());
    }

    auto loaded = registry_.Reload();
    reportLoad(loaded);
    if (!loaded) {
        return loaded;
    }

    if (config_.autoReload) {
        watcher_ = std::make_unique<plugin::RegistryWatcher>(registry_);
        watcher_->SetDebounceMs(config_.reloadDebounceMs);
        watcher_->SetReloadCallback([this](const SnapshotPtr& snapshot) {
            EDEXT_LOG_INFO(LogCategory::Core,
                           "plugins reloaded (generation " +
                               std::to_string(snapshot->generation()) + ")");
            reportLoad(EngineResult<SnapshotPtr>::ok(snapshot));
        });
        watcher_->SetReloadFailedCallback([this](const EngineError& error) {
            reportLoad(EngineResult<SnapshotPtr>::err(error));
        });
        watcher_->Rearm();
    }
    return loaded;
}

EngineResult<SnapshotPtr> PluginHost::Reload() {
    auto loaded = registry_.Reload();
    reportLoad(loaded);
    if (loaded && watcher_) {
        watcher_->Rearm();
    }
    return loaded;
}

bool PluginHost::Poll() {
    return watcher_ ? watcher_->Poll() : false;
}

std::vector<trigger::CommandEntry> PluginHost::Commands() const {
    return trigger::TriggerMatcher(registry_.Snapshot()).Commands();
}

EngineResult<std::vector<trigger::CommandEntry>> PluginHost::CommandsForCurrentFile() const {
    auto ctx = bridge::ExecutionContext::Capture(bridge_);
    if (!ctx) {
        return EngineResult<std::vector<trigger::CommandEntry>>::err(ctx.error());
    }
    return EngineResult<std::vector<trigger::CommandEntry>>::ok(
        trigger::TriggerMatcher(registry_.Snapshot()).CommandsFor(ctx.value()));
}

EngineResult<void> PluginHost::ExecuteTrigger(std::string_view pluginName,
                                              std::string_view triggerId) {
    trigger::TriggerMatcher matcher(registry_.Snapshot());
    auto match = matcher.Find(pluginName, triggerId);
    if (match.trigger == nullptr || !plugin::isManualKind(match.trigger->kind)) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::TriggerNotFound, "no command '" + std::string(triggerId) +
                                            "' in plugin '" + std::string(pluginName) + "'"));
    }

    auto ctx = bridge::ExecutionContext::Capture(bridge_);
    if (!ctx) {
        return EngineResult<void>::err(ctx.error());
    }
    if (!match.trigger->Matches(ctx.value())) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::TriggerNotFound, "command '" + match.trigger->label() +
                                            "' does not apply to the current file"));
    }
    return invoke(match, ctx.value());
}

std::vector<TriggerOutcome> PluginHost::OnFileSaved() {
    return fireEvent(TriggerKind::OnSave);
}

std::vector<TriggerOutcome> PluginHost::OnFileOpened() {
    return fireEvent(TriggerKind::OnOpen);
}

std::vector<TriggerOutcome> PluginHost::fireEvent(TriggerKind kind) {
    std::vector<TriggerOutcome> outcomes;

    auto ctx = bridge::ExecutionContext::Capture(bridge_);
    if (!ctx) {
        EDEXT_LOG_WARN(LogCategory::Trigger,
                       std::string(plugin::triggerKindName(kind)) +
                           " ignored: " + std::string(ctx.error().message()));
        return outcomes;
    }

    trigger::TriggerMatcher matcher(registry_.Snapshot());
    auto matches = matcher.TriggersFor(kind, ctx.value());
    EDEXT_LOG_DEBUG(LogCategory::Trigger, std::string(plugin::triggerKindName(kind)) + ": " +
                                              std::to_string(matches.size()) + " trigger(s)");

    for (const auto& match : matches) {
        outcomes.push_back(TriggerOutcome{match.plugin->name(), match.trigger->id,
                                          match.trigger->actionId, invoke(match, ctx.value())});
    }
    return outcomes;
}

EngineResult<void> PluginHost::invoke(const trigger::TriggerMatch& match,
                                      const bridge::ExecutionContext& ctx) {
    auto result = executor_.Execute(*match.plugin, match.trigger->actionId, ctx);
    if (!result) {
        reportFailure(*match.plugin, *match.trigger, result.error());
    }
    return result;
}

void PluginHost::reportFailure(const plugin::Plugin& owner, const plugin::Trigger& trig,
                               const EngineError& error) {
    LogContext lc;
    lc.plugin = owner.name();
    lc.trigger = trig.id;
    lc.action = trig.actionId;
    lc.extra["error"] = std::string(error.subsystem());
    foundation::EngineLogger::instance().logWithContext(
        LogLevel::Error, LogCategory::Action, std::string(error.message()), lc);

    notify(owner.name(), "Action '" + trig.actionId + "' failed: " + std::string(error.message()));
}

void PluginHost::reportLoad(const EngineResult<SnapshotPtr>& loaded) {
    if (!loaded) {
        EDEXT_LOG_ERROR(LogCategory::Registry,
                        "plugin load failed: " + std::string(loaded.error().message()));
        notify(std::string(kLoaderTitle),
               "Plugins could not be loaded: " + std::string(loaded.error().message()));
        return;
    }
    for (const auto& failure : loaded.value()->errors()) {
        auto dir = failure.directory.filename().string();
        notify(dir, "Plugin '" + dir + "' was not loaded: " +
                        std::string(failure.error.message()));
    }
}

void PluginHost::notify(const std::string& title, const std::string& message) {
    auto notified = bridge_.Notify(title, message);
    if (!notified) {
        EDEXT_LOG_WARN(LogCategory::Bridge,
                       "cannot show notification: " + std::string(notified.error().message()));
    }
}

} // namespace edext::host

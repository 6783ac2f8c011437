/// @file trigger_matcher.cpp
/// @brief Event and command lookup over a registry snapshot.

#include "edext/trigger/trigger_matcher.hpp"

namespace edext::trigger {

using plugin::TriggerKind;

namespace {

CommandEntry toCommandEntry(const plugin::Plugin& owner, const plugin::Trigger& trigger) {
    return CommandEntry{owner.name(), trigger.id, trigger.label(), trigger.shortcut, trigger.kind};
}

} // namespace

TriggerMatcher::TriggerMatcher(plugin::SnapshotPtr snapshot) : snapshot_(std::move(snapshot)) {}

std::vector<TriggerMatch> TriggerMatcher::TriggersFor(TriggerKind kind,
                                                      const bridge::ExecutionContext& ctx) const {
    std::vector<TriggerMatch> matches;
    if (!snapshot_) {
        return matches;
    }
    for (const auto& owner : snapshot_->plugins()) {
        for (const auto& trigger : owner->triggers) {
            if (trigger.kind == kind && trigger.Matches(ctx)) {
                matches.push_back({owner, &trigger});
            }
        }
    }
    return matches;
}

std::vector<CommandEntry> TriggerMatcher::Commands() const {
    std::vector<CommandEntry> commands;
    if (!snapshot_) {
        return commands;
    }
    for (const auto& owner : snapshot_->plugins()) {
        for (const auto& trigger : owner->triggers) {
            if (plugin::isManualKind(trigger.kind)) {
                commands.push_back(toCommandEntry(*owner, trigger));
            }
        }
    }
    return commands;
}

std::vector<CommandEntry> TriggerMatcher::CommandsFor(const bridge::ExecutionContext& ctx) const {
    std::vector<CommandEntry> commands;
    if (!snapshot_) {
        return commands;
    }
    for (const auto& owner : snapshot_->plugins()) {
        for (const auto& trigger : owner->triggers) {
            if (plugin::isManualKind(trigger.kind) && trigger.Matches(ctx)) {
                commands.push_back(toCommandEntry(*owner, trigger));
            }
        }
    }
    return commands;
}

TriggerMatch TriggerMatcher::Find(std::string_view pluginName, std::string_view triggerId) const {
    if (!snapshot_) {
        return {};
    }
    auto owner = snapshot_->FindPlugin(pluginName);
    if (!owner) {
        return {};
    }
    return {owner, owner->FindTrigger(triggerId)};
}

} // namespace edext::trigger

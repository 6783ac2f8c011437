/// @file plugin_validator.cpp
/// @brief Trigger/action cross-reference checks and chain cycle detection.

#include "edext/plugin/plugin_validator.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <unordered_set>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;

namespace edext::plugin {

namespace {

std::string joinPath(const std::vector<std::string>& ids) {
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            out += " -> ";
        }
        out += ids[i];
    }
    return out;
}

} // namespace

bool isContainedRelativePath(const std::filesystem::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_name()) {
        return false;
    }
    auto normal = relative.lexically_normal();
    auto first = normal.begin();
    return first == normal.end() || *first != "..";
}

std::vector<std::string> findChainCycle(const Plugin& plugin) {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<std::string, Color> color;
    std::vector<std::string> path;
    std::vector<std::string> cycle;

    std::function<bool(const std::string&)> dfs = [&](const std::string& id) -> bool {
        const auto* action = plugin.FindAction(id);
        const auto* chain = action ? std::get_if<ChainAction>(&action->spec) : nullptr;
        if (chain == nullptr) {
            return false;
        }

        color[id] = Color::Gray;
        path.push_back(id);

        for (const auto& member : chain->members) {
            auto state = color.count(member) ? color[member] : Color::White;
            if (state == Color::Gray) {
                auto start = std::find(path.begin(), path.end(), member);
                cycle.assign(start, path.end());
                cycle.push_back(member);
                return true;
            }
            if (state == Color::White && dfs(member)) {
                return true;
            }
        }

        path.pop_back();
        color[id] = Color::Black;
        return false;
    };

    for (const auto& [id, action] : plugin.actions) {
        if (std::holds_alternative<ChainAction>(action.spec) &&
            (color.count(id) == 0 || color[id] == Color::White)) {
            if (dfs(id)) {
                return cycle;
            }
        }
    }
    return {};
}

EngineResult<void> validatePlugin(const Plugin& plugin) {
    std::unordered_set<std::string> triggerIds;
    for (const auto& trigger : plugin.triggers) {
        if (!triggerIds.insert(trigger.id).second) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::DuplicateTriggerId, "duplicate trigger id '" + trigger.id + "'"));
        }
        if (plugin.FindAction(trigger.actionId) == nullptr) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::DanglingActionReference,
                "trigger '" + trigger.id + "' references unknown action '" + trigger.actionId + "'"));
        }
    }

    for (const auto& [id, action] : plugin.actions) {
        if (const auto* chain = std::get_if<ChainAction>(&action.spec)) {
            for (const auto& member : chain->members) {
                if (plugin.FindAction(member) == nullptr) {
                    return EngineResult<void>::err(EngineError(
                        ErrorCode::DanglingChainMember,
                        "chain '" + id + "' references unknown action '" + member + "'"));
                }
            }
        } else if (const auto* script = std::get_if<ScriptAction>(&action.spec)) {
            if (script->file && !isContainedRelativePath(*script->file)) {
                return EngineResult<void>::err(EngineError(
                    ErrorCode::ScriptPathEscapes,
                    "script '" + id + "' file '" + script->file->string() +
                        "' escapes the plugin directory"));
            }
        }
    }

    auto cycle = findChainCycle(plugin);
    if (!cycle.empty()) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::CyclicChain, "cyclic chain: " + joinPath(cycle), cycle));
    }

    return EngineResult<void>::ok();
}

} // namespace edext::plugin

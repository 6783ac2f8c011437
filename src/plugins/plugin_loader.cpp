/// @file plugin_loader.cpp
/// @brief Parses plugin definition files (YAML or JSON) into Plugin values.

#include "edext/plugin/plugin_loader.hpp"

#include "edext/foundation/engine_logger.hpp"
#include "edext/plugin/plugin_validator.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <yaml-cpp/yaml.h>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;

namespace fs = std::filesystem;

namespace edext::plugin {

namespace {

EngineError fieldError(ErrorCode code, const std::string& where, const std::string& detail) {
    return EngineError(code, where.empty() ? detail : where + ": " + detail);
}

/// Required scalar string field.
EngineResult<std::string> requireString(const YAML::Node& node, const char* key,
                                        const std::string& where) {
    auto child = node[key];
    if (!child || child.IsNull()) {
        return EngineResult<std::string>::err(
            fieldError(ErrorCode::MissingField, where, std::string("missing field '") + key + "'"));
    }
    if (!child.IsScalar()) {
        return EngineResult<std::string>::err(fieldError(
            ErrorCode::FieldTypeMismatch, where, std::string("field '") + key + "' must be a string"));
    }
    return EngineResult<std::string>::ok(child.Scalar());
}

/// Optional scalar string field; @p fallback when absent or null.
EngineResult<std::string> optionalString(const YAML::Node& node, const char* key,
                                         const std::string& where, std::string fallback = {}) {
    auto child = node[key];
    if (!child || child.IsNull()) {
        return EngineResult<std::string>::ok(std::move(fallback));
    }
    if (!child.IsScalar()) {
        return EngineResult<std::string>::err(fieldError(
            ErrorCode::FieldTypeMismatch, where, std::string("field '") + key + "' must be a string"));
    }
    return EngineResult<std::string>::ok(child.Scalar());
}

/// Optional list of strings; empty when absent.
EngineResult<std::vector<std::string>> optionalStringList(const YAML::Node& node, const char* key,
                                                         const std::string& where) {
    std::vector<std::string> out;
    auto child = node[key];
    if (!child || child.IsNull()) {
        return EngineResult<std::vector<std::string>>::ok(std::move(out));
    }
    if (!child.IsSequence()) {
        return EngineResult<std::vector<std::string>>::err(fieldError(
            ErrorCode::FieldTypeMismatch, where, std::string("field '") + key + "' must be a list"));
    }
    for (const auto& item : child) {
        if (!item.IsScalar()) {
            return EngineResult<std::vector<std::string>>::err(
                fieldError(ErrorCode::FieldTypeMismatch, where,
                           std::string("entries of '") + key + "' must be strings"));
        }
        out.push_back(item.Scalar());
    }
    return EngineResult<std::vector<std::string>>::ok(std::move(out));
}

// ── Triggers ────────────────────────────────────────────────────────────

EngineResult<ContextFilter> parseContext(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return EngineResult<ContextFilter>::err(
            fieldError(ErrorCode::FieldTypeMismatch, where, "'context' must be a mapping"));
    }
    ContextFilter filter;

    auto languages = optionalStringList(node, "languages", where);
    if (!languages) {
        return EngineResult<ContextFilter>::err(languages.error());
    }
    filter.languages = std::move(languages).value();

    auto patterns = optionalStringList(node, "file_patterns", where);
    if (!patterns) {
        return EngineResult<ContextFilter>::err(patterns.error());
    }
    filter.filePatterns = std::move(patterns).value();

    return EngineResult<ContextFilter>::ok(std::move(filter));
}

EngineResult<Trigger> parseTrigger(const YAML::Node& node, std::size_t index) {
    std::string where = "trigger[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return EngineResult<Trigger>::err(
            fieldError(ErrorCode::FieldTypeMismatch, where, "must be a mapping"));
    }

    Trigger trigger;

    auto id = requireString(node, "id", where);
    if (!id) {
        return EngineResult<Trigger>::err(id.error());
    }
    trigger.id = std::move(id).value();
    where += " '" + trigger.id + "'";

    auto type = requireString(node, "type", where);
    if (!type) {
        return EngineResult<Trigger>::err(type.error());
    }
    auto kind = parseTriggerKind(type.value());
    if (!kind) {
        return EngineResult<Trigger>::err(fieldError(
            ErrorCode::UnknownTriggerType, where, "unknown trigger type '" + type.value() + "'"));
    }
    trigger.kind = *kind;

    auto actionId = requireString(node, "action_id", where);
    if (!actionId) {
        return EngineResult<Trigger>::err(actionId.error());
    }
    trigger.actionId = std::move(actionId).value();

    auto commandName = optionalString(node, "command_name", where);
    if (!commandName) {
        return EngineResult<Trigger>::err(commandName.error());
    }
    trigger.commandName = std::move(commandName).value();

    auto shortcut = optionalString(node, "shortcut", where);
    if (!shortcut) {
        return EngineResult<Trigger>::err(shortcut.error());
    }
    trigger.shortcut = std::move(shortcut).value();

    auto context = node["context"];
    if (context && !context.IsNull()) {
        auto filter = parseContext(context, where);
        if (!filter) {
            return EngineResult<Trigger>::err(filter.error());
        }
        trigger.context = std::move(filter).value();
    }

    return EngineResult<Trigger>::ok(std::move(trigger));
}

// ── Actions ─────────────────────────────────────────────────────────────

EngineResult<ActionSpec> parseExternalCommand(const YAML::Node& node, const std::string& where) {
    ExternalCommandAction action;

    auto command = requireString(node, "command", where);
    if (!command) {
        return EngineResult<ActionSpec>::err(command.error());
    }
    if (command.value().empty()) {
        return EngineResult<ActionSpec>::err(
            fieldError(ErrorCode::MissingField, where, "'command' must not be empty"));
    }
    action.command = std::move(command).value();

    auto input = optionalString(node, "input_mode", where, "none");
    if (!input) {
        return EngineResult<ActionSpec>::err(input.error());
    }
    auto inputMode = parseInputMode(input.value());
    if (!inputMode) {
        return EngineResult<ActionSpec>::err(fieldError(
            ErrorCode::UnknownInputMode, where, "unknown input_mode '" + input.value() + "'"));
    }
    action.inputMode = *inputMode;

    auto output = optionalString(node, "output_mode", where, "discard");
    if (!output) {
        return EngineResult<ActionSpec>::err(output.error());
    }
    auto outputMode = parseOutputMode(output.value());
    if (!outputMode) {
        return EngineResult<ActionSpec>::err(fieldError(
            ErrorCode::UnknownOutputMode, where, "unknown output_mode '" + output.value() + "'"));
    }
    action.outputMode = *outputMode;

    return EngineResult<ActionSpec>::ok(std::move(action));
}

EngineResult<ActionSpec> parseSnippet(const YAML::Node& node, const std::string& where) {
    // "text" is accepted as an alias of "template".
    const char* key = node["template"] ? "template" : "text";
    if (!node[key]) {
        return EngineResult<ActionSpec>::err(
            fieldError(ErrorCode::MissingField, where, "missing field 'template'"));
    }
    auto text = requireString(node, key, where);
    if (!text) {
        return EngineResult<ActionSpec>::err(text.error());
    }
    return EngineResult<ActionSpec>::ok(SnippetAction{std::move(text).value()});
}

EngineResult<ActionSpec> parseTransform(const YAML::Node& node, const std::string& where) {
    auto name = requireString(node, "operation", where);
    if (!name) {
        return EngineResult<ActionSpec>::err(name.error());
    }
    auto op = parseTransformOp(name.value());
    if (!op) {
        return EngineResult<ActionSpec>::err(fieldError(
            ErrorCode::UnknownTransform, where, "unknown transform operation '" + name.value() + "'"));
    }
    return EngineResult<ActionSpec>::ok(TransformAction{*op});
}

EngineResult<ActionSpec> parseNotify(const YAML::Node& node, const std::string& where,
                                     const std::string& pluginName) {
    NotifyAction action;

    auto message = requireString(node, "message", where);
    if (!message) {
        return EngineResult<ActionSpec>::err(message.error());
    }
    action.message = std::move(message).value();

    auto title = optionalString(node, "title", where, pluginName);
    if (!title) {
        return EngineResult<ActionSpec>::err(title.error());
    }
    action.title = std::move(title).value();

    return EngineResult<ActionSpec>::ok(std::move(action));
}

EngineResult<ActionSpec> parseChain(const YAML::Node& node, const std::string& where) {
    if (!node["actions"]) {
        return EngineResult<ActionSpec>::err(
            fieldError(ErrorCode::MissingField, where, "missing field 'actions'"));
    }
    auto members = optionalStringList(node, "actions", where);
    if (!members) {
        return EngineResult<ActionSpec>::err(members.error());
    }
    if (members.value().empty()) {
        return EngineResult<ActionSpec>::err(
            fieldError(ErrorCode::MissingField, where, "chain 'actions' must not be empty"));
    }
    return EngineResult<ActionSpec>::ok(ChainAction{std::move(members).value()});
}

EngineResult<ActionSpec> parseScript(const YAML::Node& node, const std::string& where) {
    ScriptAction action;

    auto engineName = requireString(node, "engine", where);
    if (!engineName) {
        return EngineResult<ActionSpec>::err(engineName.error());
    }
    auto engine = parseScriptEngine(engineName.value());
    if (!engine) {
        return EngineResult<ActionSpec>::err(fieldError(
            ErrorCode::UnknownEngine, where, "unknown script engine '" + engineName.value() + "'"));
    }
    action.engine = *engine;

    auto file = optionalString(node, "file", where);
    if (!file) {
        return EngineResult<ActionSpec>::err(file.error());
    }
    auto code = optionalString(node, "code", where);
    if (!code) {
        return EngineResult<ActionSpec>::err(code.error());
    }

    const bool hasFile = !file.value().empty();
    const bool hasCode = !code.value().empty();
    if (hasFile == hasCode) {
        return EngineResult<ActionSpec>::err(fieldError(
            ErrorCode::InvalidScriptSource, where, "exactly one of 'file' or 'code' is required"));
    }
    if (hasFile) {
        action.file = fs::path(file.value());
    } else {
        action.code = std::move(code).value();
    }

    auto entry = optionalString(node, "entry_point", where, "main");
    if (!entry) {
        return EngineResult<ActionSpec>::err(entry.error());
    }
    if (entry.value().empty()) {
        return EngineResult<ActionSpec>::err(
            fieldError(ErrorCode::MissingField, where, "'entry_point' must not be empty"));
    }
    action.entryPoint = std::move(entry).value();

    return EngineResult<ActionSpec>::ok(std::move(action));
}

EngineResult<Action> parseAction(const std::string& id, const YAML::Node& node,
                                 const std::string& pluginName) {
    std::string where = "action '" + id + "'";
    if (!node.IsMap()) {
        return EngineResult<Action>::err(
            fieldError(ErrorCode::FieldTypeMismatch, where, "must be a mapping"));
    }

    auto type = requireString(node, "type", where);
    if (!type) {
        return EngineResult<Action>::err(type.error());
    }

    EngineResult<ActionSpec> spec = EngineResult<ActionSpec>::err(EngineError(
        ErrorCode::UnknownActionType, where + ": unknown action type '" + type.value() + "'"));

    const auto& tag = type.value();
    if (tag == "external_command") {
        spec = parseExternalCommand(node, where);
    } else if (tag == "snippet") {
        spec = parseSnippet(node, where);
    } else if (tag == "transform") {
        spec = parseTransform(node, where);
    } else if (tag == "notify") {
        spec = parseNotify(node, where, pluginName);
    } else if (tag == "chain") {
        spec = parseChain(node, where);
    } else if (tag == "script") {
        spec = parseScript(node, where);
    }

    if (!spec) {
        return EngineResult<Action>::err(spec.error());
    }
    return EngineResult<Action>::ok(Action{id, std::move(spec).value()});
}

} // namespace

// ── Public API ──────────────────────────────────────────────────────────

std::optional<fs::path> findDefinitionFile(const fs::path& directory) {
    for (auto name : kDefinitionFileNames) {
        auto candidate = directory / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

EngineResult<Plugin> parsePluginDefinition(std::string_view document, const fs::path& directory) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return EngineResult<Plugin>::err(
            EngineError(ErrorCode::DefinitionParseError, std::string("parse error: ") + e.what()));
    }

    if (!root.IsMap()) {
        return EngineResult<Plugin>::err(
            EngineError(ErrorCode::FieldTypeMismatch, "definition root must be a mapping"));
    }

    Plugin plugin;
    plugin.directory = directory;

    auto name = requireString(root, "name", "");
    if (!name) {
        return EngineResult<Plugin>::err(name.error());
    }
    if (name.value().empty()) {
        return EngineResult<Plugin>::err(
            EngineError(ErrorCode::MissingField, "'name' must not be empty"));
    }
    plugin.info.name = std::move(name).value();

    for (auto [key, target] : {std::pair{"version", &plugin.info.version},
                               std::pair{"description", &plugin.info.description},
                               std::pair{"author", &plugin.info.author}}) {
        auto value = optionalString(root, key, "");
        if (!value) {
            return EngineResult<Plugin>::err(value.error());
        }
        *target = std::move(value).value();
    }

    auto triggers = root["triggers"];
    if (triggers && !triggers.IsNull()) {
        if (!triggers.IsSequence()) {
            return EngineResult<Plugin>::err(
                EngineError(ErrorCode::FieldTypeMismatch, "'triggers' must be a list"));
        }
        std::size_t index = 0;
        for (const auto& node : triggers) {
            auto trigger = parseTrigger(node, index++);
            if (!trigger) {
                return EngineResult<Plugin>::err(trigger.error());
            }
            plugin.triggers.push_back(std::move(trigger).value());
        }
    }

    auto actions = root["actions"];
    if (actions && !actions.IsNull()) {
        if (!actions.IsMap()) {
            return EngineResult<Plugin>::err(
                EngineError(ErrorCode::FieldTypeMismatch, "'actions' must be a mapping"));
        }
        for (auto it = actions.begin(); it != actions.end(); ++it) {
            if (!it->first.IsScalar()) {
                return EngineResult<Plugin>::err(
                    EngineError(ErrorCode::FieldTypeMismatch, "action ids must be strings"));
            }
            const auto id = it->first.Scalar();
            auto action = parseAction(id, it->second, plugin.info.name);
            if (!action) {
                return EngineResult<Plugin>::err(action.error());
            }
            plugin.actions.emplace(id, std::move(action).value());
        }
    }

    return EngineResult<Plugin>::ok(std::move(plugin));
}

EngineResult<Plugin> loadPluginDirectory(const fs::path& directory) {
    auto definition = findDefinitionFile(directory);
    if (!definition) {
        return EngineResult<Plugin>::err(EngineError(
            ErrorCode::DefinitionUnreadable, "no plugin definition in " + directory.string()));
    }

    std::ifstream in(*definition);
    if (!in) {
        return EngineResult<Plugin>::err(EngineError(
            ErrorCode::DefinitionUnreadable, "cannot read " + definition->string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto plugin = parsePluginDefinition(buffer.str(), directory);
    if (!plugin) {
        return plugin;
    }

    auto valid = validatePlugin(plugin.value());
    if (!valid) {
        return EngineResult<Plugin>::err(valid.error());
    }

    EDEXT_LOG_DEBUG(foundation::LogCategory::Registry,
                    "parsed " + definition->string() + " (" +
                        std::to_string(plugin.value().triggers.size()) + " triggers, " +
                        std::to_string(plugin.value().actions.size()) + " actions)");
    return plugin;
}

} // namespace edext::plugin

#include <gtest/gtest.h>

#include <string>

#include "edext/plugin/plugin_loader.hpp"
#include "support/plugin_tree.hpp"

using namespace edext::plugin;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::test::PluginTree;

namespace {

constexpr const char* kFormatter = R"(
name: formatter
version: "1.2.0"
description: Formats source files
author: edext
triggers:
  - id: fmt_cmd
    type: command
    action_id: fmt
    command_name: Format File
    shortcut: Ctrl+Shift+F
    context:
      languages: [python]
      file_patterns: ["*.py"]
  - id: fmt_save
    type: on_save
    action_id: fmt
actions:
  fmt:
    type: external_command
    command: black -q -
    input_mode: whole_file
    output_mode: replace_file
  header:
    type: snippet
    template: "# ${file_name}"
  shout:
    type: transform
    operation: uppercase
  hello:
    type: notify
    message: hi
  all:
    type: chain
    actions: [shout, hello]
  count:
    type: script
    engine: lua
    code: "function main() end"
)";

EngineResult<Plugin> parse(const std::string& doc) {
    return parsePluginDefinition(doc, "/plugins/p");
}

} // namespace

TEST(PluginLoaderTest, ParsesEveryActionKind) {
    auto result = parsePluginDefinition(kFormatter, "/plugins/formatter");
    ASSERT_TRUE(result) << result.error().message();
    const auto& plugin = result.value();

    EXPECT_EQ(plugin.name(), "formatter");
    EXPECT_EQ(plugin.info.version, "1.2.0");
    EXPECT_EQ(plugin.info.author, "edext");
    EXPECT_EQ(plugin.directory, std::filesystem::path("/plugins/formatter"));
    ASSERT_EQ(plugin.triggers.size(), 2u);
    ASSERT_EQ(plugin.actions.size(), 6u);

    const auto& cmd = plugin.triggers[0];
    EXPECT_EQ(cmd.kind, TriggerKind::Command);
    EXPECT_EQ(cmd.label(), "Format File");
    EXPECT_EQ(cmd.shortcut, "Ctrl+Shift+F");
    ASSERT_TRUE(cmd.context.has_value());
    EXPECT_EQ(cmd.context->languages, std::vector<std::string>{"python"});
    EXPECT_EQ(plugin.triggers[1].kind, TriggerKind::OnSave);
    EXPECT_FALSE(plugin.triggers[1].context.has_value());

    const auto* fmt = std::get_if<ExternalCommandAction>(&plugin.FindAction("fmt")->spec);
    ASSERT_NE(fmt, nullptr);
    EXPECT_EQ(fmt->command, "black -q -");
    EXPECT_EQ(fmt->inputMode, InputMode::WholeFile);
    EXPECT_EQ(fmt->outputMode, OutputMode::ReplaceFile);

    EXPECT_EQ(plugin.FindAction("header")->typeName(), "snippet");
    EXPECT_EQ(std::get<TransformAction>(plugin.FindAction("shout")->spec).operation,
              TransformOp::Uppercase);

    const auto& hello = std::get<NotifyAction>(plugin.FindAction("hello")->spec);
    EXPECT_EQ(hello.title, "formatter");
    EXPECT_EQ(hello.message, "hi");

    EXPECT_EQ(std::get<ChainAction>(plugin.FindAction("all")->spec).members,
              (std::vector<std::string>{"shout", "hello"}));

    const auto& script = std::get<ScriptAction>(plugin.FindAction("count")->spec);
    EXPECT_EQ(script.engine, ScriptEngineKind::Lua);
    EXPECT_TRUE(script.isInline());
    EXPECT_EQ(script.entryPoint, "main");
}

TEST(PluginLoaderTest, ExternalCommandDefaults) {
    auto result = parse(R"(
name: p
actions:
  run:
    type: external_command
    command: make
)");
    ASSERT_TRUE(result);
    const auto& run = std::get<ExternalCommandAction>(result.value().FindAction("run")->spec);
    EXPECT_EQ(run.inputMode, InputMode::None);
    EXPECT_EQ(run.outputMode, OutputMode::Discard);
}

TEST(PluginLoaderTest, JsonDefinitionParses) {
    auto result = parse(R"({"name": "j", "actions": {"a": {"type": "snippet", "text": "x"}}})");
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(std::get<SnippetAction>(result.value().FindAction("a")->spec).text, "x");
}

TEST(PluginLoaderTest, MissingNameIsRejected) {
    auto result = parse("version: '1'\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingField);
}

TEST(PluginLoaderTest, MalformedYamlIsParseError) {
    auto result = parse("name: [unterminated\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DefinitionParseError);
}

TEST(PluginLoaderTest, UnknownNamesAreRejected) {
    auto trigger = parse(R"(
name: p
triggers:
  - {id: t, type: on_close, action_id: a}
actions:
  a: {type: notify, message: m}
)");
    ASSERT_TRUE(trigger.hasError());
    EXPECT_EQ(trigger.error().code(), ErrorCode::UnknownTriggerType);
    EXPECT_NE(std::string(trigger.error().message()).find("'t'"), std::string::npos);

    auto action = parse("name: p\nactions:\n  a: {type: teleport}\n");
    EXPECT_EQ(action.error().code(), ErrorCode::UnknownActionType);

    auto op = parse("name: p\nactions:\n  a: {type: transform, operation: rot13}\n");
    EXPECT_EQ(op.error().code(), ErrorCode::UnknownTransform);

    auto mode = parse(
        "name: p\nactions:\n  a: {type: external_command, command: ls, output_mode: clipboard}\n");
    EXPECT_EQ(mode.error().code(), ErrorCode::UnknownOutputMode);

    auto engine = parse("name: p\nactions:\n  a: {type: script, engine: ruby, code: x}\n");
    EXPECT_EQ(engine.error().code(), ErrorCode::UnknownEngine);
}

TEST(PluginLoaderTest, ScriptNeedsExactlyOneSource) {
    auto both = parse(
        "name: p\nactions:\n  a: {type: script, engine: lua, code: x, file: a.lua}\n");
    ASSERT_TRUE(both.hasError());
    EXPECT_EQ(both.error().code(), ErrorCode::InvalidScriptSource);

    auto neither = parse("name: p\nactions:\n  a: {type: script, engine: python}\n");
    EXPECT_EQ(neither.error().code(), ErrorCode::InvalidScriptSource);
}

TEST(PluginLoaderTest, WrongFieldTypeIsReported) {
    auto result = parse("name: p\ntriggers: {id: t}\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FieldTypeMismatch);
}

TEST(PluginLoaderTest, SnippetTemplateFieldErrors) {
    auto listed = parse("name: p\nactions:\n  a: {type: snippet, template: [x, y]}\n");
    ASSERT_TRUE(listed.hasError());
    EXPECT_EQ(listed.error().code(), ErrorCode::FieldTypeMismatch);

    auto aliased = parse("name: p\nactions:\n  a: {type: snippet, text: {k: v}}\n");
    ASSERT_TRUE(aliased.hasError());
    EXPECT_EQ(aliased.error().code(), ErrorCode::FieldTypeMismatch);

    auto absent = parse("name: p\nactions:\n  a: {type: snippet}\n");
    ASSERT_TRUE(absent.hasError());
    EXPECT_EQ(absent.error().code(), ErrorCode::MissingField);
}

TEST(PluginLoaderTest, LoadDirectoryValidates) {
    PluginTree tree;
    tree.AddPlugin("dangling", R"(
name: dangling
triggers:
  - {id: t, type: command, action_id: missing}
)");
    auto result = loadPluginDirectory(tree.PluginDir("dangling"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DanglingActionReference);
}

TEST(PluginLoaderTest, DefinitionFileProbeOrder) {
    PluginTree tree;
    tree.AddFile("p", "plugin.json", R"({"name": "from_json"})");
    EXPECT_EQ(findDefinitionFile(tree.PluginDir("p"))->filename(), "plugin.json");

    tree.AddFile("p", "plugin.yml", "name: from_yml\n");
    EXPECT_EQ(findDefinitionFile(tree.PluginDir("p"))->filename(), "plugin.yml");

    auto loaded = loadPluginDirectory(tree.PluginDir("p"));
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().name(), "from_yml");
}

TEST(PluginLoaderTest, EmptyDirectoryIsUnreadable) {
    PluginTree tree;
    std::filesystem::create_directories(tree.PluginDir("empty"));
    EXPECT_FALSE(findDefinitionFile(tree.PluginDir("empty")).has_value());
    auto result = loadPluginDirectory(tree.PluginDir("empty"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DefinitionUnreadable);
}

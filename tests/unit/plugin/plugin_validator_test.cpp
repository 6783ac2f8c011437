#include <gtest/gtest.h>

#include <string>

#include "edext/plugin/plugin_validator.hpp"

using namespace edext::plugin;
using edext::foundation::ErrorCode;

namespace {

Plugin makePlugin() {
    Plugin plugin;
    plugin.info.name = "sample";
    plugin.directory = "/plugins/sample";
    plugin.actions.emplace("shout", Action{"shout", TransformAction{TransformOp::Uppercase}});
    plugin.actions.emplace("hello", Action{"hello", NotifyAction{"sample", "hi"}});
    plugin.triggers.push_back(Trigger{"t1", TriggerKind::Command, "shout", "", "", std::nullopt});
    return plugin;
}

void addChain(Plugin& plugin, const std::string& id, std::vector<std::string> members) {
    plugin.actions.insert_or_assign(id, Action{id, ChainAction{std::move(members)}});
}

} // namespace

TEST(PluginValidatorTest, AcceptsWellFormedPlugin) {
    auto plugin = makePlugin();
    addChain(plugin, "both", {"shout", "hello"});
    EXPECT_TRUE(validatePlugin(plugin));
}

TEST(PluginValidatorTest, DuplicateTriggerId) {
    auto plugin = makePlugin();
    plugin.triggers.push_back(plugin.triggers.front());
    auto result = validatePlugin(plugin);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateTriggerId);
}

TEST(PluginValidatorTest, DanglingTriggerAction) {
    auto plugin = makePlugin();
    plugin.triggers.front().actionId = "nowhere";
    auto result = validatePlugin(plugin);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DanglingActionReference);
    EXPECT_NE(std::string(result.error().message()).find("nowhere"), std::string::npos);
}

TEST(PluginValidatorTest, DanglingChainMember) {
    auto plugin = makePlugin();
    addChain(plugin, "broken", {"shout", "ghost"});
    auto result = validatePlugin(plugin);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DanglingChainMember);
}

TEST(PluginValidatorTest, TwoStepCycle) {
    auto plugin = makePlugin();
    addChain(plugin, "a", {"b"});
    addChain(plugin, "b", {"shout", "a"});

    auto cycle = findChainCycle(plugin);
    EXPECT_EQ(cycle, (std::vector<std::string>{"a", "b", "a"}));

    auto result = validatePlugin(plugin);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CyclicChain);
    EXPECT_EQ(result.error().message(), "cyclic chain: a -> b -> a");
    ASSERT_NE(result.error().context<std::vector<std::string>>(), nullptr);
}

TEST(PluginValidatorTest, SelfReferencingChain) {
    auto plugin = makePlugin();
    addChain(plugin, "loop", {"loop"});
    EXPECT_EQ(findChainCycle(plugin), (std::vector<std::string>{"loop", "loop"}));
}

TEST(PluginValidatorTest, SharedMemberIsNotACycle) {
    auto plugin = makePlugin();
    addChain(plugin, "inner", {"shout"});
    addChain(plugin, "outer", {"inner", "inner", "hello"});
    EXPECT_TRUE(findChainCycle(plugin).empty());
    EXPECT_TRUE(validatePlugin(plugin));
}

TEST(PluginValidatorTest, ScriptPathMustStayInside) {
    auto plugin = makePlugin();
    ScriptAction script;
    script.file = std::filesystem::path("../other/steal.lua");
    plugin.actions.emplace("s", Action{"s", script});

    auto result = validatePlugin(plugin);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ScriptPathEscapes);
}

TEST(PluginValidatorTest, ContainedRelativePaths) {
    EXPECT_TRUE(isContainedRelativePath("main.lua"));
    EXPECT_TRUE(isContainedRelativePath("scripts/../main.py"));
    EXPECT_FALSE(isContainedRelativePath("../main.py"));
    EXPECT_FALSE(isContainedRelativePath("scripts/../../main.py"));
    EXPECT_FALSE(isContainedRelativePath("/etc/passwd"));
    EXPECT_FALSE(isContainedRelativePath(""));
}

#include <gtest/gtest.h>

#include <chrono>

#include "edext/bridge/memory_bridge.hpp"
#include "edext/host/plugin_host.hpp"
#include "support/fake_script_engine.hpp"
#include "support/plugin_tree.hpp"

using namespace edext;
using bridge::MemoryBridge;
using foundation::EngineConfig;
using foundation::ErrorCode;
using host::PluginHost;

namespace {

constexpr const char* kAlpha = R"(
name: alpha
triggers:
  - id: upper_on_save
    type: on_save
    action_id: up
    context:
      languages: [python]
      file_patterns: ["*.py"]
  - id: upper
    type: command
    action_id: up
    command_name: Uppercase
    shortcut: Ctrl+U
actions:
  up: {type: transform, operation: uppercase}
)";

constexpr const char* kBeta = R"(
name: beta
triggers:
  - id: lint_on_save
    type: on_save
    action_id: lint
    context:
      languages: [javascript]
  - id: js_only
    type: command
    action_id: lint
    context:
      languages: [javascript]
actions:
  lint: {type: notify, message: linted}
)";

constexpr const char* kFailing = R"(
name: failing
triggers:
  - {id: save_boom, type: on_save, action_id: boom}
  - {id: save_note, type: on_save, action_id: note}
actions:
  boom:
    type: external_command
    command: "echo broken >&2; exit 1"
  note: {type: notify, message: still ran}
)";

constexpr const char* kDangling = R"(
name: broken
triggers:
  - {id: go, type: command, action_id: missing}
actions:
  present: {type: notify, message: unused}
)";

constexpr const char* kOpener = R"(
name: opener
triggers:
  - id: greet
    type: on_open
    action_id: hello
    context:
      file_patterns: ["*.py"]
  - {id: stamp_on_open, type: on_open, action_id: stamp}
actions:
  hello: {type: notify, title: Opened, message: welcome}
  stamp: {type: snippet, template: "# ${file_name}\n"}
)";

} // namespace

class PluginHostTest : public ::testing::Test {
protected:
    PluginHostTest() {
        config_.pluginRoot = tree_.Path();
        bridge_.SetFilePath(work_.Path() / "app.py");
    }

    std::unique_ptr<PluginHost> makeHost() {
        script::ScriptEngineRegistry engines;
        engines.Register(std::make_unique<test::FakeScriptEngine>());
        return std::make_unique<PluginHost>(config_, bridge_, std::move(engines));
    }

    test::PluginTree tree_;
    test::TempDir work_{"work"};
    EngineConfig config_;
    MemoryBridge bridge_{"print('hi')\n", std::nullopt, "python"};
};

TEST_F(PluginHostTest, StartLoadsPlugins) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("beta", kBeta);
    auto host = makeHost();

    auto started = host->Start();
    ASSERT_TRUE(started) << started.error().message();
    EXPECT_EQ(started.value()->PluginCount(), 2u);
    EXPECT_EQ(host->Snapshot()->generation(), 1u);
}

TEST_F(PluginHostTest, StartCreatesMissingRoot) {
    config_.pluginRoot = tree_.Path() / "fresh" / "plugins";
    auto host = makeHost();
    auto started = host->Start();
    ASSERT_TRUE(started) << started.error().message();
    EXPECT_TRUE(std::filesystem::is_directory(config_.pluginRoot));
    EXPECT_EQ(started.value()->PluginCount(), 0u);
}

TEST_F(PluginHostTest, StartWithoutRootCreationFails) {
    config_.pluginRoot = tree_.Path() / "absent";
    config_.createPluginRoot = false;
    auto host = makeHost();
    auto started = host->Start();
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), ErrorCode::PluginRootNotFound);
}

TEST_F(PluginHostTest, SaveFiresOnlyMatchingTriggers) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("beta", kBeta);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    auto outcomes = host->OnFileSaved();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].pluginName, "alpha");
    EXPECT_EQ(outcomes[0].triggerId, "upper_on_save");
    EXPECT_EQ(outcomes[0].actionId, "up");
    EXPECT_TRUE(outcomes[0].result);
    EXPECT_EQ(bridge_.text(), "PRINT('HI')\n");
    EXPECT_TRUE(bridge_.notifications().empty());

    EXPECT_TRUE(host->OnFileOpened().empty());
}

TEST_F(PluginHostTest, FailureIsNotifiedAndSiblingsStillRun) {
    tree_.AddPlugin("failing", kFailing);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    auto outcomes = host->OnFileSaved();
    ASSERT_EQ(outcomes.size(), 2u);
    ASSERT_TRUE(outcomes[0].result.hasError());
    EXPECT_EQ(outcomes[0].result.error().code(), ErrorCode::CommandFailed);
    EXPECT_TRUE(outcomes[1].result);

    ASSERT_EQ(bridge_.notifications().size(), 2u);
    EXPECT_EQ(bridge_.notifications()[0].title, "failing");
    EXPECT_EQ(bridge_.notifications()[0].message,
              "Action 'boom' failed: command exited with status 1: broken");
    EXPECT_EQ(bridge_.notifications()[1].message, "still ran");
}

TEST_F(PluginHostTest, OpenFiresOnOpenTriggersInOrder) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("opener", kOpener);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    auto outcomes = host->OnFileOpened();
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].pluginName, "opener");
    EXPECT_EQ(outcomes[0].triggerId, "greet");
    EXPECT_EQ(outcomes[1].triggerId, "stamp_on_open");
    EXPECT_TRUE(outcomes[0].result);
    EXPECT_TRUE(outcomes[1].result);

    ASSERT_EQ(bridge_.notifications().size(), 1u);
    EXPECT_EQ(bridge_.notifications()[0].title, "Opened");
    EXPECT_EQ(bridge_.notifications()[0].message, "welcome");
    EXPECT_EQ(bridge_.text(), "# app.py\nprint('hi')\n");
    // on_save triggers are untouched by an open.
    EXPECT_EQ(bridge_.revision(), 1u);
}

TEST_F(PluginHostTest, OpenRespectsFilePatterns) {
    tree_.AddPlugin("opener", kOpener);
    bridge_.SetFilePath(work_.Path() / "notes.txt");
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    auto outcomes = host->OnFileOpened();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].triggerId, "stamp_on_open");
    EXPECT_TRUE(bridge_.notifications().empty());
}

TEST_F(PluginHostTest, RejectedPluginsAreNotifiedOnStart) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("broken", kDangling);
    auto host = makeHost();

    auto started = host->Start();
    ASSERT_TRUE(started) << started.error().message();
    EXPECT_EQ(started.value()->PluginCount(), 1u);
    ASSERT_EQ(started.value()->errors().size(), 1u);

    ASSERT_EQ(bridge_.notifications().size(), 1u);
    const auto& note = bridge_.notifications()[0];
    EXPECT_EQ(note.title, "broken");
    EXPECT_EQ(note.message.rfind("Plugin 'broken' was not loaded: ", 0), 0u);
    EXPECT_NE(note.message.find("unknown action 'missing'"), std::string::npos);
}

TEST_F(PluginHostTest, RejectedPluginsAreNotifiedOnReload) {
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());
    EXPECT_TRUE(bridge_.notifications().empty());

    tree_.AddPlugin("broken", kDangling);
    ASSERT_TRUE(host->Reload());
    ASSERT_EQ(bridge_.notifications().size(), 1u);
    EXPECT_EQ(bridge_.notifications()[0].title, "broken");
}

TEST_F(PluginHostTest, FailedReloadIsNotified) {
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    std::filesystem::remove_all(tree_.Path());
    auto reloaded = host->Reload();
    ASSERT_TRUE(reloaded.hasError());
    EXPECT_EQ(reloaded.error().code(), ErrorCode::PluginRootNotFound);
    EXPECT_EQ(host->Snapshot()->PluginCount(), 1u);

    ASSERT_EQ(bridge_.notifications().size(), 1u);
    EXPECT_EQ(bridge_.notifications()[0].title, "Plugins");
    EXPECT_EQ(bridge_.notifications()[0].message.rfind("Plugins could not be loaded: ", 0), 0u);
}

TEST_F(PluginHostTest, StartFailureIsNotified) {
    config_.pluginRoot = tree_.Path() / "absent";
    config_.createPluginRoot = false;
    auto host = makeHost();
    ASSERT_TRUE(host->Start().hasError());
    ASSERT_EQ(bridge_.notifications().size(), 1u);
    EXPECT_EQ(bridge_.notifications()[0].title, "Plugins");
}

TEST_F(PluginHostTest, InactiveEditorSkipsEvents) {
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    bridge_.SetActive(false);
    EXPECT_TRUE(host->OnFileSaved().empty());
}

TEST_F(PluginHostTest, CommandsAndFiltering) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("beta", kBeta);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    auto all = host->Commands();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].label, "Uppercase");
    EXPECT_EQ(all[0].shortcut, "Ctrl+U");
    EXPECT_EQ(all[1].triggerId, "js_only");

    auto current = host->CommandsForCurrentFile();
    ASSERT_TRUE(current);
    ASSERT_EQ(current.value().size(), 1u);
    EXPECT_EQ(current.value()[0].pluginName, "alpha");
}

TEST_F(PluginHostTest, ExecuteTrigger) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("beta", kBeta);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    ASSERT_TRUE(host->ExecuteTrigger("alpha", "upper"));
    EXPECT_EQ(bridge_.text(), "PRINT('HI')\n");

    EXPECT_EQ(host->ExecuteTrigger("alpha", "nope").error().code(), ErrorCode::TriggerNotFound);
    EXPECT_EQ(host->ExecuteTrigger("ghost", "upper").error().code(), ErrorCode::TriggerNotFound);
    // Event triggers are not user-invocable.
    EXPECT_EQ(host->ExecuteTrigger("alpha", "upper_on_save").error().code(),
              ErrorCode::TriggerNotFound);
    // Context filter applies to commands as well.
    EXPECT_EQ(host->ExecuteTrigger("beta", "js_only").error().code(), ErrorCode::TriggerNotFound);
    EXPECT_TRUE(bridge_.notifications().empty());
}

TEST_F(PluginHostTest, ManualReloadPicksUpNewPlugins) {
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());
    auto before = host->Snapshot();

    tree_.AddPlugin("beta", kBeta);
    auto reloaded = host->Reload();
    ASSERT_TRUE(reloaded);
    EXPECT_EQ(reloaded.value()->PluginCount(), 2u);
    EXPECT_EQ(before->PluginCount(), 1u);
}

TEST_F(PluginHostTest, AutoReloadOnPoll) {
    config_.autoReload = true;
    config_.reloadDebounceMs = 0;
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());
    EXPECT_FALSE(host->Poll());

    tree_.AddPlugin("beta", kBeta);
    std::filesystem::last_write_time(
        tree_.Path(), std::filesystem::last_write_time(tree_.Path()) + std::chrono::seconds(2));

    EXPECT_TRUE(host->Poll());
    EXPECT_EQ(host->Snapshot()->PluginCount(), 2u);
    EXPECT_EQ(host->Snapshot()->generation(), 2u);
}

TEST_F(PluginHostTest, AutoReloadNotifiesRejectedPlugins) {
    config_.autoReload = true;
    config_.reloadDebounceMs = 0;
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    tree_.AddPlugin("broken", kDangling);
    std::filesystem::last_write_time(
        tree_.Path(), std::filesystem::last_write_time(tree_.Path()) + std::chrono::seconds(2));

    EXPECT_TRUE(host->Poll());
    ASSERT_EQ(bridge_.notifications().size(), 1u);
    EXPECT_EQ(bridge_.notifications()[0].title, "broken");
}

TEST_F(PluginHostTest, PollWithoutAutoReloadDoesNothing) {
    tree_.AddPlugin("alpha", kAlpha);
    auto host = makeHost();
    ASSERT_TRUE(host->Start());
    tree_.AddPlugin("beta", kBeta);
    EXPECT_FALSE(host->Poll());
    EXPECT_EQ(host->Snapshot()->PluginCount(), 1u);
}

TEST_F(PluginHostTest, SaveRespectsLanguageAndTransformsSelection) {
    tree_.AddPlugin("shouter", R"(
name: shouter
triggers:
  - id: shout
    type: on_save
    action_id: up
    context:
      languages: [alpha]
actions:
  up: {type: transform, operation: uppercase}
)");
    auto host = makeHost();
    ASSERT_TRUE(host->Start());

    ASSERT_TRUE(bridge_.SetText("say hi"));
    bridge_.SetLanguage("beta");
    ASSERT_TRUE(bridge_.SelectText("hi"));
    EXPECT_TRUE(host->OnFileSaved().empty());
    EXPECT_EQ(bridge_.GetSelection().value(), "hi");

    bridge_.SetLanguage("alpha");
    auto outcomes = host->OnFileSaved();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].result);
    EXPECT_EQ(bridge_.GetSelection().value(), "HI");
    EXPECT_EQ(bridge_.text(), "say HI");
}

#include <gtest/gtest.h>

#include "edext/plugin/plugin_registry.hpp"
#include "support/plugin_tree.hpp"

using namespace edext::plugin;
using edext::foundation::ErrorCode;
using edext::test::PluginTree;

namespace {

constexpr const char* kAlpha = R"(
name: alpha
triggers:
  - {id: up, type: command, action_id: up}
actions:
  up: {type: transform, operation: uppercase}
)";

constexpr const char* kBeta = R"(
name: beta
triggers:
  - {id: hi, type: on_save, action_id: hi}
actions:
  hi: {type: notify, message: saved}
)";

} // namespace

class PluginRegistryTest : public ::testing::Test {
protected:
    PluginTree tree_;
};

TEST_F(PluginRegistryTest, LoadsPluginsInDirectoryOrder) {
    tree_.AddPlugin("b_beta", kBeta);
    tree_.AddPlugin("a_alpha", kAlpha);

    auto snapshot = PluginRegistry::Load(tree_.Path());
    ASSERT_TRUE(snapshot) << snapshot.error().message();
    ASSERT_EQ(snapshot.value()->PluginCount(), 2u);
    EXPECT_EQ(snapshot.value()->plugins()[0]->name(), "alpha");
    EXPECT_EQ(snapshot.value()->plugins()[1]->name(), "beta");
    EXPECT_TRUE(snapshot.value()->errors().empty());
    EXPECT_NE(snapshot.value()->FindPlugin("beta"), nullptr);
    EXPECT_EQ(snapshot.value()->FindPlugin("gamma"), nullptr);
}

TEST_F(PluginRegistryTest, BrokenPluginDoesNotAffectSiblings) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("broken", "name: broken\nactions:\n  x: {type: teleport}\n");
    tree_.AddPlugin("beta", kBeta);

    auto snapshot = PluginRegistry::Load(tree_.Path());
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot.value()->PluginCount(), 2u);
    ASSERT_EQ(snapshot.value()->errors().size(), 1u);
    EXPECT_EQ(snapshot.value()->errors()[0].directory, tree_.PluginDir("broken"));
    EXPECT_EQ(snapshot.value()->errors()[0].error.code(), ErrorCode::UnknownActionType);
}

TEST_F(PluginRegistryTest, DirectoriesWithoutDefinitionAreIgnored) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddFile("assets", "readme.txt", "not a plugin");
    tree_.WriteFile("stray.yaml", "name: stray\n");

    auto snapshot = PluginRegistry::Load(tree_.Path());
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot.value()->PluginCount(), 1u);
    EXPECT_TRUE(snapshot.value()->errors().empty());
}

TEST_F(PluginRegistryTest, DuplicateNameIsRejected) {
    tree_.AddPlugin("one", kAlpha);
    tree_.AddPlugin("two", kAlpha);

    auto snapshot = PluginRegistry::Load(tree_.Path());
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot.value()->PluginCount(), 1u);
    ASSERT_EQ(snapshot.value()->errors().size(), 1u);
    EXPECT_EQ(snapshot.value()->errors()[0].directory, tree_.PluginDir("two"));
}

TEST_F(PluginRegistryTest, MissingRootIsDiscoveryError) {
    auto snapshot = PluginRegistry::Load(tree_.Path() / "absent");
    ASSERT_TRUE(snapshot.hasError());
    EXPECT_EQ(snapshot.error().code(), ErrorCode::PluginRootNotFound);
    EXPECT_TRUE(edext::foundation::isDiscoveryError(snapshot.error().code()));
}

TEST_F(PluginRegistryTest, RootThatIsAFileIsUnreadable) {
    auto file = tree_.WriteFile("file", "x");
    auto snapshot = PluginRegistry::Load(file);
    ASSERT_TRUE(snapshot.hasError());
    EXPECT_EQ(snapshot.error().code(), ErrorCode::PluginRootUnreadable);
}

TEST_F(PluginRegistryTest, ReloadIsIdempotent) {
    tree_.AddPlugin("alpha", kAlpha);
    tree_.AddPlugin("broken", "name: [\n");
    PluginRegistry registry(tree_.Path());

    auto first = registry.Reload();
    auto second = registry.Reload();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value()->generation(), 1u);
    EXPECT_EQ(second.value()->generation(), 2u);
    EXPECT_TRUE(first.value()->EquivalentTo(*second.value()));
}

TEST_F(PluginRegistryTest, ReloadPublishesNewSnapshotOnly) {
    tree_.AddPlugin("alpha", kAlpha);
    PluginRegistry registry(tree_.Path());
    EXPECT_EQ(registry.Snapshot()->generation(), 0u);
    EXPECT_EQ(registry.Snapshot()->PluginCount(), 0u);

    ASSERT_TRUE(registry.Reload());
    auto held = registry.Snapshot();
    ASSERT_EQ(held->PluginCount(), 1u);

    tree_.AddPlugin("beta", kBeta);
    ASSERT_TRUE(registry.Reload());

    EXPECT_EQ(held->PluginCount(), 1u);
    EXPECT_EQ(registry.Snapshot()->PluginCount(), 2u);
    EXPECT_FALSE(held->EquivalentTo(*registry.Snapshot()));
}

TEST_F(PluginRegistryTest, FailedReloadKeepsCurrentSnapshot) {
    tree_.WriteFile("root/alpha/plugin.yaml", kAlpha);
    auto root = tree_.Path() / "root";

    PluginRegistry registry(root);
    ASSERT_TRUE(registry.Reload());
    std::filesystem::remove_all(root);

    auto reloaded = registry.Reload();
    ASSERT_TRUE(reloaded.hasError());
    EXPECT_EQ(registry.Snapshot()->PluginCount(), 1u);
    EXPECT_EQ(registry.Snapshot()->generation(), 1u);
}

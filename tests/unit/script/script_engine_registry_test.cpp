#include <gtest/gtest.h>

#include "edext/script/script_engine_registry.hpp"
#include "support/fake_script_engine.hpp"

using namespace edext::script;
using edext::foundation::EngineConfig;
using edext::foundation::ErrorCode;
using edext::plugin::ScriptEngineKind;
using edext::test::FakeScriptEngine;

TEST(ScriptEngineRegistryTest, EmptyRegistryHasNoEngines) {
    ScriptEngineRegistry registry;
    EXPECT_TRUE(registry.AvailableKinds().empty());

    auto found = registry.Find(ScriptEngineKind::Lua);
    ASSERT_TRUE(found.hasError());
    EXPECT_EQ(found.error().code(), ErrorCode::EngineUnavailable);
    EXPECT_EQ(found.error().message(), "[lua] script engine is not available");
}

TEST(ScriptEngineRegistryTest, DefaultRegistersBothEngines) {
    auto registry = ScriptEngineRegistry::CreateDefault(EngineConfig{});
    EXPECT_TRUE(registry.IsAvailable(ScriptEngineKind::Lua));
    EXPECT_TRUE(registry.IsAvailable(ScriptEngineKind::Python));
    EXPECT_EQ(registry.Find(ScriptEngineKind::Python).value()->name(), "python");
}

TEST(ScriptEngineRegistryTest, ConfigDisablesEngine) {
    EngineConfig config;
    config.pythonEnabled = false;
    auto registry = ScriptEngineRegistry::CreateDefault(config);

    EXPECT_EQ(registry.AvailableKinds(), std::vector<ScriptEngineKind>{ScriptEngineKind::Lua});
    auto found = registry.Find(ScriptEngineKind::Python);
    ASSERT_TRUE(found.hasError());
    EXPECT_EQ(found.error().message(), "[python] script engine is disabled");

    registry.SetEnabled(ScriptEngineKind::Python, true);
    EXPECT_TRUE(registry.IsAvailable(ScriptEngineKind::Python));
}

TEST(ScriptEngineRegistryTest, RegisterReplacesSameKind) {
    ScriptEngineRegistry registry;
    auto first = std::make_unique<FakeScriptEngine>();
    auto second = std::make_unique<FakeScriptEngine>();
    auto* secondPtr = second.get();

    registry.Register(std::move(first));
    registry.Register(std::move(second));
    EXPECT_EQ(registry.Find(ScriptEngineKind::Lua).value(), secondPtr);
    EXPECT_EQ(registry.AvailableKinds().size(), 1u);
}

TEST(ScriptEngineRegistryTest, NullEngineIsIgnored) {
    ScriptEngineRegistry registry;
    registry.Register(nullptr);
    EXPECT_TRUE(registry.AvailableKinds().empty());
}

TEST(ScriptEngineRegistryTest, RegistryIsMovable) {
    ScriptEngineRegistry source;
    source.Register(std::make_unique<FakeScriptEngine>(ScriptEngineKind::Python), false);

    ScriptEngineRegistry moved = std::move(source);
    EXPECT_FALSE(moved.IsAvailable(ScriptEngineKind::Python));
    moved.SetEnabled(ScriptEngineKind::Python, true);
    EXPECT_TRUE(moved.IsAvailable(ScriptEngineKind::Python));
}

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "edext/foundation/engine_config.hpp"

using namespace edext::foundation;

TEST(EngineConfigTest, DefaultsWhenEmpty) {
    ConfigManager config;
    auto cfg = EngineConfig::FromConfig(config);

    EXPECT_FALSE(cfg.pluginRoot.empty());
    EXPECT_TRUE(cfg.createPluginRoot);
    EXPECT_FALSE(cfg.autoReload);
    EXPECT_EQ(cfg.reloadDebounceMs, 200u);
    EXPECT_EQ(cfg.shell, "/bin/sh");
    EXPECT_EQ(cfg.outputLimitBytes, 4u * 1024u * 1024u);
    EXPECT_EQ(cfg.dateFormat, "%Y-%m-%d");
    EXPECT_EQ(cfg.timeFormat, "%H:%M:%S");
    EXPECT_EQ(cfg.untitledPlaceholder, "untitled");
    EXPECT_TRUE(cfg.luaEnabled);
    EXPECT_TRUE(cfg.pythonEnabled);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
}

TEST(EngineConfigTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
plugins:
  root: /opt/edext/plugins
  create_root: false
  auto_reload: true
  reload_debounce_ms: 50
actions:
  shell: /bin/bash
  output_limit_bytes: 2048
snippet:
  date_format: "%d.%m.%Y"
  time_format: "%H:%M"
  untitled: scratch
scripts:
  lua:
    enabled: false
  python:
    enabled: false
logging:
  level: warn
)"));

    auto cfg = EngineConfig::FromConfig(config);
    EXPECT_EQ(cfg.pluginRoot, "/opt/edext/plugins");
    EXPECT_FALSE(cfg.createPluginRoot);
    EXPECT_TRUE(cfg.autoReload);
    EXPECT_EQ(cfg.reloadDebounceMs, 50u);
    EXPECT_EQ(cfg.shell, "/bin/bash");
    EXPECT_EQ(cfg.outputLimitBytes, 2048u);
    EXPECT_EQ(cfg.dateFormat, "%d.%m.%Y");
    EXPECT_EQ(cfg.timeFormat, "%H:%M");
    EXPECT_EQ(cfg.untitledPlaceholder, "scratch");
    EXPECT_FALSE(cfg.luaEnabled);
    EXPECT_FALSE(cfg.pythonEnabled);
    EXPECT_EQ(cfg.logLevel, LogLevel::Warning);
}

TEST(EngineConfigTest, UnknownLogLevelKeepsDefault) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  level: chatty\n"));
    EXPECT_EQ(EngineConfig::FromConfig(config).logLevel, LogLevel::Info);
}

TEST(EngineConfigTest, DefaultPluginRootFollowsXdg) {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string savedValue = saved != nullptr ? saved : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    EXPECT_EQ(defaultPluginRoot(), std::filesystem::path("/tmp/xdg-test/edext/plugins"));

    if (saved != nullptr) {
        ::setenv("XDG_CONFIG_HOME", savedValue.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}

TEST(EngineConfigTest, ConfigPathPrecedence) {
    const char* saved = std::getenv(kConfigPathEnv);
    std::string savedValue = saved != nullptr ? saved : "";

    ::setenv(kConfigPathEnv, "/env/config.yaml", 1);
    EXPECT_EQ(resolveConfigPath("/cli/config.yaml", "/default.yaml"), "/cli/config.yaml");
    EXPECT_EQ(resolveConfigPath({}, "/default.yaml"), "/env/config.yaml");

    ::unsetenv(kConfigPathEnv);
    EXPECT_EQ(resolveConfigPath({}, "/default.yaml"), "/default.yaml");

    if (saved != nullptr) {
        ::setenv(kConfigPathEnv, savedValue.c_str(), 1);
    }
}

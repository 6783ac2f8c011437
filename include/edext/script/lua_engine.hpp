#pragma once

/// @file lua_engine.hpp
/// @brief LuaEngine: sandboxed Lua 5.4 adapter (engine identifier "lua").

#include "edext/script/script_engine.hpp"

namespace edext::script {

/// Runs each script in a fresh lua_State.
///
/// Only the base, string, table, math and utf8 libraries are opened, and
/// dofile, loadfile, load, loadstring, require and collectgarbage are
/// removed from the base library. `print` writes to the Script log
/// category. The capability bridge is available as the global table
/// `editor`; its functions accept both `editor.f(x)` and `editor:f(x)`.
class LuaEngine final : public IScriptEngine {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "lua"; }

    [[nodiscard]] plugin::ScriptEngineKind kind() const noexcept override {
        return plugin::ScriptEngineKind::Lua;
    }

    [[nodiscard]] foundation::EngineResult<void>
    Run(const ScriptSource& source, std::string_view entryPoint,
        bridge::ICapabilityBridge& bridge) override;
};

} // namespace edext::script

/// @file script_engine_registry.cpp
/// @brief Engine lookup and default engine set.

#include "edext/script/script_engine_registry.hpp"

#include "edext/foundation/engine_logger.hpp"
#include "edext/script/lua_engine.hpp"
#include "edext/script/python_engine.hpp"

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;
using edext::foundation::LogCategory;
using edext::plugin::ScriptEngineKind;

namespace edext::script {

ScriptEngineRegistry ScriptEngineRegistry::CreateDefault(const foundation::EngineConfig& config) {
    ScriptEngineRegistry registry;
    registry.Register(std::make_unique<LuaEngine>(), config.luaEnabled);
    registry.Register(std::make_unique<PythonEngine>(), config.pythonEnabled);
    return registry;
}

void ScriptEngineRegistry::Register(std::unique_ptr<IScriptEngine> engine, bool enabled) {
    if (!engine) {
        return;
    }
    auto kind = engine->kind();
    EDEXT_LOG_DEBUG(LogCategory::Script, "registered script engine '" +
                                             std::string(engine->name()) + "'" +
                                             (enabled ? "" : " (disabled)"));
    engines_[kind] = Entry{std::move(engine), enabled};
}

void ScriptEngineRegistry::SetEnabled(ScriptEngineKind kind, bool enabled) {
    auto it = engines_.find(kind);
    if (it != engines_.end()) {
        it->second.enabled = enabled;
    }
}

EngineResult<IScriptEngine*> ScriptEngineRegistry::Find(ScriptEngineKind kind) const {
    auto it = engines_.find(kind);
    if (it == engines_.end() || !it->second.enabled) {
        return EngineResult<IScriptEngine*>::err(EngineError(
            ErrorCode::EngineUnavailable,
            "[" + std::string(plugin::scriptEngineName(kind)) + "] script engine is " +
                (it == engines_.end() ? "not available" : "disabled")));
    }
    return EngineResult<IScriptEngine*>::ok(it->second.engine.get());
}

bool ScriptEngineRegistry::IsAvailable(ScriptEngineKind kind) const {
    auto it = engines_.find(kind);
    return it != engines_.end() && it->second.enabled;
}

std::vector<ScriptEngineKind> ScriptEngineRegistry::AvailableKinds() const {
    std::vector<ScriptEngineKind> kinds;
    for (const auto& [kind, entry] : engines_) {
        if (entry.enabled) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

} // namespace edext::script

#pragma once

/// @file script_engine_registry.hpp
/// @brief ScriptEngineRegistry: engine identifier to adapter instance.

#include <map>
#include <memory>
#include <vector>

#include "edext/foundation/engine_config.hpp"
#include "edext/foundation/engine_result.hpp"
#include "edext/script/script_engine.hpp"

namespace edext::script {

/// Owns the script engine adapters available to the action executor.
///
/// An engine may be registered but disabled; lookups of a disabled or
/// missing engine fail with EngineUnavailable.
class ScriptEngineRegistry {
public:
    ScriptEngineRegistry() = default;

    ScriptEngineRegistry(const ScriptEngineRegistry&) = delete;
    ScriptEngineRegistry& operator=(const ScriptEngineRegistry&) = delete;
    ScriptEngineRegistry(ScriptEngineRegistry&&) noexcept = default;
    ScriptEngineRegistry& operator=(ScriptEngineRegistry&&) noexcept = default;

    /// Registry with the built-in Lua and Python engines, enabled per
    /// scripts.lua.enabled / scripts.python.enabled.
    [[nodiscard]] static ScriptEngineRegistry CreateDefault(const foundation::EngineConfig& config);

    /// Register @p engine, replacing any engine of the same kind.
    void Register(std::unique_ptr<IScriptEngine> engine, bool enabled = true);

    void SetEnabled(plugin::ScriptEngineKind kind, bool enabled);

    /// Adapter for @p kind.
    [[nodiscard]] foundation::EngineResult<IScriptEngine*> Find(plugin::ScriptEngineKind kind) const;

    [[nodiscard]] bool IsAvailable(plugin::ScriptEngineKind kind) const;

    /// Kinds that are registered and enabled.
    [[nodiscard]] std::vector<plugin::ScriptEngineKind> AvailableKinds() const;

private:
    struct Entry {
        std::unique_ptr<IScriptEngine> engine;
        bool enabled = true;
    };

    std::map<plugin::ScriptEngineKind, Entry> engines_;
};

} // namespace edext::script

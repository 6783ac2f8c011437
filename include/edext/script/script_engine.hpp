#pragma once

/// @file script_engine.hpp
/// @brief IScriptEngine: one polymorphic interface over the embedded interpreters.

#include <string>
#include <string_view>

#include "edext/bridge/capability_bridge.hpp"
#include "edext/foundation/engine_result.hpp"
#include "edext/plugin/action_types.hpp"

namespace edext::script {

/// Source text handed to an engine, with a chunk name for diagnostics.
struct ScriptSource {
    std::string code;
    std::string name;  ///< File name or "<plugin>:<action>" for inline code.
    std::string notifyTitle;  ///< Title used by editor.notify() when none is given.
};

/// Embedded interpreter adapter.
///
/// Run() loads @p source into a fresh sandboxed environment, injects the
/// capability bridge as the global `editor`, looks up @p entryPoint and
/// calls it with no arguments. Nothing survives between runs.
///
/// All failures (syntax, runtime, missing entry point, sandbox rejection)
/// are returned as Script-class errors whose message starts with the
/// engine tag, e.g. "[lua] ..." or "[python] ...".
class IScriptEngine {
public:
    virtual ~IScriptEngine() = default;

    /// Identifier used in definition files ("lua", "python").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual plugin::ScriptEngineKind kind() const noexcept = 0;

    [[nodiscard]] virtual foundation::EngineResult<void>
    Run(const ScriptSource& source, std::string_view entryPoint, bridge::ICapabilityBridge& bridge) = 0;
};

} // namespace edext::script

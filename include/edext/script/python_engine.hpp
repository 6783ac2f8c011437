#pragma once

/// @file python_engine.hpp
/// @brief PythonEngine: embedded CPython adapter (engine identifier "python").

#include "edext/script/script_engine.hpp"

namespace edext::script {

/// Runs scripts in the process-wide embedded interpreter.
///
/// The interpreter is started on first use and lives until process exit.
/// Each run gets a fresh globals dict whose `__builtins__` is a restricted
/// subset (no __import__, open, exec, eval, compile, getattr, type, ...).
/// Before execution the source is parsed with the `ast` module and
/// rejected with SandboxViolation if it contains an import statement or
/// names a dunder attribute or identifier.
///
/// @note Blocklist sandboxing reduces, but does not eliminate, the ways a
///       script can reach the host. Plugins remain trusted code.
class PythonEngine final : public IScriptEngine {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "python"; }

    [[nodiscard]] plugin::ScriptEngineKind kind() const noexcept override {
        return plugin::ScriptEngineKind::Python;
    }

    [[nodiscard]] foundation::EngineResult<void>
    Run(const ScriptSource& source, std::string_view entryPoint,
        bridge::ICapabilityBridge& bridge) override;
};

} // namespace edext::script

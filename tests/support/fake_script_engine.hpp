#pragma once

/// @file fake_script_engine.hpp
/// @brief Recording IScriptEngine for executor and host tests.

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "edext/script/script_engine.hpp"

namespace edext::test {

/// Records every Run() and optionally inserts text or fails.
class FakeScriptEngine final : public script::IScriptEngine {
public:
    struct Call {
        script::ScriptSource source;
        std::string entryPoint;
    };

    explicit FakeScriptEngine(plugin::ScriptEngineKind kind = plugin::ScriptEngineKind::Lua)
        : kind_(kind) {}

    [[nodiscard]] std::string_view name() const noexcept override {
        return plugin::scriptEngineName(kind_);
    }

    [[nodiscard]] plugin::ScriptEngineKind kind() const noexcept override { return kind_; }

    [[nodiscard]] foundation::EngineResult<void>
    Run(const script::ScriptSource& source, std::string_view entryPoint,
        bridge::ICapabilityBridge& bridge) override {
        calls_->push_back({source, std::string(entryPoint)});
        if (failWith_) {
            return foundation::EngineResult<void>::err(*failWith_);
        }
        if (!insert_.empty()) {
            return bridge.InsertText(insert_);
        }
        return foundation::EngineResult<void>::ok();
    }

    /// Calls survive the engine being moved into a registry.
    [[nodiscard]] std::shared_ptr<std::vector<Call>> calls() const { return calls_; }

    void InsertOnRun(std::string text) { insert_ = std::move(text); }

    void FailWith(foundation::EngineError error) { failWith_ = std::move(error); }

private:
    plugin::ScriptEngineKind kind_;
    std::shared_ptr<std::vector<Call>> calls_ = std::make_shared<std::vector<Call>>();
    std::string insert_;
    std::optional<foundation::EngineError> failWith_;
};

} // namespace edext::test

#pragma once

/// @file engine_error.hpp
/// @brief Engine error type used with Result<T, EngineError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "edext/foundation/error_code.hpp"

namespace edext::foundation {

/// Error carrying a categorized code, a human-readable message and optional
/// type-erased context (e.g. a CommandOutput for a failed external command).
class EngineError {
public:
    EngineError() = default;

    explicit EngineError(ErrorCode code)
        : code_(code) {}

    EngineError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    EngineError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The taxonomy class that produced this error ("Action", "Script", ...).
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if the type differs or no context).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// Copy of this error with @p prefix prepended to the message.
    /// Code and context are preserved.
    [[nodiscard]] EngineError withPrefix(std::string_view prefix) const {
        std::string msg;
        msg.reserve(prefix.size() + message_.size());
        msg += prefix;
        msg += message_;
        return EngineError(code_, std::move(msg), context_);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace edext::foundation

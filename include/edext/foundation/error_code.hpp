#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the extension engine.

#include <cstdint>
#include <string_view>

namespace edext::foundation {

/// Error codes categorized by taxonomy class using hex ranges.
///
/// Each class occupies a 256-value range (0x100), so the class of a failure
/// (discovery, validation, action, script, bridge) can be recovered from the
/// code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Discovery (0x0100 - 0x01FF)
    DiscoveryFailed = 0x0100,
    PluginRootNotFound = 0x0101,
    PluginRootUnreadable = 0x0102,
    DefinitionUnreadable = 0x0103,

    // Validation (0x0200 - 0x02FF)
    ValidationFailed = 0x0200,
    DefinitionParseError = 0x0201,
    MissingField = 0x0202,
    FieldTypeMismatch = 0x0203,
    UnknownTriggerType = 0x0204,
    UnknownActionType = 0x0205,
    DuplicateTriggerId = 0x0206,
    DanglingActionReference = 0x0207,
    DanglingChainMember = 0x0208,
    CyclicChain = 0x0209,
    UnknownTransform = 0x020A,
    UnknownInputMode = 0x020B,
    UnknownOutputMode = 0x020C,
    UnknownEngine = 0x020D,
    InvalidScriptSource = 0x020E,
    ScriptPathEscapes = 0x020F,

    // Action (0x0300 - 0x03FF)
    ActionFailed = 0x0300,
    ActionNotFound = 0x0301,
    TriggerNotFound = 0x0302,
    CommandFailed = 0x0303,
    CommandSpawnFailed = 0x0304,
    UnsupportedModeCombination = 0x0305,
    ChainAborted = 0x0306,

    // Script (0x0400 - 0x04FF)
    ScriptFailed = 0x0400,
    ScriptLoadFailed = 0x0401,
    ScriptSyntaxError = 0x0402,
    ScriptRuntimeError = 0x0403,
    EntryPointNotFound = 0x0404,
    ScriptPathRejected = 0x0405,
    EngineUnavailable = 0x0406,
    SandboxViolation = 0x0407,

    // Bridge (0x0500 - 0x05FF)
    BridgeError = 0x0500,
    NoActiveEditor = 0x0501,
    NoFilePath = 0x0502,
    InvalidCursor = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0700 - 0x07FF)
    LoggerError = 0x0700,
    LoggerNotInitialized = 0x0701,
    LoggerFlushFailed = 0x0702,
};

/// Return the taxonomy class name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Discovery";
        case 0x0200: return "Validation";
        case 0x0300: return "Action";
        case 0x0400: return "Script";
        case 0x0500: return "Bridge";
        case 0x0600: return "Config";
        case 0x0700: return "Logger";
        default: return "Unknown";
    }
}

/// Convenience predicates for the error taxonomy.
constexpr bool isDiscoveryError(ErrorCode code) { return errorSubsystem(code) == "Discovery"; }
constexpr bool isValidationError(ErrorCode code) { return errorSubsystem(code) == "Validation"; }
constexpr bool isActionError(ErrorCode code) { return errorSubsystem(code) == "Action"; }
constexpr bool isScriptError(ErrorCode code) { return errorSubsystem(code) == "Script"; }
constexpr bool isBridgeError(ErrorCode code) { return errorSubsystem(code) == "Bridge"; }

} // namespace edext::foundation

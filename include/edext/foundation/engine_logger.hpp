#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping the kcenon common logger interface.
///
/// Category-based filtering, structured context (plugin, trigger, action,
/// engine) and per-category runtime log levels.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "edext/foundation/engine_result.hpp"

namespace edext::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Host facade, configuration
    Registry = 1, ///< Discovery, validation, reload
    Trigger  = 2, ///< Trigger matching and dispatch
    Action   = 3, ///< Built-in action execution
    Script   = 4, ///< Embedded interpreters
    Bridge   = 5  ///< Capability bridge calls
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Registry", "Trigger", "Action", "Script", "Bridge"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "WARNING", "warn", ...). Case-insensitive.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.plugin = "formatter";
///   ctx.action = "format_json";
///   ctx.extra["exit_code"] = "2";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Action,
///                         "command failed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> plugin;
    std::optional<std::string> trigger;
    std::optional<std::string> action;
    std::optional<std::string> engine;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interface.
///
/// Messages are routed to a named logger "edext.<Category>" registered in
/// GlobalLoggerRegistry, falling back to the registry's default logger.
/// PIMPL keeps the kcenon headers out of the public API.
///
/// Default levels: Info for every category except Script (Debug).
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum level for every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    EngineResult<void> flush();

    /// Process-wide logger instance.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace edext::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name EDEXT_LOG Macros
/// EDEXT_MIN_LOG_LEVEL can be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef EDEXT_MIN_LOG_LEVEL
    #define EDEXT_MIN_LOG_LEVEL 0
#endif

#define EDEXT_LOG(level, cat, msg)                                                   \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= EDEXT_MIN_LOG_LEVEL &&                        \
            ::edext::foundation::EngineLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::edext::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define EDEXT_LOG_DEBUG(cat, msg) \
    EDEXT_LOG(::edext::foundation::LogLevel::Debug, (cat), (msg))

#define EDEXT_LOG_INFO(cat, msg) \
    EDEXT_LOG(::edext::foundation::LogLevel::Info, (cat), (msg))

#define EDEXT_LOG_WARN(cat, msg) \
    EDEXT_LOG(::edext::foundation::LogLevel::Warning, (cat), (msg))

#define EDEXT_LOG_ERROR(cat, msg) \
    EDEXT_LOG(::edext::foundation::LogLevel::Error, (cat), (msg))

/// @}

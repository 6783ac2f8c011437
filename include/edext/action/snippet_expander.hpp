#pragma once

/// @file snippet_expander.hpp
/// @brief ${token} expansion for snippet templates and command lines.

#include <chrono>
#include <string>
#include <string_view>

#include "edext/bridge/execution_context.hpp"

namespace edext::action {

/// Values substituted for the recognised tokens.
struct SnippetTokens {
    std::string fileName;  ///< ${file_name}
    std::string filePath;  ///< ${file_path}
    std::string date;      ///< ${date}
    std::string time;      ///< ${time}
};

/// strftime formats and the unsaved-buffer placeholder.
struct SnippetFormat {
    std::string dateFormat = "%Y-%m-%d";
    std::string timeFormat = "%H:%M:%S";
    std::string untitled = "untitled";
};

/// Token values for @p ctx at @p now (local time).
[[nodiscard]] SnippetTokens
snippetTokensFor(const bridge::ExecutionContext& ctx,
                 const SnippetFormat& format,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// Replace recognised tokens in @p tmpl. Unknown tokens and unterminated
/// "${" sequences are copied verbatim.
[[nodiscard]] std::string expandSnippet(std::string_view tmpl, const SnippetTokens& tokens);

/// Same as expandSnippet(), but ${file_name} and ${file_path} are
/// single-quoted for /bin/sh.
[[nodiscard]] std::string expandCommand(std::string_view tmpl, const SnippetTokens& tokens);

/// POSIX shell single-quoting: 'it'\''s'.
[[nodiscard]] std::string shellQuote(std::string_view value);

/// Format @p tp with strftime(@p format) in local time.
[[nodiscard]] std::string formatLocalTime(std::chrono::system_clock::time_point tp,
                                          const std::string& format);

} // namespace edext::action

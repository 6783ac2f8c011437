#pragma once

/// @file text_transform.hpp
/// @brief Pure text operations behind `transform` actions.
///
/// Case operations touch ASCII letters only; other bytes (including UTF-8
/// multi-byte sequences) pass through unchanged. Line operations split on
/// '\n' and preserve a single trailing newline if the input had one.

#include <string>
#include <string_view>

#include "edext/plugin/action_types.hpp"

namespace edext::action {

[[nodiscard]] std::string toUpper(std::string_view text);
[[nodiscard]] std::string toLower(std::string_view text);

/// First letter of each whitespace-separated word upper, the rest lower.
[[nodiscard]] std::string toTitleCase(std::string_view text);

[[nodiscard]] std::string swapCase(std::string_view text);

/// Reverse by UTF-8 code point. Text that is not valid UTF-8 is reversed
/// byte-wise, so reversing twice always restores the input.
[[nodiscard]] std::string reverseCodePoints(std::string_view text);

/// Strip leading and trailing whitespace.
[[nodiscard]] std::string trim(std::string_view text);

[[nodiscard]] std::string trimLines(std::string_view text);
[[nodiscard]] std::string sortLines(std::string_view text);
[[nodiscard]] std::string reverseLines(std::string_view text);

/// Drop repeated lines, keeping the first occurrence of each.
[[nodiscard]] std::string uniqueLines(std::string_view text);

/// Drop lines that are empty or whitespace only.
[[nodiscard]] std::string removeEmptyLines(std::string_view text);

/// Dispatch on @p op.
[[nodiscard]] std::string applyTransform(plugin::TransformOp op, std::string_view text);

} // namespace edext::action

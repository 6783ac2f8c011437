#pragma once

/// @file language_map.hpp
/// @brief File-extension to language-identifier mapping used by hosts.

#include <filesystem>
#include <string>
#include <string_view>

namespace edext::bridge {

/// Language identifier for buffers whose extension is unknown.
inline constexpr std::string_view kDefaultLanguage = "text";

/// Map a file path to a language identifier by its (case-insensitive)
/// extension, e.g. "main.py" -> "python", "README.md" -> "markdown".
/// Unknown or missing extensions yield kDefaultLanguage.
[[nodiscard]] std::string languageForPath(const std::filesystem::path& path);

} // namespace edext::bridge

/// @file text_transform.cpp
/// @brief Implementation of the transform operations.

#include "edext/action/text_transform.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <vector>

namespace edext::action {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool isAsciiUpper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
bool isAsciiLower(char c) noexcept { return c >= 'a' && c <= 'z'; }
bool isSpace(char c) noexcept { return kWhitespace.find(c) != std::string_view::npos; }

char upper(char c) noexcept { return isAsciiLower(c) ? static_cast<char>(c - 'a' + 'A') : c; }
char lower(char c) noexcept { return isAsciiUpper(c) ? static_cast<char>(c - 'A' + 'a') : c; }

std::string_view trimView(std::string_view text) noexcept {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

/// Length of the UTF-8 sequence starting at @p pos, or 1 if malformed.
std::size_t codePointLength(std::string_view text, std::size_t pos) noexcept {
    auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
    }
    if (len == 1 || pos + len > text.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return len;
}

struct Lines {
    std::vector<std::string_view> items;
    bool trailingNewline = false;
};

Lines splitLines(std::string_view text) {
    Lines lines;
    if (text.empty()) {
        return lines;
    }
    if (text.back() == '\n') {
        lines.trailingNewline = true;
        text.remove_suffix(1);
    }
    std::size_t start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.items.push_back(text.substr(start));
            break;
        }
        lines.items.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string_view>& items, bool trailingNewline) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += items[i];
    }
    if (trailingNewline && !items.empty()) {
        out += '\n';
    }
    return out;
}

template <typename Fn>
std::string mapChars(std::string_view text, Fn fn) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), fn);
    return out;
}

} // namespace

std::string toUpper(std::string_view text) {
    return mapChars(text, upper);
}

std::string toLower(std::string_view text) {
    return mapChars(text, lower);
}

std::string toTitleCase(std::string_view text) {
    std::string out(text);
    bool wordStart = true;
    for (auto& c : out) {
        if (isSpace(c)) {
            wordStart = true;
            continue;
        }
        c = wordStart ? upper(c) : lower(c);
        wordStart = false;
    }
    return out;
}

std::string swapCase(std::string_view text) {
    return mapChars(text, [](char c) {
        return isAsciiUpper(c) ? lower(c) : upper(c);
    });
}

std::string reverseCodePoints(std::string_view text) {
    std::vector<std::string_view> units;
    units.reserve(text.size());
    for (std::size_t pos = 0; pos < text.size();) {
        auto len = codePointLength(text, pos);
        if (len == 1 && static_cast<unsigned char>(text[pos]) >= 0x80) {
            // Not UTF-8: stray bytes would regroup, so reverse byte-wise.
            return std::string(text.rbegin(), text.rend());
        }
        units.push_back(text.substr(pos, len));
        pos += len;
    }

    std::string out;
    out.reserve(text.size());
    for (auto it = units.rbegin(); it != units.rend(); ++it) {
        out += *it;
    }
    return out;
}

std::string trim(std::string_view text) {
    return std::string(trimView(text));
}

std::string trimLines(std::string_view text) {
    auto lines = splitLines(text);
    for (auto& line : lines.items) {
        line = trimView(line);
    }
    return joinLines(lines.items, lines.trailingNewline);
}

std::string sortLines(std::string_view text) {
    auto lines = splitLines(text);
    std::stable_sort(lines.items.begin(), lines.items.end());
    return joinLines(lines.items, lines.trailingNewline);
}

std::string reverseLines(std::string_view text) {
    auto lines = splitLines(text);
    std::reverse(lines.items.begin(), lines.items.end());
    return joinLines(lines.items, lines.trailingNewline);
}

std::string uniqueLines(std::string_view text) {
    auto lines = splitLines(text);
    std::unordered_set<std::string_view> seen;
    std::vector<std::string_view> kept;
    for (auto line : lines.items) {
        if (seen.insert(line).second) {
            kept.push_back(line);
        }
    }
    return joinLines(kept, lines.trailingNewline);
}

std::string removeEmptyLines(std::string_view text) {
    auto lines = splitLines(text);
    std::vector<std::string_view> kept;
    std::copy_if(lines.items.begin(), lines.items.end(), std::back_inserter(kept),
                 [](std::string_view line) { return !trimView(line).empty(); });
    return joinLines(kept, lines.trailingNewline);
}

std::string applyTransform(plugin::TransformOp op, std::string_view text) {
    using plugin::TransformOp;
    switch (op) {
        case TransformOp::Uppercase:
            return toUpper(text);
        case TransformOp::Lowercase:
            return toLower(text);
        case TransformOp::TitleCase:
            return toTitleCase(text);
        case TransformOp::SwapCase:
            return swapCase(text);
        case TransformOp::Reverse:
            return reverseCodePoints(text);
        case TransformOp::Trim:
            return trim(text);
        case TransformOp::TrimLines:
            return trimLines(text);
        case TransformOp::SortLines:
            return sortLines(text);
        case TransformOp::ReverseLines:
            return reverseLines(text);
        case TransformOp::UniqueLines:
            return uniqueLines(text);
        case TransformOp::RemoveEmptyLines:
            return removeEmptyLines(text);
    }
    return std::string(text);
}

} // namespace edext::action

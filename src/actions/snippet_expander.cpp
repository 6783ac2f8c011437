/// @file snippet_expander.cpp
/// @brief Token expansion for snippet and external_command actions.

#include "edext/action/snippet_expander.hpp"

#include <ctime>

namespace edext::action {

namespace {

enum class Quoting { None, PathTokens };

std::string expand(std::string_view tmpl, const SnippetTokens& tokens, Quoting quoting) {
    std::string out;
    out.reserve(tmpl.size());

    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find("${", pos);
        if (open == std::string_view::npos) {
            out += tmpl.substr(pos);
            break;
        }
        auto close = tmpl.find('}', open + 2);
        if (close == std::string_view::npos) {
            out += tmpl.substr(pos);
            break;
        }

        out += tmpl.substr(pos, open - pos);
        auto name = tmpl.substr(open + 2, close - open - 2);
        bool quote = quoting == Quoting::PathTokens;

        if (name == "file_name") {
            out += quote ? shellQuote(tokens.fileName) : tokens.fileName;
        } else if (name == "file_path") {
            out += quote ? shellQuote(tokens.filePath) : tokens.filePath;
        } else if (name == "date") {
            out += tokens.date;
        } else if (name == "time") {
            out += tokens.time;
        } else {
            out += tmpl.substr(open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

} // namespace

std::string formatLocalTime(std::chrono::system_clock::time_point tp, const std::string& format) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[256];
    std::size_t n = std::strftime(buf, sizeof(buf), format.c_str(), &local);
    return std::string(buf, n);
}

SnippetTokens snippetTokensFor(const bridge::ExecutionContext& ctx,
                               const SnippetFormat& format,
                               std::chrono::system_clock::time_point now) {
    SnippetTokens tokens;
    if (ctx.filePath) {
        tokens.fileName = ctx.filePath->filename().string();
        tokens.filePath = ctx.filePath->string();
    } else {
        tokens.fileName = format.untitled;
        tokens.filePath = format.untitled;
    }
    tokens.date = formatLocalTime(now, format.dateFormat);
    tokens.time = formatLocalTime(now, format.timeFormat);
    return tokens;
}

std::string expandSnippet(std::string_view tmpl, const SnippetTokens& tokens) {
    return expand(tmpl, tokens, Quoting::None);
}

std::string expandCommand(std::string_view tmpl, const SnippetTokens& tokens) {
    return expand(tmpl, tokens, Quoting::PathTokens);
}

std::string shellQuote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

} // namespace edext::action

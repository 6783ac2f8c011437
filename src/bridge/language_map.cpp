#include "edext/bridge/language_map.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace edext::bridge {

namespace {

const std::unordered_map<std::string, std::string>& extensionTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {".py", "python"},
        {".js", "javascript"},
        {".ts", "typescript"},
        {".html", "html"},
        {".css", "css"},
        {".json", "json"},
        {".md", "markdown"},
        {".sh", "bash"},
        {".c", "c"},
        {".cpp", "cpp"},
        {".h", "c"},
        {".hpp", "cpp"},
        {".java", "java"},
        {".rs", "rust"},
        {".go", "go"},
        {".rb", "ruby"},
        {".php", "php"},
        {".lua", "lua"},
        {".yaml", "yaml"},
        {".yml", "yaml"},
    };
    return table;
}

} // namespace

std::string languageForPath(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = extensionTable();
    auto it = table.find(ext);
    return it != table.end() ? it->second : std::string(kDefaultLanguage);
}

} // namespace edext::bridge

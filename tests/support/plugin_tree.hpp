#pragma once

/// @file plugin_tree.hpp
/// @brief Temporary on-disk plugin roots for tests.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace edext::test {

/// A unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(std::string_view tag = "tmp") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("edext_" + std::string(tag) + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

    /// Write @p content to @p relative (parent directories are created).
    std::filesystem::path WriteFile(const std::filesystem::path& relative,
                                    std::string_view content) const {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary | std::ios::trunc);
        out << content;
        return full;
    }

private:
    std::filesystem::path path_;
};

/// A plugin root: one subdirectory per plugin, each with a plugin.yaml.
class PluginTree : public TempDir {
public:
    PluginTree() : TempDir("plugins") {}

    /// Write <root>/<dir>/plugin.yaml.
    std::filesystem::path AddPlugin(std::string_view dir, std::string_view yaml) const {
        return WriteFile(std::filesystem::path(std::string(dir)) / "plugin.yaml", yaml);
    }

    /// Write an auxiliary file (e.g. a script) inside a plugin directory.
    std::filesystem::path AddFile(std::string_view dir, std::string_view name,
                                  std::string_view content) const {
        return WriteFile(std::filesystem::path(std::string(dir)) / std::string(name), content);
    }

    [[nodiscard]] std::filesystem::path PluginDir(std::string_view dir) const {
        return Path() / std::string(dir);
    }
};

} // namespace edext::test

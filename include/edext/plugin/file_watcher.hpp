#pragma once

/// @file file_watcher.hpp
/// @brief Polling-based change detector for plugin definition trees.

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edext::plugin {

/// Callback invoked for each changed path.
using FileChangeCallback = std::function<void(const std::filesystem::path& path)>;

/// Polling change detector for files and directories.
///
/// Compares last-write timestamps against a baseline taken at Watch().
/// A directory's timestamp moves when entries are added or removed, so
/// watching plugin directories also catches new and deleted plugins. A
/// watched path that disappears is reported once and then dropped.
/// Changes inside the debounce window are coalesced.
class FileWatcher {
public:
    FileWatcher() = default;

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    void SetCallback(FileChangeCallback callback);

    /// Start watching @p path. Returns false if it does not exist.
    bool Watch(const std::filesystem::path& path);

    void Unwatch(const std::filesystem::path& path);

    void UnwatchAll();

    /// Check all watched paths; invoke the callback for settled changes.
    /// @return The paths reported in this poll.
    std::vector<std::filesystem::path> Poll();

    void SetDebounceMs(uint32_t ms);

    [[nodiscard]] std::size_t WatchCount() const;

    [[nodiscard]] bool IsWatching(const std::filesystem::path& path) const;

private:
    struct WatchEntry {
        std::filesystem::file_time_type lastWriteTime;
        std::chrono::steady_clock::time_point lastChangeDetected;
        bool pendingCallback = false;
        bool removed = false;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WatchEntry> entries_;
    FileChangeCallback callback_;
    std::chrono::milliseconds debounce_{200};
};

} // namespace edext::plugin

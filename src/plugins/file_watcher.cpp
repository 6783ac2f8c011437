/// @file file_watcher.cpp
/// @brief Polling change detection over last-write timestamps.

#include "edext/plugin/file_watcher.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace edext::plugin {

void FileWatcher::SetCallback(FileChangeCallback callback) {
    std::lock_guard lock(mutex_);
    callback_ = std::move(callback);
}

bool FileWatcher::Watch(const fs::path& path) {
    std::error_code ec;
    auto writeTime = fs::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    std::lock_guard lock(mutex_);
    entries_[path.string()] = WatchEntry{writeTime, {}, false, false};
    return true;
}

void FileWatcher::Unwatch(const fs::path& path) {
    std::lock_guard lock(mutex_);
    entries_.erase(path.string());
}

void FileWatcher::UnwatchAll() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

std::vector<fs::path> FileWatcher::Poll() {
    std::vector<fs::path> changed;
    FileChangeCallback callback;
    auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto& [pathStr, entry] = *it;

            std::error_code ec;
            auto currentTime = fs::last_write_time(fs::path(pathStr), ec);
            if (ec) {
                if (!entry.removed) {
                    entry.removed = true;
                    entry.lastChangeDetected = now;
                    entry.pendingCallback = true;
                }
            } else if (currentTime != entry.lastWriteTime) {
                entry.lastWriteTime = currentTime;
                entry.lastChangeDetected = now;
                entry.pendingCallback = true;
            }

            if (entry.pendingCallback && now - entry.lastChangeDetected >= debounce_) {
                entry.pendingCallback = false;
                changed.emplace_back(pathStr);
                if (entry.removed) {
                    it = entries_.erase(it);
                    continue;
                }
            }
            ++it;
        }
        callback = callback_;
    }

    // Callbacks run outside the lock; they may re-enter Watch/Unwatch.
    if (callback) {
        for (const auto& path : changed) {
            callback(path);
        }
    }
    return changed;
}

void FileWatcher::SetDebounceMs(uint32_t ms) {
    std::lock_guard lock(mutex_);
    debounce_ = std::chrono::milliseconds(ms);
}

std::size_t FileWatcher::WatchCount() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool FileWatcher::IsWatching(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return entries_.count(path.string()) > 0;
}

} // namespace edext::plugin

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "treewatch/common/path_utils.h"

namespace treewatch {

class WatchManagerConfig {
public:
    WatchManagerConfig();
    ~WatchManagerConfig();

    WatchManagerConfig(const WatchManagerConfig&) = delete;
    WatchManagerConfig& operator=(const WatchManagerConfig&) = delete;
    WatchManagerConfig(WatchManagerConfig&&) = delete;
    WatchManagerConfig& operator=(WatchManagerConfig&&) = delete;

    // Load configuration from file
    absl::Status Load(const std::filesystem::path& config_file);

    // Save configuration to file
    absl::Status Save(const std::filesystem::path& config_file) const;

    // Worker pool
    void SetMaxThreads(size_t threads);
    size_t GetMaxThreads() const;

    // How long background loops block before re-checking for shutdown
    void SetPollTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds GetPollTimeout() const;

    void SetEventQueueCapacity(size_t capacity);
    size_t GetEventQueueCapacity() const;

    // Traversal
    void SetFollowSymlinks(bool follow);
    bool GetFollowSymlinks() const;

    void SetIncludeHidden(bool include);
    bool GetIncludeHidden() const;

    // Filter derived from the traversal settings
    PathFilter BuildFilter() const;

    // Directories watched by the command-line tool
    void AddWatchRoot(const std::filesystem::path& root);
    void RemoveWatchRoot(const std::filesystem::path& root);
    const std::vector<std::filesystem::path>& GetWatchRoots() const;

    // Logging
    void SetLogLevel(const std::string& level);
    const std::string& GetLogLevel() const;

private:
    size_t max_threads_;
    std::chrono::milliseconds poll_timeout_;
    size_t event_queue_capacity_;

    bool follow_symlinks_;
    bool include_hidden_;

    std::vector<std::filesystem::path> watch_roots_;

    std::string log_level_;
};

}  // namespace treewatch

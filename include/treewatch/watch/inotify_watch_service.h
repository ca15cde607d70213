#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "treewatch/watch/watch_service.h"

namespace treewatch {

// Linux inotify backend. Handles are issued by the service itself so that two
// paths resolving to the same inode (through a followed symlink) keep
// independent subscriptions on top of one kernel watch descriptor.
class InotifyWatchService : public IWatchService {
public:
    static absl::StatusOr<std::unique_ptr<InotifyWatchService>> Create();

    ~InotifyWatchService() override;

    InotifyWatchService(const InotifyWatchService&) = delete;
    InotifyWatchService& operator=(const InotifyWatchService&) = delete;
    InotifyWatchService(InotifyWatchService&&) = delete;
    InotifyWatchService& operator=(InotifyWatchService&&) = delete;

    absl::StatusOr<WatchHandle> Register(const std::filesystem::path& directory) override;
    absl::Status Cancel(WatchHandle handle) override;
    absl::StatusOr<std::vector<WatchSignal>> Poll(std::chrono::milliseconds timeout) override;
    void Close() override;
    bool IsClosed() const override;
    size_t ActiveHandleCount() const override;

private:
    InotifyWatchService(int inotify_fd, int wake_fd);

    struct Subscription {
        int wd;
        std::filesystem::path directory;
    };

    // Appends the events found in `buf` to `signals`, one burst per handle.
    void DecodeEvents(const char* buf, size_t len, std::vector<WatchSignal>& signals);

    int inotify_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> closed_{false};

    // Serialises Poll against Close so descriptors are never closed mid-read.
    std::mutex poll_mutex_;

    mutable std::mutex mutex_;
    std::map<WatchHandle, Subscription> subscriptions_;
    std::map<int, std::set<WatchHandle>> wd_to_handles_;
    WatchHandle next_handle_ = 1;
};

}  // namespace treewatch

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

#include "treewatch/watch/watch_service.h"

namespace treewatch {

// Watch service that never touches the kernel: signals are injected by the
// caller. Keeps the full subscription bookkeeping so callers can inspect it.
class InMemoryWatchService : public IWatchService {
public:
    InMemoryWatchService() = default;
    ~InMemoryWatchService() override = default;

    InMemoryWatchService(const InMemoryWatchService&) = delete;
    InMemoryWatchService& operator=(const InMemoryWatchService&) = delete;
    InMemoryWatchService(InMemoryWatchService&&) = delete;
    InMemoryWatchService& operator=(InMemoryWatchService&&) = delete;

    absl::StatusOr<WatchHandle> Register(const std::filesystem::path& directory) override;
    absl::Status Cancel(WatchHandle handle) override;
    absl::StatusOr<std::vector<WatchSignal>> Poll(std::chrono::milliseconds timeout) override;
    void Close() override;
    bool IsClosed() const override;
    size_t ActiveHandleCount() const override;

    // Queue a burst for the directory's active subscription.
    // NotFound if the directory is not subscribed.
    absl::Status Signal(const std::filesystem::path& directory, std::vector<RawEvent> events);

    // Directories with an active subscription, one entry per handle.
    std::vector<std::filesystem::path> WatchedDirectories() const;

    // Total number of successful Register calls since construction.
    size_t RegistrationCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable signal_cv_;
    std::map<WatchHandle, std::filesystem::path> handles_;
    std::deque<WatchSignal> pending_;
    WatchHandle next_handle_ = 1;
    size_t registration_count_ = 0;
    bool closed_ = false;
};

}  // namespace treewatch

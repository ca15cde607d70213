#include "treewatch/watch/in_memory_watch_service.h"

#include <absl/strings/str_cat.h>

namespace treewatch {

absl::StatusOr<WatchHandle> InMemoryWatchService::Register(const std::filesystem::path& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return absl::FailedPreconditionError("Watch service is closed");
    }

    const WatchHandle handle = next_handle_++;
    handles_.emplace(handle, directory);
    ++registration_count_;
    return handle;
}

absl::Status InMemoryWatchService::Cancel(WatchHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handles_.erase(handle) == 0) {
        return absl::NotFoundError(absl::StrCat("Unknown watch handle: ", handle));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<WatchSignal>> InMemoryWatchService::Poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    signal_cv_.wait_for(lock, timeout, [this]() { return closed_ || !pending_.empty(); });
    if (closed_) {
        return absl::CancelledError("Watch service is closed");
    }

    std::vector<WatchSignal> signals;
    signals.reserve(pending_.size());
    while (!pending_.empty()) {
        WatchSignal signal = std::move(pending_.front());
        pending_.pop_front();
        // Bursts queued for a subscription that has since been cancelled are lost,
        // as they would be with a kernel service.
        if (handles_.count(signal.handle) != 0) {
            signals.push_back(std::move(signal));
        }
    }
    return signals;
}

void InMemoryWatchService::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        handles_.clear();
        pending_.clear();
    }
    signal_cv_.notify_all();
}

bool InMemoryWatchService::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t InMemoryWatchService::ActiveHandleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

absl::Status InMemoryWatchService::Signal(const std::filesystem::path& directory,
                                          std::vector<RawEvent> events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return absl::FailedPreconditionError("Watch service is closed");
        }

        auto it = handles_.begin();
        for (; it != handles_.end(); ++it) {
            if (it->second == directory) {
                break;
            }
        }
        if (it == handles_.end()) {
            return absl::NotFoundError(absl::StrCat("Directory is not watched: ", directory.string()));
        }

        WatchSignal signal;
        signal.handle = it->first;
        signal.directory = directory;
        signal.events = std::move(events);
        pending_.push_back(std::move(signal));
    }
    signal_cv_.notify_one();
    return absl::OkStatus();
}

std::vector<std::filesystem::path> InMemoryWatchService::WatchedDirectories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::filesystem::path> result;
    result.reserve(handles_.size());
    for (const auto& [handle, directory] : handles_) {
        result.push_back(directory);
    }
    return result;
}

size_t InMemoryWatchService::RegistrationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registration_count_;
}

}  // namespace treewatch

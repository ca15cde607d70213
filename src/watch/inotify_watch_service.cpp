#include "treewatch/watch/inotify_watch_service.h"

#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"

namespace treewatch {

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_ATTRIB | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_ONLYDIR;

bool ToChangeKind(uint32_t mask, ChangeKind& kind) {
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        kind = ChangeKind::kCreated;
        return true;
    }
    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        kind = ChangeKind::kDeleted;
        return true;
    }
    if (mask & (IN_MODIFY | IN_ATTRIB)) {
        kind = ChangeKind::kModified;
        return true;
    }
    return false;
}

}  // namespace

absl::StatusOr<std::unique_ptr<InotifyWatchService>> InotifyWatchService::Create() {
    int inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd == -1) {
        return absl::ErrnoToStatus(errno, "Failed to initialize inotify");
    }
    int wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd == -1) {
        const int error = errno;
        close(inotify_fd);
        return absl::ErrnoToStatus(error, "Failed to create wake-up eventfd");
    }
    return std::unique_ptr<InotifyWatchService>(new InotifyWatchService(inotify_fd, wake_fd));
}

InotifyWatchService::InotifyWatchService(int inotify_fd, int wake_fd)
    : inotify_fd_(inotify_fd), wake_fd_(wake_fd) {
}

InotifyWatchService::~InotifyWatchService() {
    Close();
}

absl::StatusOr<WatchHandle> InotifyWatchService::Register(const std::filesystem::path& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return absl::FailedPreconditionError("Watch service is closed");
    }

    int wd = inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask);
    if (wd == -1) {
        return absl::ErrnoToStatus(errno, absl::StrCat("Failed to add watch for ", directory.string()));
    }

    const WatchHandle handle = next_handle_++;
    subscriptions_[handle] = Subscription{wd, directory};
    wd_to_handles_[wd].insert(handle);
    return handle;
}

absl::Status InotifyWatchService::Cancel(WatchHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(handle);
    if (it == subscriptions_.end()) {
        return absl::NotFoundError(absl::StrCat("Unknown watch handle: ", handle));
    }
    const int wd = it->second.wd;
    subscriptions_.erase(it);

    auto wd_it = wd_to_handles_.find(wd);
    if (wd_it == wd_to_handles_.end()) {
        // The kernel already dropped the descriptor (IN_IGNORED).
        return absl::OkStatus();
    }
    wd_it->second.erase(handle);
    if (!wd_it->second.empty()) {
        return absl::OkStatus();
    }
    wd_to_handles_.erase(wd_it);

    if (inotify_rm_watch(inotify_fd_, wd) == -1 && errno != EINVAL) {
        return absl::ErrnoToStatus(errno, absl::StrCat("Failed to remove watch ", wd));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<WatchSignal>> InotifyWatchService::Poll(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> poll_lock(poll_mutex_);
    if (closed_) {
        return absl::CancelledError("Watch service is closed");
    }

    struct pollfd fds[2];
    fds[0].fd = inotify_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_fd_;
    fds[1].events = POLLIN;

    std::vector<WatchSignal> signals;
    int poll_result = poll(fds, 2, static_cast<int>(timeout.count()));
    if (poll_result == -1) {
        if (errno == EINTR) {
            return signals;
        }
        return absl::ErrnoToStatus(errno, "Failed to poll inotify descriptor");
    }
    if (closed_) {
        return absl::CancelledError("Watch service is closed");
    }
    if (poll_result == 0 || !(fds[0].revents & POLLIN)) {
        return signals;  // Timeout
    }

    constexpr size_t BUF_LEN = 4096;
    alignas(struct inotify_event) char buf[BUF_LEN];
    while (true) {
        ssize_t len = read(inotify_fd_, buf, sizeof(buf));
        if (len == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                break;
            }
            return absl::ErrnoToStatus(errno, "Failed to read inotify events");
        }
        if (len <= 0) {
            break;
        }
        DecodeEvents(buf, static_cast<size_t>(len), signals);
    }
    return signals;
}

void InotifyWatchService::DecodeEvents(const char* buf, size_t len, std::vector<WatchSignal>& signals) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<WatchHandle, size_t> burst_index;

    for (const char* ptr = buf; ptr < buf + len; ) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
        ptr += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            LOG_WARNING("InotifyWatchService: event queue overflowed, some changes were lost");
            continue;
        }

        auto wd_it = wd_to_handles_.find(event->wd);
        if (wd_it == wd_to_handles_.end()) {
            continue;
        }
        if (event->mask & IN_IGNORED) {
            // Watched directory is gone; its handles stay known until cancelled.
            wd_to_handles_.erase(wd_it);
            continue;
        }

        ChangeKind kind;
        if (event->len == 0 || !ToChangeKind(event->mask, kind)) {
            continue;
        }

        for (WatchHandle handle : wd_it->second) {
            auto [index_it, inserted] = burst_index.emplace(handle, signals.size());
            if (inserted) {
                WatchSignal signal;
                signal.handle = handle;
                signal.directory = subscriptions_.at(handle).directory;
                signals.push_back(std::move(signal));
            }
            signals[index_it->second].events.push_back(RawEvent{kind, std::filesystem::path(event->name)});
        }
    }
}

void InotifyWatchService::Close() {
    if (closed_.exchange(true)) {
        return;
    }

    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) == -1) {
        LOG_DEBUG(absl::StrCat("InotifyWatchService: wake-up write failed: ", std::strerror(errno)));
    }

    std::lock_guard<std::mutex> poll_lock(poll_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
    wd_to_handles_.clear();
    if (inotify_fd_ != -1) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    if (wake_fd_ != -1) {
        close(wake_fd_);
        wake_fd_ = -1;
    }
}

bool InotifyWatchService::IsClosed() const {
    return closed_;
}

size_t InotifyWatchService::ActiveHandleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

}  // namespace treewatch

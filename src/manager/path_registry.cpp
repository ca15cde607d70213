#include "treewatch/manager/path_registry.h"

#include <system_error>
#include <utility>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"
#include "treewatch/common/path_utils.h"
#include "treewatch/common/status.h"

namespace treewatch {

PathRegistry::PathRegistry(std::shared_ptr<IWatchService> watch_service)
    : watch_service_(std::move(watch_service)) {
}

PathRegistry::~PathRegistry() {
    absl::Status status = Close();
    if (!status.ok()) {
        LOG_WARNING(absl::StrCat("PathRegistry: failed to release watch handles: ", status.ToString()));
    }
}

absl::StatusOr<WatchedPath> PathRegistry::Register(const std::filesystem::path& path) {
    std::error_code ec;
    const bool is_directory = std::filesystem::is_directory(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ErrorCodeToStatus(ec, absl::StrCat("Failed to inspect ", path.string()));
    }
    return Register(path, is_directory ? PathKind::kDirectory : PathKind::kFile);
}

absl::StatusOr<WatchedPath> PathRegistry::Register(const std::filesystem::path& path, PathKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return ManagerClosedError();
    }

    auto it = entries_.find(path);
    if (it != entries_.end()) {
        return it->second;
    }

    WatchedPath entry;
    entry.path = path;
    entry.kind = kind;
    if (kind == PathKind::kDirectory) {
        absl::StatusOr<WatchHandle> handle = watch_service_->Register(path);
        if (!handle.ok()) {
            return handle.status();
        }
        entry.handle = *handle;
    }

    entries_.emplace(path, entry);
    snapshot_.reset();
    return entry;
}

absl::StatusOr<bool> PathRegistry::Deregister(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return ManagerClosedError();
    }

    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return false;
    }
    std::optional<WatchHandle> handle = it->second.handle;
    entries_.erase(it);
    snapshot_.reset();

    if (handle) {
        absl::Status status = watch_service_->Cancel(*handle);
        if (absl::IsNotFound(status)) {
            LOG_DEBUG(absl::StrCat("PathRegistry: watch for ", path.string(), " was already gone"));
        } else if (!status.ok()) {
            return status;
        }
    }
    return true;
}

bool PathRegistry::Contains(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(path) != 0;
}

bool PathRegistry::IsDirectory(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    return it != entries_.end() && it->second.kind == PathKind::kDirectory;
}

std::optional<WatchedPath> PathRegistry::Find(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::filesystem::path> PathRegistry::PathsUnder(const std::filesystem::path& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::filesystem::path> result;
    // path ordering is component-wise, so descendants directly follow their root.
    for (auto it = entries_.lower_bound(root); it != entries_.end(); ++it) {
        if (!IsSameOrAncestor(root, it->first)) {
            break;
        }
        result.push_back(it->first);
    }
    return result;
}

std::shared_ptr<const PathSet> PathRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!snapshot_) {
        auto paths = std::make_shared<PathSet>();
        for (const auto& [path, entry] : entries_) {
            paths->insert(path);
        }
        snapshot_ = std::move(paths);
    }
    return snapshot_;
}

size_t PathRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

absl::Status PathRegistry::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return absl::OkStatus();
    }
    closed_ = true;

    absl::Status first_error;
    for (const auto& [path, entry] : entries_) {
        if (!entry.handle) {
            continue;
        }
        absl::Status status = watch_service_->Cancel(*entry.handle);
        if (status.ok() || absl::IsNotFound(status)) {
            continue;
        }
        LOG_WARNING(absl::StrCat("PathRegistry: failed to cancel watch for ", path.string(), ": ",
                                 status.ToString()));
        if (first_error.ok()) {
            first_error = status;
        }
    }
    entries_.clear();
    snapshot_.reset();
    return first_error;
}

bool PathRegistry::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace treewatch

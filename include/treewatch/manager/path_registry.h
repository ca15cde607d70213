#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "treewatch/watch/watch_service.h"

namespace treewatch {

using PathSet = std::set<std::filesystem::path>;

enum class PathKind {
    kFile,
    kDirectory
};

// A path under management. Files carry no handle: they are covered by the
// subscription of their parent directory.
struct WatchedPath {
    std::filesystem::path path;
    PathKind kind = PathKind::kFile;
    std::optional<WatchHandle> handle;
};

/* Single source of truth for which paths are watched and with what handle. */
class PathRegistry {
public:
    explicit PathRegistry(std::shared_ptr<IWatchService> watch_service);
    ~PathRegistry();

    PathRegistry(const PathRegistry&) = delete;
    PathRegistry& operator=(const PathRegistry&) = delete;
    PathRegistry(PathRegistry&&) = delete;
    PathRegistry& operator=(PathRegistry&&) = delete;

    // Directories get a watch handle, everything else a placeholder.
    // Registering a path that is already present returns the existing entry.
    absl::StatusOr<WatchedPath> Register(const std::filesystem::path& path);

    // Same, with the kind decided by the caller. A symlink reached without
    // following it is a file even when it points at a directory.
    absl::StatusOr<WatchedPath> Register(const std::filesystem::path& path, PathKind kind);

    // Returns whether an entry was removed. Cancels the handle of directories.
    absl::StatusOr<bool> Deregister(const std::filesystem::path& path);

    bool Contains(const std::filesystem::path& path) const;

    // True if the path is registered as a directory.
    bool IsDirectory(const std::filesystem::path& path) const;

    std::optional<WatchedPath> Find(const std::filesystem::path& path) const;

    // Every registered path equal to or below `root`.
    std::vector<std::filesystem::path> PathsUnder(const std::filesystem::path& root) const;

    // Read-only view of all registered paths. Cached until the next mutation.
    std::shared_ptr<const PathSet> Snapshot() const;

    size_t size() const;

    // Cancels every remaining handle and rejects further mutations.
    // Returns the first cancellation failure.
    absl::Status Close();

    bool IsClosed() const;

private:
    std::shared_ptr<IWatchService> watch_service_;

    mutable std::mutex mutex_;
    std::map<std::filesystem::path, WatchedPath> entries_;
    mutable std::shared_ptr<const PathSet> snapshot_;
    bool closed_ = false;
};

}  // namespace treewatch

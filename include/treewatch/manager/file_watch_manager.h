#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "treewatch/config/watch_manager_config.h"
#include "treewatch/manager/active_path_tracker.h"
#include "treewatch/manager/event_dispatcher.h"
#include "treewatch/manager/path_registry.h"
#include "treewatch/manager/tree_walker.h"
#include "treewatch/manager/watch_callbacks.h"
#include "treewatch/watch/watch_service.h"

namespace treewatch {

/* Watches whole directory trees and reports every node through the
   callbacks. Subclasses supply the callbacks and must call Close() from
   their own destructor so that no event reaches a destroyed subclass. */
class FileWatchManager : protected WatchCallbacks {
public:
    FileWatchManager(std::shared_ptr<IWatchService> watch_service, const WatchManagerConfig& config);
    ~FileWatchManager() override;

    FileWatchManager(const FileWatchManager&) = delete;
    FileWatchManager& operator=(const FileWatchManager&) = delete;
    FileWatchManager(FileWatchManager&&) = delete;
    FileWatchManager& operator=(FileWatchManager&&) = delete;

    // Starts watching `path` and everything below it. A no-op when the
    // directory is already watched. On failure nothing from this call stays
    // registered.
    absl::Status Add(const std::filesystem::path& path);

    // Stops watching `path` and everything below it. A no-op when the
    // directory is not watched.
    absl::Status Remove(const std::filesystem::path& path);

    // Every watched path, files and directories alike.
    absl::StatusOr<std::shared_ptr<const PathSet>> GetPaths() const;

    // Stops event processing and releases every watch. Idempotent. Returns
    // the first failure met while tearing down.
    absl::Status Close();

    bool IsClosed() const;

    // Events handed to the workers that have not finished yet.
    size_t PendingEvents() const;

protected:
    absl::Status OnAddFile(const std::filesystem::path& path) override = 0;
    absl::Status OnAddDirectory(const std::filesystem::path& path) override = 0;
    absl::Status OnChangeFile(const std::filesystem::path& path) override = 0;
    absl::Status OnChangeDirectory(const std::filesystem::path& path) override = 0;
    absl::Status OnRemoveFile(const std::filesystem::path& path) override = 0;
    absl::Status OnRemoveDirectory(const std::filesystem::path& path) override = 0;

    // Failures of background event processing end up here.
    virtual void HandleException(const std::filesystem::path& path, const absl::Status& status) = 0;

private:
    absl::Status ProcessEvent(ChangeKind kind, const std::filesystem::path& path);
    absl::Status ProcessCreate(const std::filesystem::path& path);
    absl::Status ProcessModify(const std::filesystem::path& path);
    absl::Status ProcessDelete(const std::filesystem::path& path);

    // Registers a path that appeared on disk. Caller holds the claim.
    absl::Status AddAppeared(const std::filesystem::path& path);

    // Paths an operation on `root` has to claim: the root plus the targets
    // of symlinks the walk would follow out of it.
    std::vector<std::filesystem::path> ClaimSet(const std::filesystem::path& root, bool follow_symlinks) const;

    std::shared_ptr<IWatchService> watch_service_;
    PathRegistry registry_;
    ActivePathTracker tracker_;
    TreeWalker walker_;
    bool follow_symlinks_;

    // Shared by Add/Remove, exclusive while Close flips the flag.
    mutable std::shared_mutex close_mutex_;
    std::atomic<bool> closed_{false};

    std::unique_ptr<EventDispatcher> dispatcher_;
};

}  // namespace treewatch

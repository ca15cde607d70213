#include "treewatch/manager/file_watch_manager.h"

#include <mutex>
#include <system_error>
#include <utility>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"
#include "treewatch/common/path_utils.h"
#include "treewatch/common/status.h"

namespace fs = std::filesystem;

namespace treewatch {

namespace {

// Collects the resolved targets of symlinks that lead out of the root.
class ClaimSetVisitor : public TreeVisitor {
public:
    ClaimSetVisitor(const fs::path& root, const PathFilter& filter)
        : root_(root), filter_(filter) {}

    absl::StatusOr<VisitResult> PreVisitDirectory(const fs::path& dir) override {
        if (dir != root_ && !filter_(dir)) {
            return VisitResult::kSkipSubtree;
        }
        Note(dir);
        return VisitResult::kContinue;
    }

    absl::Status VisitFile(const fs::path& file) override {
        if (filter_(file)) {
            Note(file);
        }
        return absl::OkStatus();
    }

    absl::Status PostVisitDirectory(const fs::path&) override {
        return absl::OkStatus();
    }

    std::vector<fs::path> TakePaths() { return std::move(paths_); }

private:
    void Note(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(path, ec))) {
            return;
        }
        fs::path target = fs::weakly_canonical(path, ec);
        if (ec) {
            return;
        }
        target = NormalizePath(target);
        if (!IsSameOrAncestor(root_, target)) {
            paths_.push_back(std::move(target));
        }
    }

    const fs::path& root_;
    const PathFilter& filter_;
    std::vector<fs::path> paths_;
};

}  // namespace

FileWatchManager::FileWatchManager(std::shared_ptr<IWatchService> watch_service,
                                   const WatchManagerConfig& config)
    : watch_service_(std::move(watch_service)),
      registry_(watch_service_),
      walker_(registry_, *this, config.BuildFilter()),
      follow_symlinks_(config.GetFollowSymlinks()) {
    EventDispatcher::Options options;
    options.worker_threads = config.GetMaxThreads();
    options.poll_timeout = config.GetPollTimeout();
    options.queue_capacity = config.GetEventQueueCapacity();
    options.filter = walker_.filter();

    dispatcher_ = std::make_unique<EventDispatcher>(
        watch_service_, std::move(options),
        [this](ChangeKind kind, const fs::path& path) { return ProcessEvent(kind, path); },
        [this](const fs::path& path, const absl::Status& status) { HandleException(path, status); });
    dispatcher_->Start();
}

FileWatchManager::~FileWatchManager() {
    absl::Status status = Close();
    if (!status.ok()) {
        LOG_ERROR(absl::StrCat("FileWatchManager: close failed: ", status.ToString()));
    }
}

absl::Status FileWatchManager::Add(const fs::path& path) {
    std::shared_lock<std::shared_mutex> lock(close_mutex_);
    if (closed_) {
        return ManagerClosedError();
    }

    const fs::path root = NormalizePath(path);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return NotDirectoryError(root);
    }
    if (registry_.Contains(root)) {
        LOG_DEBUG(absl::StrCat("FileWatchManager: already watching ", root.string()));
        return absl::OkStatus();
    }

    ScopedClaim claim(tracker_, tracker_.Claim(ClaimSet(root, follow_symlinks_)));
    if (registry_.Contains(root)) {
        return absl::OkStatus();
    }

    LOG_INFO(absl::StrCat("FileWatchManager: watching ", root.string()));
    return walker_.WalkAdd(root, follow_symlinks_);
}

absl::Status FileWatchManager::Remove(const fs::path& path) {
    std::shared_lock<std::shared_mutex> lock(close_mutex_);
    if (closed_) {
        return ManagerClosedError();
    }

    const fs::path root = NormalizePath(path);
    std::error_code ec;
    const bool on_disk = fs::is_directory(root, ec);
    if (!on_disk && !registry_.IsDirectory(root)) {
        return NotDirectoryError(root);
    }
    if (!registry_.Contains(root)) {
        return absl::OkStatus();
    }

    ScopedClaim claim(tracker_, tracker_.Claim(ClaimSet(root, on_disk && follow_symlinks_)));
    if (!registry_.Contains(root)) {
        return absl::OkStatus();
    }

    LOG_INFO(absl::StrCat("FileWatchManager: no longer watching ", root.string()));
    if (fs::is_directory(root, ec)) {
        return walker_.WalkRemove(root);
    }
    return walker_.RemoveCollection(registry_.PathsUnder(root));
}

absl::StatusOr<std::shared_ptr<const PathSet>> FileWatchManager::GetPaths() const {
    if (closed_) {
        return ManagerClosedError();
    }
    return registry_.Snapshot();
}

absl::Status FileWatchManager::Close() {
    {
        std::unique_lock<std::shared_mutex> lock(close_mutex_);
        if (closed_) {
            return absl::OkStatus();
        }
        closed_ = true;
    }

    LOG_INFO("FileWatchManager: closing");
    dispatcher_->Stop();
    absl::Status status = registry_.Close();
    watch_service_->Close();
    return status;
}

bool FileWatchManager::IsClosed() const {
    return closed_;
}

size_t FileWatchManager::PendingEvents() const {
    return dispatcher_->InFlight();
}

absl::Status FileWatchManager::ProcessEvent(ChangeKind kind, const fs::path& path) {
    if (closed_) {
        return ManagerClosedError();
    }

    LOG_DEBUG(absl::StrCat("FileWatchManager: ", ChangeKindName(kind), " ", path.string()));
    switch (kind) {
    case ChangeKind::kCreated:
        return ProcessCreate(path);
    case ChangeKind::kModified:
        return ProcessModify(path);
    case ChangeKind::kDeleted:
        return ProcessDelete(path);
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown change kind for ", path.string()));
}

absl::Status FileWatchManager::ProcessCreate(const fs::path& path) {
    ScopedClaim claim(tracker_, tracker_.Claim(path));
    if (registry_.Contains(path) || !registry_.IsDirectory(path.parent_path())) {
        return absl::OkStatus();
    }
    return AddAppeared(path);
}

absl::Status FileWatchManager::ProcessModify(const fs::path& path) {
    ScopedClaim claim(tracker_, tracker_.Claim(path));
    std::optional<WatchedPath> entry = registry_.Find(path);
    if (!entry) {
        return absl::OkStatus();
    }
    if (entry->kind == PathKind::kDirectory) {
        return OnChangeDirectory(path);
    }
    return OnChangeFile(path);
}

absl::Status FileWatchManager::ProcessDelete(const fs::path& path) {
    ScopedClaim claim(tracker_, tracker_.Claim(path));
    if (!registry_.Contains(path)) {
        return absl::OkStatus();
    }

    std::error_code ec;
    absl::Status status = fs::is_directory(path, ec) ? walker_.WalkRemove(path)
                                                     : walker_.RemoveCollection(registry_.PathsUnder(path));
    if (!status.ok()) {
        return status;
    }

    // Replaced before the event was processed: watch the new incarnation,
    // provided its parent is still watched.
    if (registry_.IsDirectory(path.parent_path()) && fs::exists(fs::symlink_status(path, ec))) {
        return AddAppeared(path);
    }
    return absl::OkStatus();
}

absl::Status FileWatchManager::AddAppeared(const fs::path& path) {
    if (!walker_.filter()(path)) {
        return absl::OkStatus();
    }
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return walker_.WalkAdd(path, false);
    }
    if (!fs::exists(fs::symlink_status(path, ec))) {
        // Gone again; the matching delete event finds nothing to do.
        return absl::OkStatus();
    }

    absl::StatusOr<WatchedPath> registered = registry_.Register(path, PathKind::kFile);
    if (!registered.ok()) {
        return registered.status();
    }
    absl::Status status = OnAddFile(path);
    if (!status.ok()) {
        absl::StatusOr<bool> undone = registry_.Deregister(path);
        if (!undone.ok()) {
            LOG_ERROR(absl::StrCat("FileWatchManager: failed to undo registration of ", path.string(),
                                   ": ", undone.status().ToString()));
        }
        return AnnotateWithPath(status, path);
    }
    return absl::OkStatus();
}

std::vector<fs::path> FileWatchManager::ClaimSet(const fs::path& root, bool follow_symlinks) const {
    std::vector<fs::path> paths{root};
    if (!follow_symlinks) {
        return paths;
    }

    ClaimSetVisitor visitor(root, walker_.filter());
    WalkOptions options;
    options.follow_symlinks = true;
    absl::Status status = WalkFileTree(root, options, visitor);
    if (!status.ok()) {
        LOG_WARNING(absl::StrCat("FileWatchManager: could not analyse ", root.string(), ": ",
                                 status.ToString()));
    }
    for (fs::path& target : visitor.TakePaths()) {
        paths.push_back(std::move(target));
    }
    return paths;
}

}  // namespace treewatch

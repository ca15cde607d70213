#include "treewatch/manager/tree_walker.h"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <optional>
#include <set>
#include <system_error>

#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"
#include "treewatch/common/status.h"

namespace fs = std::filesystem;

namespace treewatch {

namespace {

struct FileId {
    dev_t device;
    ino_t inode;

    bool operator==(const FileId& other) const {
        return device == other.device && inode == other.inode;
    }
};

bool IsVanished(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

class Walker {
public:
    Walker(const WalkOptions& options, TreeVisitor& visitor)
        : options_(options), visitor_(visitor) {}

    absl::Status Walk(const fs::path& path) {
        std::error_code ec;
        fs::file_status status = options_.follow_symlinks ? fs::status(path, ec)
                                                          : fs::symlink_status(path, ec);
        if (ec || status.type() == fs::file_type::not_found) {
            std::error_code link_ec;
            if (options_.follow_symlinks && fs::is_symlink(fs::symlink_status(path, link_ec))) {
                // Dangling link: reported as a plain entry.
                return visitor_.VisitFile(path);
            }
            if (!ec || IsVanished(ec)) {
                return absl::OkStatus();
            }
            return ErrorCodeToStatus(ec, absl::StrCat("Failed to inspect ", path.string()));
        }

        if (!fs::is_directory(status)) {
            return visitor_.VisitFile(path);
        }
        return WalkDirectory(path);
    }

private:
    absl::Status WalkDirectory(const fs::path& dir) {
        FileId id{};
        if (options_.follow_symlinks) {
            struct stat st;
            if (::stat(dir.c_str(), &st) == -1) {
                if (errno == ENOENT) {
                    return absl::OkStatus();
                }
                return absl::ErrnoToStatus(errno, absl::StrCat("Failed to stat ", dir.string()));
            }
            id = FileId{st.st_dev, st.st_ino};
            if (std::find(route_.begin(), route_.end(), id) != route_.end()) {
                LOG_WARNING(absl::StrCat("TreeWalker: skipping symlink cycle at ", dir.string()));
                return absl::OkStatus();
            }
        }

        absl::StatusOr<VisitResult> pre = visitor_.PreVisitDirectory(dir);
        if (!pre.ok()) {
            return pre.status();
        }
        if (*pre == VisitResult::kSkipSubtree) {
            return absl::OkStatus();
        }

        std::vector<fs::path> children;
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec && !IsVanished(ec)) {
            return ErrorCodeToStatus(ec, absl::StrCat("Failed to list ", dir.string()));
        }
        std::sort(children.begin(), children.end());

        if (options_.follow_symlinks) {
            route_.push_back(id);
        }
        for (const fs::path& child : children) {
            absl::Status status = Walk(child);
            if (!status.ok()) {
                return status;
            }
        }
        if (options_.follow_symlinks) {
            route_.pop_back();
        }

        return visitor_.PostVisitDirectory(dir);
    }

    const WalkOptions& options_;
    TreeVisitor& visitor_;
    std::vector<FileId> route_;
};

absl::Status ToStatus(const absl::StatusOr<bool>& result) {
    return result.status();
}

}  // namespace

absl::Status WalkFileTree(const fs::path& root, const WalkOptions& options, TreeVisitor& visitor) {
    Walker walker(options, visitor);
    return walker.Walk(root);
}

absl::Status ApplyToCollection(std::vector<fs::path> paths,
                               const std::function<bool(const fs::path&)>& is_directory,
                               TreeVisitor& visitor) {
    std::stable_sort(paths.begin(), paths.end(), [](const fs::path& a, const fs::path& b) {
        return PathDepth(a) > PathDepth(b);
    });

    std::vector<fs::path> directories;
    std::vector<fs::path> files;
    for (fs::path& path : paths) {
        if (is_directory(path)) {
            directories.push_back(std::move(path));
        } else {
            files.push_back(std::move(path));
        }
    }

    for (const fs::path& dir : directories) {
        absl::StatusOr<VisitResult> pre = visitor.PreVisitDirectory(dir);
        if (!pre.ok()) {
            return pre.status();
        }
    }
    for (const fs::path& file : files) {
        absl::Status status = visitor.VisitFile(file);
        if (!status.ok()) {
            return status;
        }
    }
    for (const fs::path& dir : directories) {
        absl::Status status = visitor.PostVisitDirectory(dir);
        if (!status.ok()) {
            return status;
        }
    }
    return absl::OkStatus();
}

void UndoLog::RecordStep(const fs::path& path, UndoAction action) {
    steps_.emplace_back(path, std::move(action));
}

absl::Status UndoLog::Rewind() {
    absl::Status first_error;
    size_t failures = 0;
    while (!steps_.empty()) {
        auto [path, action] = std::move(steps_.back());
        steps_.pop_back();

        absl::Status status = action(path);
        if (!status.ok()) {
            LOG_ERROR(absl::StrCat("Rollback step failed for ", path.string(), ": ", status.ToString()));
            if (failures++ == 0) {
                first_error = AnnotateWithPath(status, path);
            }
        }
    }
    if (failures > 1) {
        return absl::Status(first_error.code(),
                            absl::StrCat(first_error.message(), " (and ", failures - 1,
                                         " more rollback failures)"));
    }
    return first_error;
}

class TreeWalker::AddVisitor : public TreeVisitor {
public:
    AddVisitor(TreeWalker& walker, UndoLog& undo, const fs::path& root)
        : walker_(walker), undo_(undo), root_(root) {}

    // The walk root is exempt from the filter; it was named explicitly.
    absl::StatusOr<VisitResult> PreVisitDirectory(const fs::path& dir) override {
        if (walker_.registry_.Contains(dir) || (dir != root_ && !walker_.filter_(dir))) {
            return VisitResult::kSkipSubtree;
        }

        absl::StatusOr<WatchedPath> registered = walker_.registry_.Register(dir, PathKind::kDirectory);
        if (!registered.ok()) {
            return registered.status();
        }
        undo_.RecordStep(dir, [this](const fs::path& p) { return ToStatus(walker_.registry_.Deregister(p)); });

        absl::Status status = walker_.callbacks_.OnAddDirectory(dir);
        if (!status.ok()) {
            return status;
        }
        undo_.RecordStep(dir, [this](const fs::path& p) { return walker_.callbacks_.OnRemoveDirectory(p); });
        return VisitResult::kContinue;
    }

    absl::Status VisitFile(const fs::path& file) override {
        if (walker_.registry_.Contains(file) || !walker_.filter_(file)) {
            return absl::OkStatus();
        }

        absl::StatusOr<WatchedPath> registered = walker_.registry_.Register(file, PathKind::kFile);
        if (!registered.ok()) {
            return registered.status();
        }
        undo_.RecordStep(file, [this](const fs::path& p) { return ToStatus(walker_.registry_.Deregister(p)); });

        absl::Status status = walker_.callbacks_.OnAddFile(file);
        if (!status.ok()) {
            return status;
        }
        undo_.RecordStep(file, [this](const fs::path& p) { return walker_.callbacks_.OnRemoveFile(p); });
        return absl::OkStatus();
    }

    absl::Status PostVisitDirectory(const fs::path&) override {
        return absl::OkStatus();
    }

private:
    TreeWalker& walker_;
    UndoLog& undo_;
    const fs::path& root_;
};

class TreeWalker::RemoveVisitor : public TreeVisitor {
public:
    RemoveVisitor(TreeWalker& walker, UndoLog& undo) : walker_(walker), undo_(undo) {}

    // Entries are removed as the kind they were registered with, whatever
    // the disk shows now.
    absl::StatusOr<VisitResult> PreVisitDirectory(const fs::path& dir) override {
        std::optional<WatchedPath> entry = walker_.registry_.Find(dir);
        if (!entry) {
            return VisitResult::kSkipSubtree;
        }
        if (entry->kind == PathKind::kFile) {
            absl::Status status = RemoveFile(dir);
            if (!status.ok()) {
                return status;
            }
            return VisitResult::kSkipSubtree;
        }

        absl::StatusOr<bool> removed = walker_.registry_.Deregister(dir);
        if (!removed.ok()) {
            return removed.status();
        }
        if (!*removed) {
            return VisitResult::kSkipSubtree;
        }
        undo_.RecordStep(dir, [this](const fs::path& p) {
            return walker_.registry_.Register(p, PathKind::kDirectory).status();
        });
        removed_directories_.insert(dir);
        return VisitResult::kContinue;
    }

    absl::Status VisitFile(const fs::path& file) override {
        std::optional<WatchedPath> entry = walker_.registry_.Find(file);
        if (!entry || entry->kind == PathKind::kDirectory) {
            // A directory seen here lost its contents on disk; the registry sweep removes it.
            return absl::OkStatus();
        }
        return RemoveFile(file);
    }

    absl::Status PostVisitDirectory(const fs::path& dir) override {
        if (removed_directories_.count(dir) == 0) {
            return absl::OkStatus();
        }

        // Registered entries the walk could not reach because they left the disk.
        std::vector<fs::path> leftovers = walker_.registry_.PathsUnder(dir);
        if (!leftovers.empty()) {
            absl::Status swept = ApplyToCollection(std::move(leftovers),
                [this](const fs::path& p) { return walker_.registry_.IsDirectory(p); }, *this);
            if (!swept.ok()) {
                return swept;
            }
        }
        removed_directories_.erase(dir);

        absl::Status status = walker_.callbacks_.OnRemoveDirectory(dir);
        if (!status.ok()) {
            return status;
        }
        undo_.RecordStep(dir, [this](const fs::path& p) { return walker_.callbacks_.OnAddDirectory(p); });
        return absl::OkStatus();
    }

private:
    absl::Status RemoveFile(const fs::path& file) {
        absl::StatusOr<bool> removed = walker_.registry_.Deregister(file);
        if (!removed.ok()) {
            return removed.status();
        }
        if (!*removed) {
            return absl::OkStatus();
        }
        undo_.RecordStep(file, [this](const fs::path& p) {
            return walker_.registry_.Register(p, PathKind::kFile).status();
        });

        absl::Status status = walker_.callbacks_.OnRemoveFile(file);
        if (!status.ok()) {
            return status;
        }
        undo_.RecordStep(file, [this](const fs::path& p) { return walker_.callbacks_.OnAddFile(p); });
        return absl::OkStatus();
    }

    TreeWalker& walker_;
    UndoLog& undo_;
    std::set<fs::path> removed_directories_;
};

TreeWalker::TreeWalker(PathRegistry& registry, WatchCallbacks& callbacks, PathFilter filter)
    : registry_(registry), callbacks_(callbacks), filter_(std::move(filter)) {
    if (!filter_) {
        filter_ = DefaultPathFilter();
    }
}

absl::Status TreeWalker::WalkAdd(const fs::path& root, bool follow_symlinks) {
    UndoLog undo;
    AddVisitor visitor(*this, undo, root);
    WalkOptions options;
    options.follow_symlinks = follow_symlinks;

    absl::Status status = WalkFileTree(root, options, visitor);
    if (!status.ok()) {
        return Rollback(status, undo, root);
    }
    return absl::OkStatus();
}

absl::Status TreeWalker::WalkRemove(const fs::path& root) {
    UndoLog undo;
    RemoveVisitor visitor(*this, undo);

    // Followed so that directories added through a symlink are removed as
    // directories; unregistered link targets are skipped on sight.
    WalkOptions options;
    options.follow_symlinks = true;
    absl::Status status = WalkFileTree(root, options, visitor);
    if (status.ok()) {
        // Whatever is left when the root itself was not reachable.
        std::vector<fs::path> leftovers = registry_.PathsUnder(root);
        if (!leftovers.empty()) {
            status = ApplyToCollection(std::move(leftovers),
                [this](const fs::path& p) { return registry_.IsDirectory(p); }, visitor);
        }
    }
    if (!status.ok()) {
        return Rollback(status, undo, root);
    }
    return absl::OkStatus();
}

absl::Status TreeWalker::RemoveCollection(const std::vector<fs::path>& paths) {
    UndoLog undo;
    RemoveVisitor visitor(*this, undo);

    absl::Status status = ApplyToCollection(paths,
        [this](const fs::path& p) { return registry_.IsDirectory(p); }, visitor);
    if (!status.ok()) {
        return Rollback(status, undo, paths.empty() ? fs::path() : paths.front());
    }
    return absl::OkStatus();
}

absl::Status TreeWalker::Rollback(const absl::Status& cause, UndoLog& undo, const fs::path& root) {
    LOG_WARNING(absl::StrCat("TreeWalker: operation on ", root.string(), " failed (", cause.ToString(),
                             "), rolling back ", undo.size(), " steps"));
    absl::Status rewind_status = undo.Rewind();
    if (rewind_status.ok()) {
        return cause;
    }
    absl::Status combined(cause.code(), absl::StrCat(cause.message(), "; rollback also failed: ",
                                                     rewind_status.message()));
    cause.ForEachPayload([&combined](absl::string_view url, const absl::Cord& payload) {
        combined.SetPayload(url, payload);
    });
    return combined;
}

}  // namespace treewatch

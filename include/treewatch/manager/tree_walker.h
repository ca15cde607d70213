#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "treewatch/common/path_utils.h"
#include "treewatch/manager/path_registry.h"
#include "treewatch/manager/watch_callbacks.h"

namespace treewatch {

enum class VisitResult {
    kContinue,
    kSkipSubtree
};

// Visitor for WalkFileTree. Any non-OK status stops the walk.
class TreeVisitor {
public:
    virtual ~TreeVisitor() = default;

    virtual absl::StatusOr<VisitResult> PreVisitDirectory(const std::filesystem::path& dir) = 0;
    virtual absl::Status VisitFile(const std::filesystem::path& file) = 0;
    virtual absl::Status PostVisitDirectory(const std::filesystem::path& dir) = 0;
};

struct WalkOptions {
    // Traverse into symlinked directories. Links that lead back into their
    // own ancestry are skipped.
    bool follow_symlinks = false;
};

// Pre-order directories, then their entries (sorted by name), then post-order
// directories. Entries that disappear during the walk are skipped.
absl::Status WalkFileTree(const std::filesystem::path& root,
                          const WalkOptions& options,
                          TreeVisitor& visitor);

// Replays a visitor over an explicit set of paths, deepest first: all
// directories are pre-visited, then all files visited, then all directories
// post-visited.
absl::Status ApplyToCollection(std::vector<std::filesystem::path> paths,
                               const std::function<bool(const std::filesystem::path&)>& is_directory,
                               TreeVisitor& visitor);

using UndoAction = std::function<absl::Status(const std::filesystem::path&)>;

// Stack of inverse actions recorded during one walk.
class UndoLog {
public:
    void RecordStep(const std::filesystem::path& path, UndoAction action);

    // Applies the recorded actions newest first. Keeps going after a failed
    // action and returns the first failure, annotated with the failure count.
    absl::Status Rewind();

    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

private:
    std::vector<std::pair<std::filesystem::path, UndoAction>> steps_;
};

// Adds or removes whole subtrees against a registry, invoking the callbacks
// for every node and undoing partial progress on failure.
class TreeWalker {
public:
    TreeWalker(PathRegistry& registry, WatchCallbacks& callbacks, PathFilter filter);

    TreeWalker(const TreeWalker&) = delete;
    TreeWalker& operator=(const TreeWalker&) = delete;

    absl::Status WalkAdd(const std::filesystem::path& root, bool follow_symlinks);

    absl::Status WalkRemove(const std::filesystem::path& root);

    // Removal of registered paths that may no longer exist on disk.
    absl::Status RemoveCollection(const std::vector<std::filesystem::path>& paths);

    const PathFilter& filter() const { return filter_; }

private:
    class AddVisitor;
    class RemoveVisitor;

    absl::Status Rollback(const absl::Status& cause, UndoLog& undo, const std::filesystem::path& root);

    PathRegistry& registry_;
    WatchCallbacks& callbacks_;
    PathFilter filter_;
};

}  // namespace treewatch

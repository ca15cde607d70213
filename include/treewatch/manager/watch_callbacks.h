#pragma once

#include <filesystem>

#include <absl/status/status.h>

namespace treewatch {

// Per-node actions invoked while subtrees are added, changed or removed.
// A non-OK status aborts the operation in progress and triggers rollback.
class WatchCallbacks {
public:
    virtual ~WatchCallbacks() = default;

    virtual absl::Status OnAddFile(const std::filesystem::path& path) = 0;
    virtual absl::Status OnAddDirectory(const std::filesystem::path& path) = 0;
    virtual absl::Status OnChangeFile(const std::filesystem::path& path) = 0;
    virtual absl::Status OnChangeDirectory(const std::filesystem::path& path) = 0;
    virtual absl::Status OnRemoveFile(const std::filesystem::path& path) = 0;
    virtual absl::Status OnRemoveDirectory(const std::filesystem::path& path) = 0;
};

}  // namespace treewatch

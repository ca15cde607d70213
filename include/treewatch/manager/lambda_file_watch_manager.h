#pragma once

#include <filesystem>
#include <functional>
#include <memory>

#include <absl/status/statusor.h>

#include "treewatch/manager/file_watch_manager.h"

namespace treewatch {

using PathCallback = std::function<absl::Status(const std::filesystem::path&)>;
using ErrorCallback = std::function<void(const std::filesystem::path&, const absl::Status&)>;

struct LambdaCallbacks {
    PathCallback on_add_file;
    PathCallback on_add_directory;
    PathCallback on_change_file;
    PathCallback on_change_directory;
    PathCallback on_remove_file;
    PathCallback on_remove_directory;
    ErrorCallback handle_exception;
};

// Forwards every callback to a caller-supplied function.
class LambdaFileWatchManager : public FileWatchManager {
public:
    // Every function must be set.
    static absl::StatusOr<std::unique_ptr<LambdaFileWatchManager>> Create(
        std::shared_ptr<IWatchService> watch_service,
        LambdaCallbacks callbacks,
        const WatchManagerConfig& config);

    // Files and directories share one function per change kind.
    static absl::StatusOr<std::unique_ptr<LambdaFileWatchManager>> Create(
        std::shared_ptr<IWatchService> watch_service,
        PathCallback on_add,
        PathCallback on_remove,
        PathCallback on_change,
        ErrorCallback handle_exception,
        const WatchManagerConfig& config);

    ~LambdaFileWatchManager() override;

protected:
    absl::Status OnAddFile(const std::filesystem::path& path) override;
    absl::Status OnAddDirectory(const std::filesystem::path& path) override;
    absl::Status OnChangeFile(const std::filesystem::path& path) override;
    absl::Status OnChangeDirectory(const std::filesystem::path& path) override;
    absl::Status OnRemoveFile(const std::filesystem::path& path) override;
    absl::Status OnRemoveDirectory(const std::filesystem::path& path) override;
    void HandleException(const std::filesystem::path& path, const absl::Status& status) override;

private:
    LambdaFileWatchManager(std::shared_ptr<IWatchService> watch_service,
                           LambdaCallbacks callbacks,
                           const WatchManagerConfig& config);

    const LambdaCallbacks callbacks_;
};

}  // namespace treewatch

#pragma once

#include <filesystem>
#include <memory>

#include "treewatch/manager/file_watch_manager.h"

namespace treewatch {

// Keeps the set of watched paths current and does nothing else.
class SimpleFileWatchManager : public FileWatchManager {
public:
    SimpleFileWatchManager(std::shared_ptr<IWatchService> watch_service, const WatchManagerConfig& config);
    ~SimpleFileWatchManager() override;

protected:
    absl::Status OnAddFile(const std::filesystem::path& path) override;
    absl::Status OnAddDirectory(const std::filesystem::path& path) override;
    absl::Status OnChangeFile(const std::filesystem::path& path) override;
    absl::Status OnChangeDirectory(const std::filesystem::path& path) override;
    absl::Status OnRemoveFile(const std::filesystem::path& path) override;
    absl::Status OnRemoveDirectory(const std::filesystem::path& path) override;
    void HandleException(const std::filesystem::path& path, const absl::Status& status) override;
};

}  // namespace treewatch

#include "treewatch/manager/simple_file_watch_manager.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"

namespace treewatch {

SimpleFileWatchManager::SimpleFileWatchManager(std::shared_ptr<IWatchService> watch_service,
                                               const WatchManagerConfig& config)
    : FileWatchManager(std::move(watch_service), config) {
}

SimpleFileWatchManager::~SimpleFileWatchManager() {
    // Stop the workers while the overrides are still in place.
    absl::Status status = Close();
    if (!status.ok()) {
        LOG_WARNING(absl::StrCat("SimpleFileWatchManager: close failed: ", status.ToString()));
    }
}

absl::Status SimpleFileWatchManager::OnAddFile(const std::filesystem::path&) {
    return absl::OkStatus();
}

absl::Status SimpleFileWatchManager::OnAddDirectory(const std::filesystem::path&) {
    return absl::OkStatus();
}

absl::Status SimpleFileWatchManager::OnChangeFile(const std::filesystem::path&) {
    return absl::OkStatus();
}

absl::Status SimpleFileWatchManager::OnChangeDirectory(const std::filesystem::path&) {
    return absl::OkStatus();
}

absl::Status SimpleFileWatchManager::OnRemoveFile(const std::filesystem::path&) {
    return absl::OkStatus();
}

absl::Status SimpleFileWatchManager::OnRemoveDirectory(const std::filesystem::path&) {
    return absl::OkStatus();
}

void SimpleFileWatchManager::HandleException(const std::filesystem::path&, const absl::Status&) {
}

}  // namespace treewatch

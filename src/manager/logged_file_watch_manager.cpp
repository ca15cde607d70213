#include "treewatch/manager/logged_file_watch_manager.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"

namespace treewatch {

LoggedFileWatchManager::LoggedFileWatchManager(std::shared_ptr<IWatchService> watch_service,
                                               const WatchManagerConfig& config)
    : FileWatchManager(std::move(watch_service), config) {
}

LoggedFileWatchManager::~LoggedFileWatchManager() {
    absl::Status status = Close();
    if (!status.ok()) {
        LOG_ERROR(absl::StrCat("Close failed: ", status.ToString()));
    }
}

absl::Status LoggedFileWatchManager::OnAddFile(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Added file: ", path.string()));
    return absl::OkStatus();
}

absl::Status LoggedFileWatchManager::OnAddDirectory(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Added directory: ", path.string()));
    return absl::OkStatus();
}

absl::Status LoggedFileWatchManager::OnChangeFile(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Changed file: ", path.string()));
    return absl::OkStatus();
}

absl::Status LoggedFileWatchManager::OnChangeDirectory(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Changed directory: ", path.string()));
    return absl::OkStatus();
}

absl::Status LoggedFileWatchManager::OnRemoveFile(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Removed file: ", path.string()));
    return absl::OkStatus();
}

absl::Status LoggedFileWatchManager::OnRemoveDirectory(const std::filesystem::path& path) {
    LOG_INFO(absl::StrCat("Removed directory: ", path.string()));
    return absl::OkStatus();
}

void LoggedFileWatchManager::HandleException(const std::filesystem::path& path, const absl::Status& status) {
    LOG_ERROR(absl::StrCat("Failed to process ", path.string(), ": ", status.ToString()));
}

}  // namespace treewatch

#include "treewatch/manager/lambda_file_watch_manager.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "treewatch/common/logger.h"

namespace treewatch {

namespace {

absl::Status CheckSet(bool is_set, const char* name) {
    if (!is_set) {
        return absl::InvalidArgumentError(absl::StrCat("Callback ", name, " must not be empty"));
    }
    return absl::OkStatus();
}

absl::Status Validate(const LambdaCallbacks& callbacks) {
    const std::pair<bool, const char*> checks[] = {
        {static_cast<bool>(callbacks.on_add_file), "on_add_file"},
        {static_cast<bool>(callbacks.on_add_directory), "on_add_directory"},
        {static_cast<bool>(callbacks.on_change_file), "on_change_file"},
        {static_cast<bool>(callbacks.on_change_directory), "on_change_directory"},
        {static_cast<bool>(callbacks.on_remove_file), "on_remove_file"},
        {static_cast<bool>(callbacks.on_remove_directory), "on_remove_directory"},
        {static_cast<bool>(callbacks.handle_exception), "handle_exception"},
    };
    for (const auto& [is_set, name] : checks) {
        absl::Status status = CheckSet(is_set, name);
        if (!status.ok()) {
            return status;
        }
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<LambdaFileWatchManager>> LambdaFileWatchManager::Create(
    std::shared_ptr<IWatchService> watch_service,
    LambdaCallbacks callbacks,
    const WatchManagerConfig& config) {
    if (!watch_service) {
        return absl::InvalidArgumentError("Watch service must not be null");
    }
    absl::Status status = Validate(callbacks);
    if (!status.ok()) {
        return status;
    }
    return std::unique_ptr<LambdaFileWatchManager>(
        new LambdaFileWatchManager(std::move(watch_service), std::move(callbacks), config));
}

absl::StatusOr<std::unique_ptr<LambdaFileWatchManager>> LambdaFileWatchManager::Create(
    std::shared_ptr<IWatchService> watch_service,
    PathCallback on_add,
    PathCallback on_remove,
    PathCallback on_change,
    ErrorCallback handle_exception,
    const WatchManagerConfig& config) {
    LambdaCallbacks callbacks;
    callbacks.on_add_file = on_add;
    callbacks.on_add_directory = std::move(on_add);
    callbacks.on_change_file = on_change;
    callbacks.on_change_directory = std::move(on_change);
    callbacks.on_remove_file = on_remove;
    callbacks.on_remove_directory = std::move(on_remove);
    callbacks.handle_exception = std::move(handle_exception);
    return Create(std::move(watch_service), std::move(callbacks), config);
}

LambdaFileWatchManager::LambdaFileWatchManager(std::shared_ptr<IWatchService> watch_service,
                                               LambdaCallbacks callbacks,
                                               const WatchManagerConfig& config)
    : FileWatchManager(std::move(watch_service), config),
      callbacks_(std::move(callbacks)) {
}

LambdaFileWatchManager::~LambdaFileWatchManager() {
    absl::Status status = Close();
    if (!status.ok()) {
        LOG_ERROR(absl::StrCat("LambdaFileWatchManager: close failed: ", status.ToString()));
    }
}

absl::Status LambdaFileWatchManager::OnAddFile(const std::filesystem::path& path) {
    return callbacks_.on_add_file(path);
}

absl::Status LambdaFileWatchManager::OnAddDirectory(const std::filesystem::path& path) {
    return callbacks_.on_add_directory(path);
}

absl::Status LambdaFileWatchManager::OnChangeFile(const std::filesystem::path& path) {
    return callbacks_.on_change_file(path);
}

absl::Status LambdaFileWatchManager::OnChangeDirectory(const std::filesystem::path& path) {
    return callbacks_.on_change_directory(path);
}

absl::Status LambdaFileWatchManager::OnRemoveFile(const std::filesystem::path& path) {
    return callbacks_.on_remove_file(path);
}

absl::Status LambdaFileWatchManager::OnRemoveDirectory(const std::filesystem::path& path) {
    return callbacks_.on_remove_directory(path);
}

void LambdaFileWatchManager::HandleException(const std::filesystem::path& path, const absl::Status& status) {
    callbacks_.handle_exception(path, status);
}

}  // namespace treewatch

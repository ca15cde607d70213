#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

namespace treewatch {

// Type URL of the payload that tags treewatch-specific failures.
inline constexpr absl::string_view kErrorPayloadUrl = "treewatch.dev/error";

// Returned by every operation attempted after the manager has been closed.
absl::Status ManagerClosedError();

// Returned by Add/Remove when the given path is not a directory.
absl::Status NotDirectoryError(const std::filesystem::path& path);

bool IsManagerClosed(const absl::Status& status);
bool IsNotDirectory(const absl::Status& status);

// Converts a std::filesystem error into a canonical status.
absl::Status ErrorCodeToStatus(const std::error_code& ec, absl::string_view context);

// Prefixes the message of a non-OK status with the given path.
absl::Status AnnotateWithPath(const absl::Status& status, const std::filesystem::path& path);

}  // namespace treewatch

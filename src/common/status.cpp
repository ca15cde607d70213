#include "treewatch/common/status.h"

#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>
#include <absl/types/optional.h>

namespace treewatch {

namespace {

constexpr absl::string_view kManagerClosedTag = "manager_closed";
constexpr absl::string_view kNotDirectoryTag = "not_directory";

bool HasTag(const absl::Status& status, absl::string_view tag) {
    absl::optional<absl::Cord> payload = status.GetPayload(kErrorPayloadUrl);
    return payload.has_value() && *payload == tag;
}

}  // namespace

absl::Status ManagerClosedError() {
    absl::Status status = absl::FailedPreconditionError("File watch manager is closed");
    status.SetPayload(kErrorPayloadUrl, absl::Cord(kManagerClosedTag));
    return status;
}

absl::Status NotDirectoryError(const std::filesystem::path& path) {
    absl::Status status = absl::InvalidArgumentError(
        absl::StrCat("Not a directory: ", path.string()));
    status.SetPayload(kErrorPayloadUrl, absl::Cord(kNotDirectoryTag));
    return status;
}

bool IsManagerClosed(const absl::Status& status) {
    return status.code() == absl::StatusCode::kFailedPrecondition &&
           HasTag(status, kManagerClosedTag);
}

bool IsNotDirectory(const absl::Status& status) {
    return status.code() == absl::StatusCode::kInvalidArgument &&
           HasTag(status, kNotDirectoryTag);
}

absl::Status ErrorCodeToStatus(const std::error_code& ec, absl::string_view context) {
    if (!ec) {
        return absl::OkStatus();
    }
    const std::string message = absl::StrCat(context, ": ", ec.message());
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return absl::ErrnoToStatus(ec.value(), message);
    }
    return absl::UnknownError(message);
}

absl::Status AnnotateWithPath(const absl::Status& status, const std::filesystem::path& path) {
    if (status.ok()) {
        return status;
    }
    absl::Status annotated(status.code(), absl::StrCat(path.string(), ": ", status.message()));
    status.ForEachPayload([&annotated](absl::string_view url, const absl::Cord& payload) {
        annotated.SetPayload(url, payload);
    });
    return annotated;
}

}  // namespace treewatch

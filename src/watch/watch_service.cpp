#include "treewatch/watch/watch_service.h"

namespace treewatch {

absl::string_view ChangeKindName(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::kCreated:
        return "CREATED";
    case ChangeKind::kModified:
        return "MODIFIED";
    case ChangeKind::kDeleted:
        return "DELETED";
    }
    return "UNKNOWN";
}

}  // namespace treewatch

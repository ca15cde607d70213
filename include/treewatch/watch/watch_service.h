#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

namespace treewatch {

enum class ChangeKind {
    kCreated,
    kModified,
    kDeleted
};

absl::string_view ChangeKindName(ChangeKind kind);

// Opaque token for one active directory subscription.
using WatchHandle = int;

// One change reported by the watch service. `context` is relative to the
// directory that produced it.
struct RawEvent {
    ChangeKind kind;
    std::filesystem::path context;
};

// A burst: the events accumulated for one directory handle since the last poll.
struct WatchSignal {
    WatchHandle handle;
    std::filesystem::path directory;
    std::vector<RawEvent> events;
};

/* This interface represents the OS-level change notification service. */
/* It only knows about individual directories; recursion is up to the user. */
class IWatchService {
public:
    virtual ~IWatchService() = default;

    // Subscribe to create/modify/delete notifications for one directory.
    virtual absl::StatusOr<WatchHandle> Register(const std::filesystem::path& directory) = 0;

    // Drop a subscription. Cancelling an unknown handle is NotFound.
    virtual absl::Status Cancel(WatchHandle handle) = 0;

    // Wait up to `timeout` for signals. An empty result means the wait timed out.
    // Returns Cancelled once the service has been closed.
    virtual absl::StatusOr<std::vector<WatchSignal>> Poll(std::chrono::milliseconds timeout) = 0;

    // Release every subscription and wake any pending Poll. Idempotent.
    virtual void Close() = 0;

    virtual bool IsClosed() const = 0;

    // Number of subscriptions currently alive.
    virtual size_t ActiveHandleCount() const = 0;
};

}  // namespace treewatch

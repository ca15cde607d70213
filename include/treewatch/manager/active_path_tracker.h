#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace treewatch {

// An exclusive reservation on a set of paths and everything below them.
class ActiveClaim {
public:
    explicit ActiveClaim(std::vector<std::filesystem::path> paths);

    ActiveClaim(const ActiveClaim&) = delete;
    ActiveClaim& operator=(const ActiveClaim&) = delete;

    const std::vector<std::filesystem::path>& paths() const { return paths_; }

    bool IsDone() const;

    // Blocks until the claim has been released.
    void Wait() const;

private:
    friend class ActivePathTracker;

    std::vector<std::filesystem::path> paths_;
    std::promise<void> promise_;
    std::shared_future<void> done_;
    bool released_ = false;  // guarded by the tracker mutex
};

/* Serialises operations whose path subtrees overlap while letting
   operations on disjoint subtrees run in parallel. */
class ActivePathTracker {
public:
    ActivePathTracker() = default;

    ActivePathTracker(const ActivePathTracker&) = delete;
    ActivePathTracker& operator=(const ActivePathTracker&) = delete;

    // Installs a claim and blocks until every earlier claim on an ancestor or
    // descendant of one of the paths has been released.
    std::shared_ptr<ActiveClaim> Claim(const std::filesystem::path& path);
    std::shared_ptr<ActiveClaim> Claim(const std::vector<std::filesystem::path>& paths);

    // Signals waiters and drops the claim's mappings. Null and repeated releases are ignored.
    void Release(const std::shared_ptr<ActiveClaim>& claim);

    // Number of path mappings currently held.
    size_t active_size() const;

private:
    mutable std::mutex mutex_;
    // Each path points at the most recent claim touching it.
    std::map<std::filesystem::path, std::shared_ptr<ActiveClaim>> active_;
};

// Releases the held claim when it goes out of scope.
class ScopedClaim {
public:
    ScopedClaim(ActivePathTracker& tracker, std::shared_ptr<ActiveClaim> claim)
        : tracker_(tracker), claim_(std::move(claim)) {}

    ~ScopedClaim() { tracker_.Release(claim_); }

    ScopedClaim(const ScopedClaim&) = delete;
    ScopedClaim& operator=(const ScopedClaim&) = delete;

private:
    ActivePathTracker& tracker_;
    std::shared_ptr<ActiveClaim> claim_;
};

}  // namespace treewatch

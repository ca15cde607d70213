#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "treewatch/watch/watch_service.h"

namespace treewatch {

// A change translated to an absolute path, waiting to be processed once.
struct PendingEvent {
    ChangeKind kind;
    std::filesystem::path path;
    uint64_t sequence = 0;
};

// Lower values are dequeued first: CREATED, then MODIFIED, then DELETED.
int ChangeKindPriority(ChangeKind kind);

// Bounded blocking priority queue. Events of the same kind leave in arrival order.
class EventQueue {
public:
    explicit EventQueue(size_t capacity);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Waits up to `timeout` for free space. False on timeout or after Shutdown.
    bool Push(ChangeKind kind, std::filesystem::path path, std::chrono::milliseconds timeout);

    // Waits up to `timeout` for an event. nullopt on timeout or after Shutdown.
    std::optional<PendingEvent> Pop(std::chrono::milliseconds timeout);

    // Wakes every waiter and discards queued events.
    void Shutdown();

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    struct LaterFirst {
        bool operator()(const PendingEvent& a, const PendingEvent& b) const;
    };

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::priority_queue<PendingEvent, std::vector<PendingEvent>, LaterFirst> queue_;
    uint64_t next_sequence_ = 0;
    bool shutdown_ = false;
};

}  // namespace treewatch

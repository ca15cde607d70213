#include "treewatch/manager/event_queue.h"

#include <utility>

namespace treewatch {

int ChangeKindPriority(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::kCreated:
        return 0;
    case ChangeKind::kModified:
        return 1;
    case ChangeKind::kDeleted:
        return 2;
    }
    return 3;
}

bool EventQueue::LaterFirst::operator()(const PendingEvent& a, const PendingEvent& b) const {
    const int a_priority = ChangeKindPriority(a.kind);
    const int b_priority = ChangeKindPriority(b.kind);
    if (a_priority != b_priority) {
        return a_priority > b_priority;
    }
    return a.sequence > b.sequence;
}

EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {
}

bool EventQueue::Push(ChangeKind kind, std::filesystem::path path, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this]() { return shutdown_ || queue_.size() < capacity_; })) {
            return false;
        }
        if (shutdown_) {
            return false;
        }
        queue_.push(PendingEvent{kind, std::move(path), next_sequence_++});
    }
    not_empty_.notify_one();
    return true;
}

std::optional<PendingEvent> EventQueue::Pop(std::chrono::milliseconds timeout) {
    std::optional<PendingEvent> event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() { return shutdown_ || !queue_.empty(); })) {
            return std::nullopt;
        }
        if (shutdown_) {
            return std::nullopt;
        }
        event = queue_.top();
        queue_.pop();
    }
    not_full_.notify_one();
    return event;
}

void EventQueue::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        queue_ = decltype(queue_)();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace treewatch

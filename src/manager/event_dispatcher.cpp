#include "treewatch/manager/event_dispatcher.h"

#include <exception>
#include <utility>

#include <absl/strings/str_cat.h>
#include <boost/asio/post.hpp>

#include "treewatch/common/logger.h"
#include "treewatch/common/status.h"

namespace treewatch {

EventDispatcher::EventDispatcher(std::shared_ptr<IWatchService> watch_service,
                                 Options options,
                                 Processor processor,
                                 ErrorHandler error_handler)
    : watch_service_(std::move(watch_service)),
      options_(std::move(options)),
      processor_(std::move(processor)),
      error_handler_(std::move(error_handler)),
      queue_(options_.queue_capacity),
      pool_(options_.worker_threads > 0 ? options_.worker_threads : 1) {
    if (!options_.filter) {
        options_.filter = DefaultPathFilter();
    }
}

EventDispatcher::~EventDispatcher() {
    Stop();
}

void EventDispatcher::Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ || stopped_) {
        LOG_DEBUG("EventDispatcher: Already started, ignoring Start()");
        return;
    }

    running_ = true;
    reaping_ = true;
    reader_thread_ = std::thread([this]() { ReadLoop(); });
    dispatcher_thread_ = std::thread([this]() { DispatchLoop(); });
    reaper_thread_ = std::thread([this]() { ReapLoop(); });
    LOG_DEBUG(absl::StrCat("EventDispatcher: started with ", options_.worker_threads, " workers"));
}

void EventDispatcher::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    running_ = false;

    // Background loops notice the flag on their next poll timeout.
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    queue_.Shutdown();
    if (dispatcher_thread_.joinable()) {
        dispatcher_thread_.join();
    }

    pool_.join();
    // Events still queued at shutdown are dropped.
    in_flight_ = 0;

    reaping_ = false;
    completed_cv_.notify_all();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
    LOG_DEBUG("EventDispatcher: stopped");
}

bool EventDispatcher::IsRunning() const {
    return running_;
}

bool EventDispatcher::Enqueue(ChangeKind kind, std::filesystem::path path) {
    if (!running_) {
        return false;
    }
    ++in_flight_;
    if (!queue_.Push(kind, std::move(path), options_.poll_timeout)) {
        --in_flight_;
        return false;
    }
    return true;
}

size_t EventDispatcher::InFlight() const {
    return in_flight_;
}

void EventDispatcher::ReadLoop() {
    while (running_) {
        absl::StatusOr<std::vector<WatchSignal>> signals = watch_service_->Poll(options_.poll_timeout);
        if (!signals.ok()) {
            if (absl::IsCancelled(signals.status())) {
                if (running_) {
                    LOG_WARNING("EventDispatcher: watch service closed underneath the dispatcher");
                }
                break;
            }
            LOG_WARNING(absl::StrCat("EventDispatcher: poll failed: ", signals.status().ToString()));
            std::this_thread::sleep_for(options_.poll_timeout);
            continue;
        }

        for (WatchSignal& signal : *signals) {
            for (RawEvent& raw : signal.events) {
                std::filesystem::path path = signal.directory / raw.context;
                if (!options_.filter(path)) {
                    continue;
                }
                ++in_flight_;
                bool queued = false;
                while (running_ && !(queued = queue_.Push(raw.kind, path, options_.poll_timeout))) {
                    LOG_DEBUG("EventDispatcher: event queue full, waiting");
                }
                if (!queued) {
                    --in_flight_;
                }
            }
        }
    }
}

void EventDispatcher::DispatchLoop() {
    while (running_) {
        std::optional<PendingEvent> event = queue_.Pop(options_.poll_timeout);
        if (!event) {
            continue;
        }
        Submit(std::move(*event));
    }
}

void EventDispatcher::Submit(PendingEvent event) {
    boost::asio::post(pool_, [this, event = std::move(event)]() {
        absl::Status status;
        try {
            status = processor_(event.kind, event.path);
        } catch (const std::exception& e) {
            status = absl::InternalError(absl::StrCat("Unhandled exception: ", e.what()));
        }
        Complete(CompletedEvent{event.path, std::move(status)});
        --in_flight_;
    });
}

void EventDispatcher::Complete(CompletedEvent completed) {
    {
        std::lock_guard<std::mutex> lock(completed_mutex_);
        completed_.push_back(std::move(completed));
    }
    completed_cv_.notify_one();
}

void EventDispatcher::ReapLoop() {
    while (true) {
        CompletedEvent completed;
        {
            std::unique_lock<std::mutex> lock(completed_mutex_);
            completed_cv_.wait_for(lock, options_.poll_timeout,
                                   [this]() { return !completed_.empty() || !reaping_; });
            if (completed_.empty()) {
                if (!reaping_) {
                    break;
                }
                continue;
            }
            completed = std::move(completed_.front());
            completed_.pop_front();
        }

        if (completed.status.ok()) {
            continue;
        }
        if (!running_ && IsManagerClosed(completed.status)) {
            LOG_DEBUG(absl::StrCat("EventDispatcher: dropped event for ", completed.path.string(),
                                   " during shutdown"));
            continue;
        }
        try {
            error_handler_(completed.path, completed.status);
        } catch (const std::exception& e) {
            LOG_ERROR(absl::StrCat("EventDispatcher: error handler threw for ", completed.path.string(),
                                   ": ", e.what()));
        }
    }
}

}  // namespace treewatch

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <absl/status/status.h>
#include <boost/asio/thread_pool.hpp>

#include "treewatch/common/path_utils.h"
#include "treewatch/manager/event_queue.h"
#include "treewatch/watch/watch_service.h"

namespace treewatch {

// Bridges the watch service into processed events:
//   reader thread     - polls the service, resolves and filters events, fills the queue
//   dispatcher thread - drains the queue in priority order into the worker pool
//   reaper thread     - collects finished work and reports failures
class EventDispatcher {
public:
    using Processor = std::function<absl::Status(ChangeKind, const std::filesystem::path&)>;
    using ErrorHandler = std::function<void(const std::filesystem::path&, const absl::Status&)>;

    struct Options {
        size_t worker_threads = 1;
        std::chrono::milliseconds poll_timeout{500};
        size_t queue_capacity = 4096;
        PathFilter filter;
    };

    EventDispatcher(std::shared_ptr<IWatchService> watch_service,
                    Options options,
                    Processor processor,
                    ErrorHandler error_handler);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    void Start();

    // Joins the background threads and waits for in-flight work. Queued but
    // not yet submitted events are dropped. Idempotent.
    void Stop();

    bool IsRunning() const;

    // Queue an already-resolved event as if the watch service had reported it.
    bool Enqueue(ChangeKind kind, std::filesystem::path path);

    // Events queued or being processed.
    size_t InFlight() const;

private:
    struct CompletedEvent {
        std::filesystem::path path;
        absl::Status status;
    };

    void ReadLoop();
    void DispatchLoop();
    void ReapLoop();

    void Submit(PendingEvent event);
    void Complete(CompletedEvent completed);

    std::shared_ptr<IWatchService> watch_service_;
    Options options_;
    Processor processor_;
    ErrorHandler error_handler_;

    EventQueue queue_;
    boost::asio::thread_pool pool_;
    std::atomic<size_t> in_flight_{0};

    std::mutex completed_mutex_;
    std::condition_variable completed_cv_;
    std::deque<CompletedEvent> completed_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> reaping_{false};
    bool stopped_ = false;

    std::thread reader_thread_;
    std::thread dispatcher_thread_;
    std::thread reaper_thread_;
};

}  // namespace treewatch

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace assetsync {

enum class EventKind {
    Log,
    Started,
    CheckProgress,
    FileProgress,
    FileCompleted,
    OverallProgress,
    Statistics,
    VerifyResult,
    Finished,
    Cancelled
};

std::string_view toTag(EventKind kind);

struct ProgressEvent {
    EventKind kind = EventKind::Log;
    std::string filename;
    double percent = 0.0;
    bool success = false;
    std::string message;
    std::size_t completed = 0;
    std::size_t total = 0;
};

using EventListener = std::function<void(const ProgressEvent&)>;

/**
 * @brief Single-consumer queue delivering progress events to one listener.
 *
 * publish() is safe from any thread and never blocks on the listener. Events are
 * delivered in publish order on the channel's own thread. After close() further events
 * are dropped.
 */
class EventChannel {
public:
    explicit EventChannel(EventListener listener);
    ~EventChannel();

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void publish(ProgressEvent event);

    // Convenience for EventKind::Log
    void log(std::string message);

    // Block until everything published so far has been delivered
    void flush();

    // Deliver what is queued, then stop the dispatch thread
    void close();

    std::size_t delivered() const;

private:
    void run();

    EventListener listener_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::deque<ProgressEvent> queue_;
    std::size_t delivered_ = 0;
    bool dispatching_ = false;
    bool closed_ = false;
    bool stopped_ = false;
    std::thread worker_;
};

} // namespace assetsync

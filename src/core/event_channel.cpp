#include <assetsync/core/event_channel.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace assetsync {

std::string_view toTag(EventKind kind) {
    switch (kind) {
        case EventKind::Log: return "log";
        case EventKind::Started: return "started";
        case EventKind::CheckProgress: return "check_progress";
        case EventKind::FileProgress: return "file_progress";
        case EventKind::FileCompleted: return "file_completed";
        case EventKind::OverallProgress: return "overall_progress";
        case EventKind::Statistics: return "statistics";
        case EventKind::VerifyResult: return "verify_result";
        case EventKind::Finished: return "finished";
        case EventKind::Cancelled: return "cancelled";
    }
    return "log";
}

EventChannel::EventChannel(EventListener listener)
    : listener_(std::move(listener)), worker_([this] { run(); }) {}

EventChannel::~EventChannel() {
    close();
}

void EventChannel::publish(ProgressEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_)
            return;
        queue_.push_back(std::move(event));
    }
    wake_.notify_one();
}

void EventChannel::log(std::string message) {
    ProgressEvent ev;
    ev.kind = EventKind::Log;
    ev.message = std::move(message);
    publish(std::move(ev));
}

void EventChannel::flush() {
    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this] { return (queue_.empty() && !dispatching_) || stopped_; });
}

void EventChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::size_t EventChannel::delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

void EventChannel::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty() && closed_)
            break;

        ProgressEvent ev = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;
        lock.unlock();

        if (listener_) {
            try {
                listener_(ev);
            } catch (const std::exception& e) {
                spdlog::warn("event listener threw on {}: {}", toTag(ev.kind), e.what());
            }
        }

        lock.lock();
        dispatching_ = false;
        ++delivered_;
        if (queue_.empty())
            drained_.notify_all();
    }
    stopped_ = true;
    drained_.notify_all();
}

} // namespace assetsync

#pragma once

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace assetsync {

/**
 * @brief Fixed-size pool of worker threads draining a FIFO task queue.
 *
 * The number of threads is the hard bound on concurrently running tasks.
 * waitIdle() blocks until the queue is empty and no task is executing, which lets
 * callers run work in sequential batches on one pool.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads) {
        if (threads == 0)
            threads = 1;
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { run(); });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard lock(queueMutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <class F> void enqueue(F&& f) {
        {
            std::lock_guard lock(queueMutex_);
            tasks_.emplace(std::forward<F>(f));
        }
        condition_.notify_one();
    }

    void waitIdle() {
        std::unique_lock lock(queueMutex_);
        idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
    }

    std::size_t size() const { return workers_.size(); }

    std::size_t getQueueSize() const {
        std::lock_guard lock(queueMutex_);
        return tasks_.size();
    }

private:
    void run() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock lock(queueMutex_);
                condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
                ++active_;
            }

            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("worker task failed: {}", e.what());
            } catch (...) {
                spdlog::error("worker task failed: unknown exception");
            }

            {
                std::lock_guard lock(queueMutex_);
                --active_;
                if (tasks_.empty() && active_ == 0) {
                    idle_.notify_all();
                }
            }
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    std::size_t active_ = 0;
    bool stop_ = false;
};

} // namespace assetsync

#pragma once

#include "log.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace reloader {

// Fixed set of threads draining a FIFO of jobs. With one thread, jobs run in push order.
class WorkerPool {
public:
    using job = std::function<void()>;

    explicit WorkerPool(size_t n_threads) {
        for (size_t i = 0; i < n_threads; ++i) {
            threads_.emplace_back(&WorkerPool::run, this);
        }
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool & operator=(const WorkerPool &) = delete;

    // false once the pool is stopping
    bool push(job j) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                return false;
            }
            queue_.push(std::move(j));
        }
        cv_.notify_one();
        return true;
    }

    // runs what is already queued, then joins
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto & t : threads_) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                t.join();
            }
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    void run() {
        while (true) {
            job j;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || stop_; });

                if (stop_ && queue_.empty()) {
                    return;
                }

                j = std::move(queue_.front());
                queue_.pop();
            }

            try {
                j();
            } catch (const std::exception & e) {
                RELOADER_LOG_ERROR("%s: job failed: %s\n", __func__, e.what());
            }
        }
    }

    std::queue<job>          queue_;
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    bool                     stop_ = false;
    std::vector<std::thread> threads_;
};

} // namespace reloader

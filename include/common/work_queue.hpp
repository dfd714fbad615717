//! # Work Queue
//!
//! Thread-safe FIFO shared by a fixed set of worker threads. Used by the
//! scanner (one job per directory) and by the task scheduler (one job per
//! stale unit).
//!
//! Workers call `pop()` with a short timeout and re-check their exit
//! condition when it returns `std::nullopt`, so a stopped or drained queue
//! never leaves a thread blocked.

#ifndef CYFORGE_COMMON_WORK_QUEUE_HPP
#define CYFORGE_COMMON_WORK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace cyforge {

template <typename T> class WorkQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    /// Pops the next item, waiting up to `timeout_ms` for one to arrive.
    std::optional<T> pop(int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (queue_.empty() && !stopped_) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                         [this] { return !queue_.empty() || stopped_; });
        }

        if (queue_.empty() || stopped_) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /// Wakes every waiter; later pops return nothing.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

} // namespace cyforge

#endif // CYFORGE_COMMON_WORK_QUEUE_HPP

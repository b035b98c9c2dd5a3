#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace gest {
namespace core {

/**
 * Thread-safe bounded FIFO between a producer and one consumer thread
 *
 * try_push() drops when full. stop() wakes every waiter; after it no item
 * is accepted or handed out.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t max_size = 100)
        : max_size_(max_size), stop_flag_(false) {}

    /**
     * @return false if the queue is full or stopped
     */
    bool try_push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_flag_ || queue_.size() >= max_size_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& item, int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool success = cv_empty_.wait_for(lock,
            std::chrono::milliseconds(timeout_ms),
            [this] { return !queue_.empty() || stop_flag_; });

        if (stop_flag_ || !success || queue_.empty()) {
            return false;
        }

        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_flag_ = true;
        cv_empty_.notify_all();
    }

    /**
     * Accept items again after stop(); pending items are discarded
     * @return Number of discarded items
     */
    size_t restart() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t discarded = queue_.size();
        std::queue<T>().swap(queue_);
        stop_flag_ = false;
        return discarded;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return max_size_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_empty_;
    std::queue<T> queue_;
    size_t max_size_;
    std::atomic<bool> stop_flag_;
};

} // namespace core
} // namespace gest

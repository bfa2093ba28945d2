#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace core {

// Thread-safe FIFO shared between a real-time producer and a slower consumer.
// Design: the producer (audio callback, capture loop) never blocks - push always succeeds.
//         When the queue is full the oldest element is evicted and handed back to the
//         producer so it can account for the loss (overrun report, reorder-buffer skip).
//         stop() wakes every waiting consumer; pop() then returns false once drained.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t max_size) : max_size_(max_size == 0 ? 1 : max_size) {}

    // Push an element. Returns the evicted oldest element if the queue overflowed.
    // Pushing to a stopped queue is a no-op that returns the element itself.
    std::optional<T> push(T&& item) {
        std::optional<T> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return std::optional<T>(std::move(item));
            }
            if (queue_.size() >= max_size_) {
                evicted.emplace(std::move(queue_.front()));
                queue_.pop_front();
                ++dropped_count_;
            }
            queue_.push_back(std::move(item));
        }
        cv_pop_.notify_one();
        return evicted;
    }

    // Blocks until an element is available or the queue is stopped.
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Signal stop (no more elements accepted, waiting consumers wake up)
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_pop_.notify_all();
    }

    // Remove and return everything still queued
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(queue_.size());
        for (auto& item : queue_) {
            out.push_back(std::move(item));
        }
        queue_.clear();
        return out;
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return max_size_; }

    size_t dropped_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;   // Notifies pop() when data available or stopped
    std::deque<T> queue_;
    const size_t max_size_;
    bool stopped_ = false;
    size_t dropped_count_ = 0;
};

} // namespace core

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace huginn {

/**
 * @brief Thread-safe queue between a socket reader and a session worker
 *
 * push() never blocks: live audio keeps arriving even when recognition falls
 * behind. Once more than `max_size` items are waiting, the oldest droppable
 * items are dropped so the worker catches up with real time. Items the
 * `droppable` predicate rejects (control commands) are always delivered.
 */
template <typename T>
class BlockQueue {
public:
    using Droppable = std::function<bool(const T&)>;

    explicit BlockQueue(std::size_t max_size = 64, Droppable droppable = nullptr)
        : max_size_(max_size == 0 ? 1 : max_size)
        , droppable_(std::move(droppable))
    {
        if (!droppable_) {
            droppable_ = [](const T&) { return true; };
        }
    }

    /// @return false once stopped
    bool push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return false;
            }
            queue_.push_back(std::move(item));
            while (queue_.size() > max_size_) {
                auto victim = std::find_if(queue_.begin(), queue_.end(), droppable_);
                if (victim == queue_.end()) {
                    break;
                }
                queue_.erase(victim);
                dropped_count_++;
            }
        }
        cv_.notify_one();
        return true;
    }

    /// Blocks for the next item; false once stopped (pending items are discarded)
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (stopped_) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            queue_.clear();
        }
        cv_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t dropped_count() const { return dropped_count_.load(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    std::size_t max_size_;
    Droppable droppable_;
    bool stopped_ = false;
    std::atomic<std::size_t> dropped_count_{0};
};

} // namespace huginn

/**
 * @file thread_safe_queue.hpp
 * @brief Blocking FIFO handing work from notifier threads to one worker
 *
 * WHY THIS FILE EXISTS:
 * Connectivity callbacks fire on whatever thread noticed the change (a
 * polling thread, a platform listener). They must not run a drain there.
 * They push a request here and the scheduler's worker pops it.
 *
 * EXAMPLE:
 * ThreadSafeQueue<DrainRequest> queue;
 * queue.push(request);         // notifier thread
 * auto next = queue.pop();     // worker, blocks until available or closed
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace holdfast {

/**
 * @brief Thread-safe FIFO queue with close semantics
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - After close(), push() is rejected and pop() drains what is left,
 *   then returns std::nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * RETURNS: false when the queue is closed (item dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Pop item, blocking until one is available or the queue closes
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        })) {
            return std::nullopt;  // Timeout
        }
        return take_locked();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    /**
     * @brief Reject further pushes and wake every waiting consumer
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace holdfast

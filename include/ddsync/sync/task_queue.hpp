/**
 * @file task_queue.hpp
 * @brief Blocking FIFO shared by the transfer coordinator and its workers
 *
 * Tasks flow coordinator -> workers through a bounded queue (push blocks
 * while it is full), and outcomes flow back through an unbounded one.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace ddsync::sync {

/**
 * @brief Thread-safe FIFO with an optional capacity
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - close() wakes every waiter; pushes fail afterwards and pops drain what
 *   is left before returning nullopt
 */
template<typename T>
class BoundedQueue {
public:
    /// capacity 0 means unbounded
    explicit BoundedQueue(size_t capacity = 0) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Appends an item, waiting for room when the queue is full
     *
     * RETURNS: false if the queue was closed (the item is dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return closed_ || capacity_ == 0 || queue_.size() < capacity_;
            });
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(queue_.front()));
            queue_.pop();
        }
        not_full_.notify_one();
        return item;
    }

    /// Waits for an item; nullopt once closed and drained
    std::optional<T> pop() {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]() { return !queue_.empty() || closed_; });
            if (queue_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(queue_.front()));
            queue_.pop();
        }
        not_full_.notify_one();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
                return std::nullopt;
            }
            if (queue_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(queue_.front()));
            queue_.pop();
        }
        not_full_.notify_one();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    size_t capacity() const { return capacity_; }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    const size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

} // namespace ddsync::sync

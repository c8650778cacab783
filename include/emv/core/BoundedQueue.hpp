/**
 * BoundedQueue.hpp - Multi-producer queue with an explicit overflow policy
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace emv::core {

enum class OverflowPolicy {
    DropOldest,  // never blocks the producer; evicts the head when full
    Block        // producer waits for space (backpressure)
};

template <typename T>
class BoundedQueue {
public:
    BoundedQueue(size_t capacity, OverflowPolicy policy)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Enqueue an item according to the overflow policy.
     * @return false if the queue was closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) return false;

        if (items_.size() >= capacity_) {
            if (policy_ == OverflowPolicy::DropOldest) {
                items_.pop_front();
                dropped_++;
            } else {
                not_full_.wait(lock, [this]() { return closed_ || items_.size() < capacity_; });
                if (closed_) return false;
            }
        }

        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Blocks until an item is available; nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return takeLocked(lock);
    }

    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return takeLocked(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void clear() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.clear();
        }
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> takeLocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace emv::core

/**
 * BoundedQueue.hpp - Blocking MPMC queue with a fixed capacity
 *
 * Used for the segment queue (capture -> batcher) and the transcription
 * event channel (batcher -> state machine). Producers never block on
 * tryPush; consumers block with a timeout.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace sui::core {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Push without blocking.
     * @return false if the queue is full or closed
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * Push, waiting up to timeout for free space.
     */
    bool push(T item, std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = notFull_.wait_for(lock, timeout, [this] {
                return closed_ || items_.size() < capacity_;
            });
            if (!ready || closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * Pop, waiting up to timeout. Returns nullopt on timeout or when the
     * queue is closed and empty.
     */
    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return takeFront(lock);
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return takeFront(lock);
    }

    /**
     * Remove and return everything currently queued.
     */
    std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out.reserve(items_.size());
            for (auto& item : items_) {
                out.push_back(std::move(item));
            }
            items_.clear();
        }
        notFull_.notify_all();
        return out;
    }

    /**
     * Reject further pushes and wake every waiter. Queued items stay poppable.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    void clear() { drain(); }

private:
    std::optional<T> takeFront(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace sui::core

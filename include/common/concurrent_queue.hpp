#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace multiocr {

/**
 * @brief Bounded multi-producer / multi-consumer queue
 *
 * push() blocks while the queue is full, pop() blocks while it is empty.
 * After close() producers are rejected and consumers drain what is left,
 * then receive std::nullopt.
 */
template<typename T>
class ConcurrentQueue {
public:
    explicit ConcurrentQueue(size_t capacity = 64)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    ConcurrentQueue(const ConcurrentQueue&) = delete;
    ConcurrentQueue& operator=(const ConcurrentQueue&) = delete;

    /**
     * @return false if the queue was closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        lock.unlock();
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Non-blocking push
     * @return false if the queue is full or closed
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Push, discarding the oldest element when full. Never blocks.
     * @return true if an element was discarded
     */
    bool pushEvictOldest(T item) {
        bool evicted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (items_.size() >= capacity_) {
                items_.pop_front();
                evicted = true;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return evicted;
    }

    /**
     * @brief Blocking pop
     * @return std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return takeFront(lock);
    }

    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return takeFront(lock);
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return takeFront(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void clear() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.clear();
        }
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

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeFront(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace multiocr

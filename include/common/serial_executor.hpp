#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace multiocr {

/**
 * @brief One worker thread running tasks strictly in submission order
 *
 * Each bridged engine owns one, so at most one request is ever outstanding on
 * its pipe and later callers queue behind it.
 */
class SerialExecutor {
public:
    explicit SerialExecutor(std::string name)
        : name_(std::move(name))
        , thread_([this] { run(); }) {}

    ~SerialExecutor() { shutdown(); }

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Queue a task; its result or exception arrives through the future
     * @throws std::runtime_error after shutdown()
     */
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw std::runtime_error(name_ + " executor is shut down");
            }
            queue_.emplace_back([task]() { (*task)(); });
        }
        wake_.notify_one();
        return future;
    }

    /**
     * @brief Reject new work, finish queued tasks, join. Idempotent.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    /**
     * @brief Tasks waiting, plus the one running
     */
    size_t backlog() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() + (running_ ? 1 : 0);
    }

    const std::string& name() const { return name_; }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return;     // closed and drained

            std::function<void()> task = std::move(queue_.front());
            queue_.pop_front();
            running_ = true;
            lock.unlock();
            task();
            lock.lock();
            running_ = false;
        }
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> queue_;
    bool closed_ = false;
    bool running_ = false;
    std::thread thread_;
};

} // namespace multiocr

#pragma once

#include "common/concurrent_queue.hpp"
#include "common/types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace multiocr {

using EventSink = std::function<void(const ProcessingEvent&)>;

/**
 * @brief Bounded channel for ProcessingEvents with an optional sink callback
 *
 * publish() never blocks on other publishers and never throws: when the
 * channel is full the oldest event is dropped, and sink exceptions are logged.
 * The sink is called on the publishing thread, outside any channel lock, so
 * it may publish to the same channel.
 */
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 1024);

    void setSink(EventSink sink);

    void publish(ProcessingEvent event);

    /**
     * @brief Convenience overload, stamps the current time
     */
    void publish(EventType type, const std::string& correlationId, json payload = json::object());

    std::optional<ProcessingEvent> tryNext();

    /**
     * @brief Remove and return every buffered event, oldest first
     */
    std::vector<ProcessingEvent> drain();

    size_t dropped() const { return dropped_; }
    size_t size() const { return queue_.size(); }

private:
    ConcurrentQueue<ProcessingEvent> queue_;
    std::mutex sinkMutex_;
    std::shared_ptr<const EventSink> sink_;
    std::atomic<size_t> dropped_{0};
};

} // namespace multiocr

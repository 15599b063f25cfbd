#include "pipeline/processing_events.h"
#include "common/logger.hpp"

namespace multiocr {

EventChannel::EventChannel(size_t capacity)
    : queue_(capacity) {}

void EventChannel::setSink(EventSink sink) {
    auto shared = sink ? std::make_shared<const EventSink>(std::move(sink)) : nullptr;
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sink_ = std::move(shared);
}

void EventChannel::publish(ProcessingEvent event) {
    LOG_TRACE("[{}] event {}", event.correlationId, toString(event.type));

    std::shared_ptr<const EventSink> sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        sink = sink_;
    }

    // The sink runs unlocked so it may publish to this channel or take its time
    if (sink) {
        try {
            (*sink)(event);
        } catch (const std::exception& e) {
            LOG_WARN("[{}] event sink failed on {}: {}",
                     event.correlationId, toString(event.type), e.what());
        } catch (...) {
            LOG_WARN("[{}] event sink failed on {} with a non-standard exception",
                     event.correlationId, toString(event.type));
        }
    }

    if (queue_.pushEvictOldest(std::move(event))) {
        ++dropped_;
    }
}

void EventChannel::publish(EventType type, const std::string& correlationId, json payload) {
    ProcessingEvent event;
    event.type = type;
    event.correlationId = correlationId;
    event.timestamp = nowMillis();
    event.payload = std::move(payload);
    publish(std::move(event));
}

std::optional<ProcessingEvent> EventChannel::tryNext() {
    return queue_.tryPop();
}

std::vector<ProcessingEvent> EventChannel::drain() {
    std::vector<ProcessingEvent> events;
    while (auto event = queue_.tryPop()) {
        events.push_back(std::move(*event));
    }
    return events;
}

} // namespace multiocr

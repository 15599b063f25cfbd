#include "pipeline/memory_cache.h"
#include "common/logger.hpp"

namespace multiocr {

MemoryCacheStore::MemoryCacheStore(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<CompleteResult> MemoryCacheStore::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->second;
}

void MemoryCacheStore::store(const std::string& key, const CompleteResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = result;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.emplace_front(key, result);
    index_[key] = entries_.begin();

    if (entries_.size() > capacity_) {
        LOG_DEBUG("Result cache full ({}), evicting least recently used entry", capacity_);
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t MemoryCacheStore::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t MemoryCacheStore::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace multiocr

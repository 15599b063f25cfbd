#pragma once

#include "pipeline/collaborators.h"
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace multiocr {

/**
 * @brief Bounded in-memory LRU cache of complete results
 */
class MemoryCacheStore : public ICacheStore {
public:
    explicit MemoryCacheStore(size_t capacity = 128);

    std::optional<CompleteResult> lookup(const std::string& key) override;
    void store(const std::string& key, const CompleteResult& result) override;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t hits() const;
    size_t misses() const;

private:
    using Entry = std::pair<std::string, CompleteResult>;

    const size_t capacity_;
    std::list<Entry> entries_;      // most recently used first
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace multiocr

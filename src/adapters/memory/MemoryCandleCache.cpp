#include "adapters/memory/MemoryCandleCache.hpp"

#include <utility>

namespace adapters::memory {

MemoryCandleCache::MemoryCandleCache(std::int64_t ttlSec) : core::CacheLayer(ttlSec) {}

std::size_t MemoryCandleCache::entryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryCandleCache::putRaw(const std::string& cacheKey, std::string payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[cacheKey] = std::move(payload);
}

std::optional<std::string> MemoryCandleCache::readPayload(const std::string& cacheKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(cacheKey);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCandleCache::writePayload(const std::string& cacheKey,
                                     const std::string& payload,
                                     domain::TimestampMs /*fetchedAtMs*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[cacheKey] = payload;
}

void MemoryCandleCache::erasePayload(const std::string& cacheKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(cacheKey);
}

}  // namespace adapters::memory

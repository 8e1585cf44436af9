#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/CacheLayer.h"

namespace adapters::memory {

class MemoryCandleCache : public core::CacheLayer {
public:
    explicit MemoryCandleCache(std::int64_t ttlSec = 3600);

    std::size_t entryCount() const;

    // Stores a raw payload as-is; lets callers seed corrupt or hand-made entries.
    void putRaw(const std::string& cacheKey, std::string payload);

protected:
    std::optional<std::string> readPayload(const std::string& cacheKey) override;
    void writePayload(const std::string& cacheKey,
                      const std::string& payload,
                      domain::TimestampMs fetchedAtMs) override;
    void erasePayload(const std::string& cacheKey) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

}  // namespace adapters::memory

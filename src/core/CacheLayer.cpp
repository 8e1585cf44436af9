#include "core/CacheLayer.h"

#include <exception>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/CacheCodec.h"

namespace core {
namespace {
using csync::log::Category;
namespace metric = csync::common::metrics;
}  // namespace

CacheLayer::CacheLayer(std::int64_t ttlSec) : ttlSec_(ttlSec > 0 ? ttlSec : 3600) {}

std::optional<domain::CandleSeries> CacheLayer::get(const domain::SeriesKey& key, domain::TimestampMs nowMs) {
    const auto cacheKey = domain::cacheKey(key);
    auto& registry = metric::Registry::instance();

    std::optional<std::string> payload;
    try {
        payload = readPayload(cacheKey);
    } catch (const std::exception& ex) {
        LOG_WARN(Category::Cache, "Cache read failed key=" << cacheKey << " error=" << ex.what());
        registry.incrementCounter(metric::names::kCacheMisses);
        return std::nullopt;
    }

    if (!payload) {
        registry.incrementCounter(metric::names::kCacheMisses);
        return std::nullopt;
    }

    CacheEntry entry;
    try {
        entry = decodeCacheEntry(*payload, key.granularity);
    } catch (const CacheCorruptError& ex) {
        LOG_WARN(Category::Cache, "Discarding corrupt cache entry key=" << cacheKey << " reason=" << ex.what());
        registry.incrementCounter(metric::names::kCacheCorrupt);
        registry.incrementCounter(metric::names::kCacheMisses);
        eraseQuietly_(cacheKey);
        return std::nullopt;
    }

    const auto ageMs = nowMs - entry.fetchedAtMs;
    if (ageMs < 0) {
        // Written by a clock that ran ahead of ours; freshness is unknown.
        LOG_WARN(Category::Cache, "Cache entry stamped in the future key=" << cacheKey << " age_ms=" << ageMs);
        registry.incrementCounter(metric::names::kCacheMisses);
        eraseQuietly_(cacheKey);
        return std::nullopt;
    }
    if (ageMs > ttlSec_ * 1000) {
        LOG_INFO(Category::Cache, "Cache entry expired key=" << cacheKey << " age_ms=" << ageMs);
        registry.incrementCounter(metric::names::kCacheMisses);
        eraseQuietly_(cacheKey);
        return std::nullopt;
    }

    registry.incrementCounter(metric::names::kCacheHits);
    LOG_DEBUG(Category::Cache,
              "Cache hit key=" << cacheKey << " candles=" << entry.candles.size() << " age_ms=" << ageMs);
    return std::move(entry.candles);
}

void CacheLayer::put(const domain::SeriesKey& key, const domain::CandleSeries& candles, domain::TimestampMs nowMs) {
    const auto cacheKey = domain::cacheKey(key);
    try {
        writePayload(cacheKey, encodeCacheEntry(candles, nowMs), nowMs);
    } catch (const std::exception& ex) {
        LOG_WARN(Category::Cache, "Cache write failed key=" << cacheKey << " error=" << ex.what());
    }
}

void CacheLayer::remove(const domain::SeriesKey& key) {
    eraseQuietly_(domain::cacheKey(key));
}

void CacheLayer::eraseQuietly_(const std::string& cacheKey) {
    try {
        erasePayload(cacheKey);
    } catch (const std::exception& ex) {
        LOG_WARN(Category::Cache, "Cache erase failed key=" << cacheKey << " error=" << ex.what());
    }
}

}  // namespace core

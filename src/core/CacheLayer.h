#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Ports.hpp"

namespace core {

// Shared ICandleCache behaviour on top of a raw keyed payload store:
// freshness window, corrupt-entry eviction and failure absorption.
class CacheLayer : public domain::ICandleCache {
public:
    explicit CacheLayer(std::int64_t ttlSec = 3600);
    ~CacheLayer() override = default;

    std::optional<domain::CandleSeries> get(const domain::SeriesKey& key, domain::TimestampMs nowMs) override;
    void put(const domain::SeriesKey& key, const domain::CandleSeries& candles, domain::TimestampMs nowMs) override;
    void remove(const domain::SeriesKey& key) override;

    std::int64_t ttlSec() const noexcept { return ttlSec_; }

protected:
    virtual std::optional<std::string> readPayload(const std::string& cacheKey) = 0;
    virtual void writePayload(const std::string& cacheKey,
                              const std::string& payload,
                              domain::TimestampMs fetchedAtMs) = 0;
    virtual void erasePayload(const std::string& cacheKey) = 0;

private:
    void eraseQuietly_(const std::string& cacheKey);

    std::int64_t ttlSec_;
};

}  // namespace core

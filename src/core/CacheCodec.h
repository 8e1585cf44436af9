#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace core {

class CacheCorruptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CacheEntry {
    domain::CandleSeries candles;
    domain::TimestampMs fetchedAtMs{0};
};

// {"candles":[[time,open,high,low,close],...],"timestamp":epochMs}
std::string encodeCacheEntry(const domain::CandleSeries& candles, domain::TimestampMs fetchedAtMs);

// Throws CacheCorruptError when the payload does not hold a well-formed series
// of candles aligned to `granularity`.
CacheEntry decodeCacheEntry(std::string_view payload, domain::Granularity granularity);

}  // namespace core

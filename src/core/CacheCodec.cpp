#include "core/CacheCodec.h"

#include <boost/json.hpp>

namespace core {
namespace {

double numberAt(const boost::json::array& row, std::size_t index) {
    const auto& value = row.at(index);
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    throw CacheCorruptError("cache candle field is not a number");
}

std::int64_t integerOf(const boost::json::value& value, const char* what) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    throw CacheCorruptError(std::string{what} + " is not an integer");
}

}  // namespace

std::string encodeCacheEntry(const domain::CandleSeries& candles, domain::TimestampMs fetchedAtMs) {
    boost::json::array rows;
    rows.reserve(candles.size());
    for (const auto& candle : candles) {
        rows.push_back(boost::json::array{candle.time, candle.open, candle.high, candle.low, candle.close});
    }

    boost::json::object root;
    root["candles"] = std::move(rows);
    root["timestamp"] = static_cast<std::int64_t>(fetchedAtMs);
    return boost::json::serialize(root);
}

CacheEntry decodeCacheEntry(std::string_view payload, domain::Granularity granularity) {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view{payload.data(), payload.size()}, ec);
    if (ec) {
        throw CacheCorruptError("cache payload is not valid JSON: " + ec.message());
    }
    if (!json.is_object()) {
        throw CacheCorruptError("cache payload is not an object");
    }

    const auto& root = json.as_object();
    const auto* timestamp = root.if_contains("timestamp");
    const auto* candles = root.if_contains("candles");
    if (timestamp == nullptr || candles == nullptr || !candles->is_array()) {
        throw CacheCorruptError("cache payload misses candles or timestamp");
    }

    CacheEntry entry;
    entry.fetchedAtMs = integerOf(*timestamp, "cache timestamp");
    if (entry.fetchedAtMs <= 0) {
        throw CacheCorruptError("cache timestamp must be positive");
    }

    const auto& rows = candles->as_array();
    entry.candles.reserve(rows.size());
    try {
        for (const auto& rowValue : rows) {
            if (!rowValue.is_array() || rowValue.as_array().size() != 5U) {
                throw CacheCorruptError("cache candle row must hold five values");
            }
            const auto& row = rowValue.as_array();
            domain::Candle candle{};
            candle.time = integerOf(row.at(0), "cache candle time");
            candle.open = numberAt(row, 1);
            candle.high = numberAt(row, 2);
            candle.low = numberAt(row, 3);
            candle.close = numberAt(row, 4);
            if (!domain::isValidCandle(candle)) {
                throw CacheCorruptError("cache candle violates OHLC invariants");
            }
            if (!domain::isAligned(candle, granularity)) {
                throw CacheCorruptError("cache candle is not aligned to " + domain::granularityToString(granularity));
            }
            if (!entry.candles.empty() && entry.candles.back().time >= candle.time) {
                throw CacheCorruptError("cache candles are not strictly increasing");
            }
            entry.candles.push_back(candle);
        }
    } catch (const std::out_of_range& ex) {
        throw CacheCorruptError(std::string{"cache candle row is truncated: "} + ex.what());
    }

    return entry;
}

}  // namespace core

#include "adapters/binance/KlineParser.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

namespace adapters::binance {
namespace {

std::int64_t jsonToInt64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

// Binance sends prices as decimal strings; "NaN"/"inf" parse to non-finite values
// and are rejected by the candle invariant filter afterwards.
double jsonToDouble(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    if (value.is_null()) {
        return std::nan("");
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

bool acceptCandle(const domain::Candle& candle, domain::Granularity granularity) {
    return domain::isValidCandle(candle) && domain::isAligned(candle, granularity);
}

}  // namespace

std::string binanceInterval(domain::Granularity granularity) {
    return domain::granularityToString(granularity);
}

std::optional<domain::Granularity> fromBinanceInterval(std::string_view value) {
    return domain::granularityFromString(value);
}

KlinesPage parseKlinesPayload(std::string_view body, domain::Granularity granularity) {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view{body.data(), body.size()}, ec);
    if (ec) {
        throw std::runtime_error("Failed to parse Binance klines response: " + ec.message());
    }
    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance klines response type (expected array)");
    }

    KlinesPage page;
    const auto& outer = json.as_array();
    page.rows = outer.size();
    page.candles.reserve(outer.size());

    for (const auto& rowValue : outer) {
        if (!rowValue.is_array() || rowValue.as_array().size() < 5U) {
            ++page.invalidRecords;
            continue;
        }
        const auto& row = rowValue.as_array();

        domain::Candle candle{};
        try {
            const std::int64_t openMs = jsonToInt64(row.at(0));
            page.lastOpenTime = std::max(page.lastOpenTime, openMs / 1000);
            if (openMs % 1000 != 0) {
                ++page.invalidRecords;
                continue;
            }
            candle.time = openMs / 1000;
            candle.open = jsonToDouble(row.at(1));
            candle.high = jsonToDouble(row.at(2));
            candle.low = jsonToDouble(row.at(3));
            candle.close = jsonToDouble(row.at(4));
        } catch (const std::exception&) {
            ++page.invalidRecords;
            continue;
        }

        if (!acceptCandle(candle, granularity)) {
            ++page.invalidRecords;
            continue;
        }
        page.candles.push_back(candle);
    }

    return page;
}

KlineMessage parseKlineMessage(std::string_view payload) {
    KlineMessage message;

    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view{payload.data(), payload.size()}, ec);
    if (ec || !json.is_object()) {
        message.detail = "invalid JSON payload";
        return message;
    }

    const auto* rootObj = &json.as_object();
    if (rootObj->contains("id") && (rootObj->contains("result") || rootObj->contains("error"))) {
        message.kind = KlineMessageKind::Control;
        if (const auto* error = rootObj->if_contains("error"); error != nullptr && !error->is_null()) {
            message.detail = boost::json::serialize(*error);
        }
        return message;
    }

    if (const auto* data = rootObj->if_contains("data"); data != nullptr) {
        if (!data->is_object()) {
            message.detail = "data is not an object";
            return message;
        }
        rootObj = &data->as_object();
    }

    const auto* eventType = rootObj->if_contains("e");
    if (eventType == nullptr || !eventType->is_string() || eventType->as_string() != "kline") {
        message.kind = KlineMessageKind::Control;
        message.detail = "not a kline event";
        return message;
    }

    const auto* kValue = rootObj->if_contains("k");
    if (kValue == nullptr || !kValue->is_object()) {
        message.detail = "missing kline object";
        return message;
    }
    const auto& kObj = kValue->as_object();

    const auto* closed = kObj.if_contains("x");
    const auto* symbol = kObj.if_contains("s");
    const auto* interval = kObj.if_contains("i");
    const auto* openTime = kObj.if_contains("t");
    if (closed == nullptr || !closed->is_bool() || symbol == nullptr || !symbol->is_string() ||
        interval == nullptr || !interval->is_string() || openTime == nullptr) {
        message.detail = "kline misses symbol, interval, open time or close flag";
        return message;
    }

    message.symbol = domain::normalizeSymbol(std::string_view{symbol->as_string().data(), symbol->as_string().size()});
    message.granularity =
        fromBinanceInterval(std::string_view{interval->as_string().data(), interval->as_string().size()});
    if (!message.granularity) {
        message.detail = "unsupported kline interval";
        return message;
    }

    domain::Candle candle{};
    try {
        const std::int64_t openMs = jsonToInt64(*openTime);
        candle.time = openMs % 1000 == 0 ? openMs / 1000 : 0;
        candle.open = jsonToDouble(kObj.at("o"));
        candle.high = jsonToDouble(kObj.at("h"));
        candle.low = jsonToDouble(kObj.at("l"));
        candle.close = jsonToDouble(kObj.at("c"));
    } catch (const std::exception& ex) {
        message.kind = KlineMessageKind::InvalidRecord;
        message.detail = ex.what();
        return message;
    }

    message.update.candle = candle;
    message.update.isFinal = closed->as_bool();
    if (!acceptCandle(candle, *message.granularity)) {
        message.kind = KlineMessageKind::InvalidRecord;
        message.detail = "kline violates candle invariants";
        return message;
    }

    message.kind = KlineMessageKind::Update;
    return message;
}

}  // namespace adapters::binance

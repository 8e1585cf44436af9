#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

std::string binanceInterval(domain::Granularity granularity);
std::optional<domain::Granularity> fromBinanceInterval(std::string_view value);

struct KlinesPage {
    domain::CandleSeries candles;
    std::size_t rows{0};
    std::size_t invalidRecords{0};
    std::int64_t lastOpenTime{0};
};

// Parses a /api/v3/klines response body. Rows violating the candle invariants or
// the bucket alignment are dropped and counted. Throws std::runtime_error when the
// body is not a JSON array.
KlinesPage parseKlinesPayload(std::string_view body, domain::Granularity granularity);

enum class KlineMessageKind {
    Update,
    Control,
    InvalidRecord,
    Malformed,
};

struct KlineMessage {
    KlineMessageKind kind{KlineMessageKind::Malformed};
    std::string symbol;
    std::optional<domain::Granularity> granularity;
    domain::CandleUpdate update{};
    std::string detail;
};

// Parses one websocket frame: a kline event (raw or combined-stream form) or a
// subscription acknowledgement. Never throws.
KlineMessage parseKlineMessage(std::string_view payload);

}  // namespace adapters::binance

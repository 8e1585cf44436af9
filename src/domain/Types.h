#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

enum class Granularity {
    OneMinute,
    FiveMinutes,
    FifteenMinutes,
    ThirtyMinutes,
    OneHour,
    FourHours,
    OneDay,
};

constexpr std::int64_t granularitySeconds(Granularity granularity) noexcept {
    switch (granularity) {
    case Granularity::OneMinute:
        return 60;
    case Granularity::FiveMinutes:
        return 5 * 60;
    case Granularity::FifteenMinutes:
        return 15 * 60;
    case Granularity::ThirtyMinutes:
        return 30 * 60;
    case Granularity::OneHour:
        return 60 * 60;
    case Granularity::FourHours:
        return 4 * 60 * 60;
    case Granularity::OneDay:
        return 24 * 60 * 60;
    }
    return 60;
}

inline std::string granularityToString(Granularity granularity) {
    switch (granularity) {
    case Granularity::OneMinute:
        return "1m";
    case Granularity::FiveMinutes:
        return "5m";
    case Granularity::FifteenMinutes:
        return "15m";
    case Granularity::ThirtyMinutes:
        return "30m";
    case Granularity::OneHour:
        return "1h";
    case Granularity::FourHours:
        return "4h";
    case Granularity::OneDay:
        return "1d";
    }
    return "";
}

inline std::optional<Granularity> granularityFromString(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        if (ch == 'M') {
            return std::nullopt;  // months
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized == "1m" || normalized == "1min" || normalized == "1minute") {
        return Granularity::OneMinute;
    }
    if (normalized == "5m" || normalized == "5min" || normalized == "5minute") {
        return Granularity::FiveMinutes;
    }
    if (normalized == "15m" || normalized == "15min" || normalized == "15minute") {
        return Granularity::FifteenMinutes;
    }
    if (normalized == "30m" || normalized == "30min" || normalized == "30minute") {
        return Granularity::ThirtyMinutes;
    }
    if (normalized == "1h" || normalized == "60m") {
        return Granularity::OneHour;
    }
    if (normalized == "4h" || normalized == "240m") {
        return Granularity::FourHours;
    }
    if (normalized == "1d" || normalized == "1day" || normalized == "24h") {
        return Granularity::OneDay;
    }
    return std::nullopt;
}

inline std::int64_t alignDown(std::int64_t timeSec, Granularity granularity) {
    const auto step = granularitySeconds(granularity);
    if (timeSec >= 0) {
        return (timeSec / step) * step;
    }
    return -(((-timeSec) + step - 1) / step) * step;
}

inline std::int64_t alignUp(std::int64_t timeSec, Granularity granularity) {
    const auto down = alignDown(timeSec, granularity);
    return down == timeSec ? down : down + granularitySeconds(granularity);
}

// `time` is the bucket open in seconds since epoch.
struct Candle {
    std::int64_t time{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};

    bool operator==(const Candle& other) const noexcept {
        return time == other.time && open == other.open && high == other.high && low == other.low &&
               close == other.close;
    }
    bool operator!=(const Candle& other) const noexcept { return !(*this == other); }
};

// Strictly increasing by time, unique per time.
using CandleSeries = std::vector<Candle>;

inline bool isValidCandle(const Candle& candle) noexcept {
    if (candle.time <= 0) {
        return false;
    }
    if (!std::isfinite(candle.open) || !std::isfinite(candle.high) || !std::isfinite(candle.low) ||
        !std::isfinite(candle.close)) {
        return false;
    }
    const double bodyLow = std::min(candle.open, candle.close);
    const double bodyHigh = std::max(candle.open, candle.close);
    return candle.low <= bodyLow && bodyHigh <= candle.high;
}

inline bool isAligned(const Candle& candle, Granularity granularity) noexcept {
    return candle.time % granularitySeconds(granularity) == 0;
}

struct TimeBounds {
    std::int64_t oldest{0};
    std::int64_t newest{0};
};

struct SeriesKey {
    Symbol symbol;
    Granularity granularity{Granularity::OneHour};

    bool operator==(const SeriesKey& other) const noexcept {
        return granularity == other.granularity && symbol == other.symbol;
    }
    bool operator!=(const SeriesKey& other) const noexcept { return !(*this == other); }
};

inline Symbol normalizeSymbol(std::string_view symbol) {
    Symbol normalized;
    normalized.reserve(symbol.size());
    for (char ch : symbol) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

inline SeriesKey makeSeriesKey(std::string_view symbol, Granularity granularity) {
    return SeriesKey{normalizeSymbol(symbol), granularity};
}

inline std::string toString(const SeriesKey& key) {
    return key.symbol + "/" + granularityToString(key.granularity);
}

inline std::string cacheKey(const SeriesKey& key) {
    return "cache:" + key.symbol + ":" + granularityToString(key.granularity);
}

struct CandleUpdate {
    Candle candle;
    bool isFinal{false};
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Backoff,
};

inline const char* connectionStateLabel(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Backoff:
        return "Backoff";
    }
    return "Unknown";
}

}  // namespace domain

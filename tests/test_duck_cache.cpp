#include <filesystem>
#include <iostream>
#include <string>

#include "adapters/duckdb/DuckCandleCache.hpp"

int main() {
    const std::filesystem::path dir = "/tmp/candlesync-tests/duck";
    std::filesystem::remove_all(dir);
    const auto dbPath = (dir / "cache.duckdb").string();

    const auto key = domain::makeSeriesKey("BTCUSDT", domain::Granularity::OneHour);
    const domain::CandleSeries series{
        domain::Candle{1699992000, 100.0, 102.0, 99.0, 101.0},
        domain::Candle{1699995600, 101.0, 103.0, 100.5, 102.5},
        domain::Candle{1699999200, 102.5, 104.0, 102.0, 103.0},
    };
    constexpr domain::TimestampMs nowMs = 1700000000000LL;

    {
        adapters::duckdb::DuckCandleCache cache(dbPath, 3600);
        cache.put(key, series, nowMs);
        cache.put(domain::makeSeriesKey("ETHUSDT", domain::Granularity::OneHour), {series.front()}, nowMs);
    }

    {
        adapters::duckdb::DuckCandleCache reopened(dbPath, 3600);
        const auto hit = reopened.get(key, nowMs + 60 * 1000);
        if (!hit || *hit != series) {
            std::cerr << "Expected snapshot to survive reopening the database\n";
            return 1;
        }

        reopened.put(key, {series.back()}, nowMs);
        const auto overwritten = reopened.get(key, nowMs);
        if (!overwritten || overwritten->size() != 1) {
            std::cerr << "Expected put() to overwrite the row\n";
            return 1;
        }

        if (reopened.get(key, nowMs + 3600 * 1000 + 1)) {
            std::cerr << "Expired entry must be a miss\n";
            return 1;
        }
        if (reopened.get(key, nowMs)) {
            std::cerr << "Expired entry must be deleted on read\n";
            return 1;
        }

        reopened.remove(domain::makeSeriesKey("ETHUSDT", domain::Granularity::OneHour));
        if (reopened.get(domain::makeSeriesKey("ETHUSDT", domain::Granularity::OneHour), nowMs)) {
            std::cerr << "remove() should delete the row\n";
            return 1;
        }
    }

    std::cout << "test_duck_cache passed\n";
    return 0;
}

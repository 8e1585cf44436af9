#include <iostream>
#include <stdexcept>
#include <string>

#include "adapters/binance/BinanceLiveStream.hpp"
#include "adapters/binance/KlineParser.hpp"

namespace {

constexpr std::int64_t kHourOpen = 1699999200;  // aligned to 1h

std::string klineEvent(const std::string& symbol,
                       const std::string& interval,
                       std::int64_t openMs,
                       const std::string& high,
                       bool closed) {
    return std::string(R"({"e":"kline","E":1700000001000,"s":")") + symbol + R"(","k":{"t":)" +
           std::to_string(openMs) + R"(,"T":)" + std::to_string(openMs + 3599999) + R"(,"s":")" + symbol +
           R"(","i":")" + interval + R"(","o":"100.0","c":"101.5","h":")" + high +
           R"(","l":"99.5","v":"12.3","x":)" + (closed ? "true" : "false") + "}}";
}

}  // namespace

int main() {
    using namespace adapters::binance;

    {
        const auto t0 = std::to_string(kHourOpen * 1000);
        const auto t1 = std::to_string((kHourOpen + 3600) * 1000);
        const auto t2 = std::to_string((kHourOpen + 7200) * 1000);
        const auto misaligned = std::to_string((kHourOpen + 60) * 1000);
        const std::string body = "[[" + t0 + R"(,"100.0","102.0","99.0","101.0","5.0",0,"0",1,"0","0","0"],)" +
                                 "[" + t1 + R"(,"101.0","NaN","100.0","101.5","5.0"],)" +
                                 R"([0,"1","2","0.5","1.5","1"],)" +
                                 "[" + misaligned + R"(,"1","2","0.5","1.5","1"],)" +
                                 R"([1700000000000,"1"],)" +
                                 "[" + t2 + R"(,"101.5","103.0","101.0","102.0","7.0"]])";
        const auto page = parseKlinesPayload(body, domain::Granularity::OneHour);
        if (page.rows != 6 || page.candles.size() != 2 || page.invalidRecords != 4) {
            std::cerr << "Unexpected page rows=" << page.rows << " candles=" << page.candles.size()
                      << " invalid=" << page.invalidRecords << "\n";
            return 1;
        }
        if (page.candles[0].time != kHourOpen || page.candles[1].time != kHourOpen + 7200 ||
            page.candles[1].close != 102.0) {
            std::cerr << "Candles were not converted to seconds correctly\n";
            return 1;
        }
        if (page.lastOpenTime != kHourOpen + 7200) {
            std::cerr << "Expected lastOpenTime to track the newest row\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            parseKlinesPayload(R"({"code":-1121,"msg":"Invalid symbol."})", domain::Granularity::OneHour);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Expected non-array klines body to throw\n";
            return 1;
        }
        threw = false;
        try {
            parseKlinesPayload("[[1,2,", domain::Granularity::OneHour);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Expected truncated JSON to throw\n";
            return 1;
        }
    }

    {
        const auto message = parseKlineMessage(klineEvent("BTCUSDT", "1h", kHourOpen * 1000, "102.0", true));
        if (message.kind != KlineMessageKind::Update || message.symbol != "BTCUSDT" ||
            message.granularity != domain::Granularity::OneHour) {
            std::cerr << "Expected a kline update, got detail=" << message.detail << "\n";
            return 1;
        }
        if (!message.update.isFinal || message.update.candle.time != kHourOpen ||
            message.update.candle.close != 101.5) {
            std::cerr << "Kline update fields were not mapped\n";
            return 1;
        }
    }

    {
        const auto wrapped = R"({"stream":"ethusdt@kline_1m","data":)" +
                             klineEvent("ETHUSDT", "1m", kHourOpen * 1000, "102.0", false) + "}";
        const auto message = parseKlineMessage(wrapped);
        if (message.kind != KlineMessageKind::Update || message.update.isFinal ||
            message.granularity != domain::Granularity::OneMinute) {
            std::cerr << "Combined-stream wrapper was not unwrapped\n";
            return 1;
        }
    }

    {
        if (parseKlineMessage(R"({"result":null,"id":1})").kind != KlineMessageKind::Control) {
            std::cerr << "Subscription ack should be a control frame\n";
            return 1;
        }
        if (parseKlineMessage("not json").kind != KlineMessageKind::Malformed) {
            std::cerr << "Garbage should be malformed\n";
            return 1;
        }
        if (parseKlineMessage(klineEvent("BTCUSDT", "1h", kHourOpen * 1000, "NaN", false)).kind !=
            KlineMessageKind::InvalidRecord) {
            std::cerr << "NaN high should be an invalid record\n";
            return 1;
        }
        if (parseKlineMessage(klineEvent("BTCUSDT", "1h", (kHourOpen + 60) * 1000, "102.0", false)).kind !=
            KlineMessageKind::InvalidRecord) {
            std::cerr << "Misaligned open time should be an invalid record\n";
            return 1;
        }
        if (parseKlineMessage(klineEvent("BTCUSDT", "1M", kHourOpen * 1000, "102.0", false)).kind !=
            KlineMessageKind::Malformed) {
            std::cerr << "Monthly interval must not be mistaken for one minute\n";
            return 1;
        }
    }

    {
        if (fromBinanceInterval("1M").has_value() || fromBinanceInterval("4h") != domain::Granularity::FourHours) {
            std::cerr << "Unexpected interval mapping\n";
            return 1;
        }
        const auto frame =
            BinanceLiveStream::subscribeMessage(domain::makeSeriesKey("btcusdt", domain::Granularity::OneHour), 7);
        if (frame != R"({"method":"SUBSCRIBE","params":["btcusdt@kline_1h"],"id":7})") {
            std::cerr << "Unexpected subscribe frame " << frame << "\n";
            return 1;
        }
    }

    std::cout << "test_kline_parser passed\n";
    return 0;
}

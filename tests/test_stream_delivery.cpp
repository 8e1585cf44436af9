#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "adapters/binance/StreamDelivery.hpp"
#include "common/Metrics.hpp"

namespace {

constexpr std::int64_t kMinuteOpen = 1700000100;  // aligned to 1m and 5m

std::string frame(const std::string& symbol, const std::string& interval, double close) {
    return R"({"e":"kline","s":")" + symbol + R"(","k":{"t":)" + std::to_string(kMinuteOpen * 1000) +
           R"(,"s":")" + symbol + R"(","i":")" + interval + R"(","o":"10","h":"12","l":"9","c":")" +
           std::to_string(close) + R"(","x":false}})";
}

void drain(boost::asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

}  // namespace

int main() {
    using adapters::binance::StreamDelivery;
    namespace metric = csync::common::metrics;

    metric::Registry::instance().reset();
    boost::asio::io_context ioc;
    auto delivery = std::make_shared<StreamDelivery>(ioc);
    const auto key = domain::makeSeriesKey("BTCUSDT", domain::Granularity::OneMinute);

    std::vector<domain::CandleUpdate> updates;
    std::vector<domain::ConnectionState> states;
    auto onUpdate = [&](const domain::SeriesKey& updateKey, const domain::CandleUpdate& update) {
        if (updateKey != key) {
            std::cerr << "Update delivered for the wrong key\n";
        }
        updates.push_back(update);
    };
    auto onState = [&](domain::ConnectionState state) { states.push_back(state); };

    const auto first = delivery->open(key, onUpdate, onState);

    {
        delivery->deliverFrame(first, frame("BTCUSDT", "1m", 11.0));
        if (!updates.empty()) {
            std::cerr << "Updates must only run on the consumer io_context\n";
            return 1;
        }
        drain(ioc);
        if (updates.size() != 1 || updates.front().candle.close != 11.0) {
            std::cerr << "Expected one delivered update\n";
            return 1;
        }
    }

    {
        delivery->deliverFrame(first, frame("ETHUSDT", "1m", 11.0));
        delivery->deliverFrame(first, frame("BTCUSDT", "5m", 11.0));
        delivery->deliverFrame(first, R"({"result":null,"id":1})");
        delivery->deliverFrame(first, frame("BTCUSDT", "1m", 13.0));
        drain(ioc);
        if (updates.size() != 1) {
            std::cerr << "Frames for other series or invalid candles must be dropped\n";
            return 1;
        }
        if (metric::Registry::instance().counter(metric::names::kInvalidRecords) != 1) {
            std::cerr << "Invalid live candle should be counted\n";
            return 1;
        }
    }

    {
        // Posted before close(), executed after: must still be dropped.
        delivery->deliverFrame(first, frame("BTCUSDT", "1m", 11.5));
        delivery->deliverState(first, domain::ConnectionState::Connected);
        delivery->close();
        drain(ioc);
        if (updates.size() != 1 || !states.empty()) {
            std::cerr << "Nothing may be delivered after close()\n";
            return 1;
        }
    }

    {
        const auto second = delivery->open(key, onUpdate, onState);
        if (second == first) {
            std::cerr << "A new subscription needs a new generation\n";
            return 1;
        }
        delivery->deliverFrame(first, frame("BTCUSDT", "1m", 11.7));
        delivery->deliverFrame(second, frame("BTCUSDT", "1m", 11.8));
        delivery->deliverState(second, domain::ConnectionState::Connected);
        drain(ioc);
        if (updates.size() != 2 || updates.back().candle.close != 11.8) {
            std::cerr << "Only the current generation should be delivered\n";
            return 1;
        }
        if (states.size() != 1 || states.front() != domain::ConnectionState::Connected) {
            std::cerr << "Expected the connection state to be delivered\n";
            return 1;
        }
    }

    std::cout << "test_stream_delivery passed\n";
    return 0;
}

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "adapters/binance/StreamDelivery.hpp"
#include "core/Backoff.h"
#include "core/ConnectionTracker.h"
#include "domain/Ports.hpp"

namespace adapters::binance {

struct LiveStreamConfig {
    std::string host = "stream.binance.com";
    std::string port = "9443";
    std::string target = "/ws";
    int handshakeTimeoutSec = 10;
    int idleTimeoutSec = 30;
    core::Backoff::Config backoff{};
};

// Binance kline websocket as an ILiveStream. The connection lives on a private
// io_context thread; a lost transport moves to Backoff and reconnects after the
// tracker's delay, re-sending the SUBSCRIBE request each time.
class BinanceLiveStream : public domain::ILiveStream {
public:
    BinanceLiveStream(boost::asio::io_context& callbackContext, LiveStreamConfig config);
    ~BinanceLiveStream() override;

    BinanceLiveStream(const BinanceLiveStream&) = delete;
    BinanceLiveStream& operator=(const BinanceLiveStream&) = delete;

    void subscribe(const domain::SeriesKey& key, UpdateHandler onUpdate, StateHandler onState) override;
    void unsubscribe() override;
    domain::ConnectionState state() const override { return tracker_.state(); }

    // {"method":"SUBSCRIBE","params":["btcusdt@kline_1h"],"id":<requestId>}
    static std::string subscribeMessage(const domain::SeriesKey& key, std::uint64_t requestId);

private:
    class Session;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    LiveStreamConfig config_;
    std::shared_ptr<StreamDelivery> delivery_;
    core::ConnectionTracker tracker_;

    std::mutex mutex_;
    std::unique_ptr<boost::asio::io_context> ioc_;
    std::optional<WorkGuard> work_;
    std::shared_ptr<Session> session_;
    std::thread ioThread_;
};

}  // namespace adapters::binance

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "core/Backoff.h"
#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

struct HistoryProviderConfig {
    std::string host = "api.binance.com";
    std::size_t maxRecordsPerCall = 1000;
    int timeoutSec = 10;
    std::uint32_t maxRetries = 3;
    std::size_t threads = 2;
    core::Backoff::Config retryBackoff{std::chrono::milliseconds{1000}, std::chrono::milliseconds{8000}, 0.0};
};

// Binance /api/v3/klines as an IHistoryProvider. Requests run on an internal
// thread pool; results are posted back to the callback io_context.
class BinanceHistoryProvider : public domain::IHistoryProvider {
public:
    using HttpGet = std::function<infra::http::HttpResponse(const std::string& host, const std::string& target)>;

    BinanceHistoryProvider(boost::asio::io_context& callbackContext, HistoryProviderConfig config);
    BinanceHistoryProvider(boost::asio::io_context& callbackContext, HistoryProviderConfig config, HttpGet httpGet);
    ~BinanceHistoryProvider() override;

    BinanceHistoryProvider(const BinanceHistoryProvider&) = delete;
    BinanceHistoryProvider& operator=(const BinanceHistoryProvider&) = delete;

    void fetch(const domain::FetchRequest& request, domain::FetchCallback callback) override;
    std::size_t maxRecordsPerCall() const override { return config_.maxRecordsPerCall; }

    // Synchronous variant of fetch(); never throws.
    domain::FetchResult fetchBlocking(const domain::FetchRequest& request);

    // Narrows an over-sized request to `cap` buckets, keeping the end that touches
    // the already-loaded data: the newest buckets for initial and older fetches,
    // the oldest ones for newer fetches.
    static domain::FetchRequest clampToCap(const domain::FetchRequest& request, std::size_t cap);

private:
    static constexpr std::size_t kBinancePageLimit = 1000;

    infra::http::HttpResponse getWithRetry_(const std::string& target);

    boost::asio::io_context& callbackContext_;
    HistoryProviderConfig config_;
    HttpGet httpGet_;
    boost::asio::thread_pool pool_;
};

}  // namespace adapters::binance

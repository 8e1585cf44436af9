#include "adapters/binance/BinanceHistoryProvider.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>

#include "adapters/binance/KlineParser.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/CandleStore.h"

namespace adapters::binance {
namespace {
using csync::log::Category;
namespace metric = csync::common::metrics;

bool isRetryableStatus(unsigned status) {
    return status == 429U || status == 418U || (status >= 500U && status < 600U);
}

std::string klinesTarget(const domain::FetchRequest& request,
                         std::int64_t startTime,
                         std::size_t limit) {
    std::ostringstream target;
    target << "/api/v3/klines?symbol=" << request.key.symbol
           << "&interval=" << binanceInterval(request.key.granularity)
           << "&startTime=" << startTime * 1000
           << "&endTime=" << request.toTime * 1000
           << "&limit=" << limit;
    return target.str();
}

}  // namespace

BinanceHistoryProvider::BinanceHistoryProvider(boost::asio::io_context& callbackContext,
                                               HistoryProviderConfig config)
    : BinanceHistoryProvider(callbackContext, config, HttpGet{}) {}

BinanceHistoryProvider::BinanceHistoryProvider(boost::asio::io_context& callbackContext,
                                               HistoryProviderConfig config,
                                               HttpGet httpGet)
    : callbackContext_(callbackContext),
      config_(std::move(config)),
      httpGet_(std::move(httpGet)),
      pool_(std::max<std::size_t>(config_.threads, 1)) {
    if (config_.maxRecordsPerCall == 0) {
        config_.maxRecordsPerCall = kBinancePageLimit;
    }
    if (config_.timeoutSec <= 0) {
        config_.timeoutSec = 10;
    }
    if (!httpGet_) {
        const infra::http::HttpRequestOptions options{"443", config_.timeoutSec, true};
        httpGet_ = [options](const std::string& host, const std::string& target) {
            return infra::http::httpsGet(host, target, options);
        };
    }
}

BinanceHistoryProvider::~BinanceHistoryProvider() {
    pool_.stop();
    pool_.join();
}

void BinanceHistoryProvider::fetch(const domain::FetchRequest& request, domain::FetchCallback callback) {
    if (!callback) {
        return;
    }
    boost::asio::post(pool_, [this, request, callback = std::move(callback)]() mutable {
        auto result = fetchBlocking(request);
        boost::asio::post(callbackContext_,
                          [callback = std::move(callback), result = std::move(result)]() mutable {
                              callback(std::move(result));
                          });
    });
}

domain::FetchRequest BinanceHistoryProvider::clampToCap(const domain::FetchRequest& request, std::size_t cap) {
    domain::FetchRequest clamped = request;
    clamped.fromTime = domain::alignUp(request.fromTime, request.key.granularity);
    clamped.toTime = domain::alignDown(request.toTime, request.key.granularity);
    if (cap == 0 || clamped.fromTime > clamped.toTime) {
        return clamped;
    }

    const auto step = domain::granularitySeconds(request.key.granularity);
    const auto span = static_cast<std::int64_t>(cap - 1) * step;
    if (clamped.toTime - clamped.fromTime <= span) {
        return clamped;
    }
    if (request.direction == domain::FetchDirection::Newer) {
        clamped.toTime = clamped.fromTime + span;
    } else {
        clamped.fromTime = clamped.toTime - span;
    }
    return clamped;
}

domain::FetchResult BinanceHistoryProvider::fetchBlocking(const domain::FetchRequest& request) {
    domain::FetchResult result;
    result.request = request;

    auto& registry = metric::Registry::instance();
    const auto effective = clampToCap(request, config_.maxRecordsPerCall);
    if (request.key.symbol.empty() || effective.fromTime <= 0 || effective.fromTime > effective.toTime) {
        LOG_DEBUG(Category::Net,
                  "History fetch skipped empty range key=" << domain::toString(request.key)
                                                           << " from=" << request.fromTime
                                                           << " to=" << request.toTime);
        return result;
    }

    const auto step = domain::granularitySeconds(request.key.granularity);
    domain::CandleSeries collected;
    try {
        std::int64_t cursor = effective.fromTime;
        while (cursor <= effective.toTime && collected.size() < config_.maxRecordsPerCall) {
            const std::size_t limit =
                std::min(kBinancePageLimit, config_.maxRecordsPerCall - collected.size());
            const auto target = klinesTarget(effective, cursor, limit);
            LOG_INFO(Category::Net, "Binance REST " << target);

            const auto response = getWithRetry_(target);
            auto page = parseKlinesPayload(response.body, request.key.granularity);
            result.invalidRecords += page.invalidRecords;

            for (const auto& candle : page.candles) {
                if (candle.time >= effective.fromTime && candle.time <= effective.toTime) {
                    collected.push_back(candle);
                }
            }

            if (page.rows < limit || page.lastOpenTime <= 0) {
                break;
            }
            const auto next = page.lastOpenTime + step;
            if (next <= cursor) {
                break;
            }
            cursor = next;
        }
    } catch (const std::exception& ex) {
        LOG_WARN(Category::Net,
                 "History fetch failed key=" << domain::toString(request.key) << " direction="
                                             << domain::fetchDirectionLabel(request.direction)
                                             << " error=" << ex.what());
        registry.incrementCounter(metric::names::kFetchFailed);
        registry.incrementCounter(metric::names::kInvalidRecords, result.invalidRecords);
        result.status = domain::FetchStatus::FetchFailed;
        result.candles.clear();
        return result;
    }

    registry.incrementCounter(metric::names::kInvalidRecords, result.invalidRecords);
    result.candles = core::CandleStore::mergeSeries({}, collected);
    if (result.candles.size() > config_.maxRecordsPerCall) {
        result.candles.resize(config_.maxRecordsPerCall);
    }
    LOG_INFO(Category::Net,
             "History fetch done key=" << domain::toString(request.key) << " candles=" << result.candles.size()
                                       << " dropped=" << result.invalidRecords);
    return result;
}

infra::http::HttpResponse BinanceHistoryProvider::getWithRetry_(const std::string& target) {
    core::Backoff backoff(config_.retryBackoff);
    const std::uint32_t attempts = config_.maxRetries + 1;
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto response = httpGet_(config_.host, target);
        if (response.ok()) {
            return response;
        }

        if (!isRetryableStatus(response.status) || attempt >= attempts) {
            std::ostringstream oss;
            oss << "Binance REST request " << target << " returned HTTP " << response.status << " after "
                << attempt << " attempt(s)";
            throw std::runtime_error(oss.str());
        }

        const auto delay = backoff.nextDelay();
        LOG_WARN(Category::Net,
                 "Binance REST backoff attempt " << attempt << " due to HTTP " << response.status << ", sleeping "
                                                 << delay.count() << " ms");
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace adapters::binance

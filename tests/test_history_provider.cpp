#include <chrono>
#include <cstdint>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "adapters/binance/BinanceHistoryProvider.hpp"
#include "common/Metrics.hpp"

namespace {

using namespace std::chrono_literals;
using adapters::binance::BinanceHistoryProvider;
using adapters::binance::HistoryProviderConfig;

constexpr std::int64_t kMinuteBase = 1700000040;
constexpr std::int64_t kHourBase = 1699999200;

std::int64_t queryValue(const std::string& target, const std::string& name) {
    const auto pos = target.find(name + "=");
    if (pos == std::string::npos) {
        throw std::runtime_error("missing query parameter " + name);
    }
    const auto begin = pos + name.size() + 1;
    const auto end = target.find('&', begin);
    return std::stoll(target.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
}

// Serves /api/v3/klines like the exchange: rows from startTime to endTime, at most `limit`.
struct FakeExchange {
    std::vector<std::string> targets;
    std::deque<unsigned> scriptedStatus;
    std::string bodyOverride;
    bool throwTransport = false;

    infra::http::HttpResponse handle(const std::string&, const std::string& target) {
        targets.push_back(target);
        if (throwTransport) {
            throw std::runtime_error("connect failed: Connection refused");
        }
        infra::http::HttpResponse response;
        if (!scriptedStatus.empty()) {
            response.status = scriptedStatus.front();
            scriptedStatus.pop_front();
            if (!response.ok()) {
                response.body = R"({"code":-1003,"msg":"Too many requests"})";
                return response;
            }
        } else {
            response.status = 200;
        }
        if (!bodyOverride.empty()) {
            response.body = bodyOverride;
            return response;
        }

        const auto stepMs = target.find("interval=1h") != std::string::npos ? 3600000LL : 60000LL;
        const auto start = queryValue(target, "startTime");
        const auto end = queryValue(target, "endTime");
        const auto limit = queryValue(target, "limit");
        std::string body = "[";
        std::int64_t rows = 0;
        for (auto t = start; t <= end && rows < limit; t += stepMs, ++rows) {
            if (rows > 0) {
                body += ",";
            }
            body += "[" + std::to_string(t) + R"(,"10.0","11.0","9.0","10.5","1.0"])";
        }
        response.body = body + "]";
        return response;
    }
};

BinanceHistoryProvider makeProvider(boost::asio::io_context& ioc,
                                    FakeExchange& exchange,
                                    std::size_t maxRecords = 1000,
                                    std::uint32_t maxRetries = 3) {
    HistoryProviderConfig config;
    config.maxRecordsPerCall = maxRecords;
    config.maxRetries = maxRetries;
    config.threads = 1;
    config.retryBackoff = core::Backoff::Config{1ms, 2ms, 0.0};
    return BinanceHistoryProvider(ioc, config, [&exchange](const std::string& host, const std::string& target) {
        return exchange.handle(host, target);
    });
}

domain::FetchRequest request(domain::Granularity granularity,
                             std::int64_t from,
                             std::int64_t to,
                             domain::FetchDirection direction) {
    domain::FetchRequest req;
    req.key = domain::makeSeriesKey("BTCUSDT", granularity);
    req.fromTime = from;
    req.toTime = to;
    req.direction = direction;
    req.tag = 1;
    return req;
}

int fail(const std::string& message) {
    std::cerr << message << "\n";
    return 1;
}

}  // namespace

int main() {
    namespace metric = csync::common::metrics;
    auto& registry = metric::Registry::instance();
    registry.reset();
    boost::asio::io_context ioc;

    {
        FakeExchange exchange;
        auto provider = makeProvider(ioc, exchange, 1500);
        const auto to = kMinuteBase + 2499 * 60;
        const auto result =
            provider.fetchBlocking(request(domain::Granularity::OneMinute, kMinuteBase, to, domain::FetchDirection::Older));
        if (result.failed() || result.candles.size() != 1500) {
            return fail("Older fetch should be capped at 1500 candles, got " + std::to_string(result.candles.size()));
        }
        if (result.candles.front().time != to - 1499 * 60 || result.candles.back().time != to) {
            return fail("Older fetch should keep the newest candles");
        }
        if (exchange.targets.size() != 2 || exchange.targets[0].find("limit=1000") == std::string::npos ||
            exchange.targets[1].find("limit=500") == std::string::npos) {
            return fail("Expected two pages of 1000 and 500 rows");
        }
        if (exchange.targets[0].find("symbol=BTCUSDT&interval=1m") == std::string::npos) {
            return fail("Unexpected target " + exchange.targets[0]);
        }
    }

    {
        FakeExchange exchange;
        auto provider = makeProvider(ioc, exchange, 1500);
        const auto to = kMinuteBase + 2499 * 60;
        const auto result =
            provider.fetchBlocking(request(domain::Granularity::OneMinute, kMinuteBase, to, domain::FetchDirection::Newer));
        if (result.candles.size() != 1500 || result.candles.front().time != kMinuteBase ||
            result.candles.back().time != kMinuteBase + 1499 * 60) {
            return fail("Newer fetch should keep the oldest candles");
        }
    }

    {
        FakeExchange exchange;
        auto provider = makeProvider(ioc, exchange);
        const auto to = kHourBase + 7 * 24 * 3600;
        const auto result =
            provider.fetchBlocking(request(domain::Granularity::OneHour, kHourBase, to, domain::FetchDirection::Initial));
        if (result.failed() || result.candles.size() != 169 || exchange.targets.size() != 1) {
            return fail("A week of hourly candles should arrive in one page");
        }
        const auto expectedStart = "startTime=" + std::to_string(kHourBase * 1000);
        if (exchange.targets[0].find(expectedStart) == std::string::npos) {
            return fail("Request times must be sent in milliseconds: " + exchange.targets[0]);
        }
    }

    {
        FakeExchange exchange;
        auto provider = makeProvider(ioc, exchange);
        const auto result = provider.fetchBlocking(
            request(domain::Granularity::OneHour, kHourBase + 3600, kHourBase, domain::FetchDirection::Older));
        if (result.failed() || !result.candles.empty() || !exchange.targets.empty()) {
            return fail("An empty range should resolve without touching the network");
        }
    }

    {
        FakeExchange exchange;
        exchange.scriptedStatus = {429, 502, 200};
        auto provider = makeProvider(ioc, exchange);
        const auto result = provider.fetchBlocking(
            request(domain::Granularity::OneHour, kHourBase, kHourBase + 3600, domain::FetchDirection::Initial));
        if (result.failed() || result.candles.size() != 2 || exchange.targets.size() != 3) {
            return fail("Rate limit and 5xx responses should be retried");
        }
    }

    {
        const auto failedBefore = registry.counter(metric::names::kFetchFailed);

        FakeExchange exhausted;
        exhausted.scriptedStatus = {503, 503, 503, 503, 503};
        auto retrying = makeProvider(ioc, exhausted, 1000, 3);
        const auto afterRetries = retrying.fetchBlocking(
            request(domain::Granularity::OneHour, kHourBase, kHourBase + 3600, domain::FetchDirection::Older));
        if (!afterRetries.failed() || !afterRetries.candles.empty() || exhausted.targets.size() != 4) {
            return fail("Expected FetchFailed after one attempt plus three retries");
        }

        FakeExchange rejected;
        rejected.scriptedStatus = {400};
        auto provider = makeProvider(ioc, rejected);
        const auto badRequest = provider.fetchBlocking(
            request(domain::Granularity::OneHour, kHourBase, kHourBase + 3600, domain::FetchDirection::Older));
        if (!badRequest.failed() || rejected.targets.size() != 1) {
            return fail("A 400 response must fail without retrying");
        }

        FakeExchange offline;
        offline.throwTransport = true;
        auto offlineProvider = makeProvider(ioc, offline);
        if (!offlineProvider
                 .fetchBlocking(request(domain::Granularity::OneHour, kHourBase, kHourBase, domain::FetchDirection::Older))
                 .failed()) {
            return fail("Transport errors must resolve to FetchFailed");
        }

        FakeExchange garbage;
        garbage.bodyOverride = R"({"unexpected":true})";
        auto garbageProvider = makeProvider(ioc, garbage);
        if (!garbageProvider
                 .fetchBlocking(request(domain::Granularity::OneHour, kHourBase, kHourBase, domain::FetchDirection::Older))
                 .failed()) {
            return fail("A malformed payload must resolve to FetchFailed");
        }

        if (registry.counter(metric::names::kFetchFailed) - failedBefore != 4) {
            return fail("Every failed fetch should be counted");
        }
    }

    {
        FakeExchange exchange;
        const auto t0 = std::to_string(kHourBase * 1000);
        const auto t1 = std::to_string((kHourBase + 3600) * 1000);
        exchange.bodyOverride = "[[" + t1 + R"(,"1","NaN","0.5","1.5"],[)" + t0 + R"(,"1","2","0.5","1.5"]])";
        auto provider = makeProvider(ioc, exchange);
        const auto result = provider.fetchBlocking(
            request(domain::Granularity::OneHour, kHourBase, kHourBase + 3600, domain::FetchDirection::Older));
        if (result.failed() || result.candles.size() != 1 || result.invalidRecords != 1) {
            return fail("Invalid rows should be dropped and counted");
        }
    }

    {
        FakeExchange exchange;
        auto provider = makeProvider(ioc, exchange);
        auto work = boost::asio::make_work_guard(ioc);
        std::vector<domain::FetchResult> results;
        provider.fetch(request(domain::Granularity::OneHour, kHourBase, kHourBase + 7200, domain::FetchDirection::Newer),
                       [&](domain::FetchResult result) {
                           results.push_back(std::move(result));
                           work.reset();
                       });
        ioc.restart();
        ioc.run_for(5s);
        if (results.size() != 1 || results.front().candles.size() != 3 || results.front().request.tag != 1) {
            return fail("Async fetch should deliver one tagged result on the io_context");
        }
    }

    std::cout << "test_history_provider passed\n";
    return 0;
}

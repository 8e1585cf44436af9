#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace csync::common {

struct Config {
    csync::log::Level logLevel = csync::log::Level::Info;

    std::string symbol = "BTCUSDT";
    std::string granularity = "1h";

    std::string cache = "duck";
    std::string duckdbPath = "data/candlesync.duckdb";
    std::int64_t cacheTtlSec = 3600;

    std::string restHost = "api.binance.com";
    std::size_t maxRecordsPerCall = 1000;
    std::uint32_t restTimeoutSec = 10;
    std::uint32_t restMaxRetries = 3;
    std::size_t restThreads = 2;

    std::string wsHost = "stream.binance.com";
    std::string wsPort = "9443";
    std::uint32_t wsIdleTimeoutSec = 30;
    std::uint32_t backoffBaseMs = 500;
    std::uint32_t backoffCapMs = 15000;
    double backoffJitter = 0.0;

    std::int64_t backfillStepSec = 7LL * 24 * 60 * 60;
    std::int64_t retentionSec = 30LL * 24 * 60 * 60;
    std::uint32_t latestPriceMinIntervalMs = 0;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace csync::common

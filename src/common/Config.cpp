#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include "domain/Types.h"

namespace csync::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseUint32(const std::string& value, const std::string& label, bool allowZero) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if ((!allowZero && parsed == 0U) || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::int64_t parsePositiveSeconds(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("seconds must be positive");
        }
        return static_cast<std::int64_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parseRatio(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || parsed < 0.0 || parsed > 1.0) {
            throw std::out_of_range("ratio must be within [0, 1]");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parseCacheMode(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "duck" || normalized == "memory" || normalized == "none") {
        return normalized;
    }
    throw std::runtime_error("Invalid cache mode: " + value);
}

std::string parseGranularity(const std::string& value) {
    const auto parsed = domain::granularityFromString(value);
    if (!parsed) {
        throw std::runtime_error("Unsupported granularity: " + value);
    }
    return domain::granularityToString(*parsed);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = csync::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envCache = std::getenv("CANDLESYNC_CACHE")) {
        config.cache = parseCacheMode(envCache);
    }
    if (const char* envDuck = std::getenv("CANDLESYNC_DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = csync::log::levelFromString(toLower(levelArg));
    }
    if (auto symbolArg = valueFromArgs(argc, argv, "--symbol"); !symbolArg.empty()) {
        config.symbol = domain::normalizeSymbol(symbolArg);
    }
    if (auto granularityArg = valueFromArgs(argc, argv, "--granularity"); !granularityArg.empty()) {
        config.granularity = parseGranularity(granularityArg);
    }
    if (auto cacheArg = valueFromArgs(argc, argv, "--cache"); !cacheArg.empty()) {
        config.cache = parseCacheMode(cacheArg);
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto ttlArg = valueFromArgs(argc, argv, "--cache-ttl-sec"); !ttlArg.empty()) {
        config.cacheTtlSec = parsePositiveSeconds(ttlArg, "--cache-ttl-sec");
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--rest-host"); !hostArg.empty()) {
        config.restHost = trim(hostArg);
    }
    if (auto maxArg = valueFromArgs(argc, argv, "--max-records"); !maxArg.empty()) {
        config.maxRecordsPerCall = parseUint32(maxArg, "--max-records", false);
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--rest-timeout-sec"); !timeoutArg.empty()) {
        config.restTimeoutSec = parseUint32(timeoutArg, "--rest-timeout-sec", false);
    }
    if (auto retriesArg = valueFromArgs(argc, argv, "--rest-retries"); !retriesArg.empty()) {
        config.restMaxRetries = parseUint32(retriesArg, "--rest-retries", true);
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--rest-threads"); !threadsArg.empty()) {
        config.restThreads = parseUint32(threadsArg, "--rest-threads", false);
    }
    if (auto wsHostArg = valueFromArgs(argc, argv, "--ws-host"); !wsHostArg.empty()) {
        config.wsHost = trim(wsHostArg);
    }
    if (auto wsPortArg = valueFromArgs(argc, argv, "--ws-port"); !wsPortArg.empty()) {
        config.wsPort = std::to_string(parseUint32(wsPortArg, "--ws-port", false));
    }
    if (auto idleArg = valueFromArgs(argc, argv, "--ws-idle-timeout-sec"); !idleArg.empty()) {
        config.wsIdleTimeoutSec = parseUint32(idleArg, "--ws-idle-timeout-sec", false);
    }
    if (auto baseArg = valueFromArgs(argc, argv, "--backoff-base-ms"); !baseArg.empty()) {
        config.backoffBaseMs = parseUint32(baseArg, "--backoff-base-ms", false);
    }
    if (auto capArg = valueFromArgs(argc, argv, "--backoff-cap-ms"); !capArg.empty()) {
        config.backoffCapMs = parseUint32(capArg, "--backoff-cap-ms", false);
    }
    if (auto jitterArg = valueFromArgs(argc, argv, "--backoff-jitter"); !jitterArg.empty()) {
        config.backoffJitter = parseRatio(jitterArg, "--backoff-jitter");
    }
    if (auto stepArg = valueFromArgs(argc, argv, "--backfill-step-sec"); !stepArg.empty()) {
        config.backfillStepSec = parsePositiveSeconds(stepArg, "--backfill-step-sec");
    }
    if (auto retentionArg = valueFromArgs(argc, argv, "--retention-sec"); !retentionArg.empty()) {
        config.retentionSec = parsePositiveSeconds(retentionArg, "--retention-sec");
    }
    if (auto throttleArg = valueFromArgs(argc, argv, "--latest-price-min-interval-ms"); !throttleArg.empty()) {
        config.latestPriceMinIntervalMs = parseUint32(throttleArg, "--latest-price-min-interval-ms", true);
    }

    if (config.symbol.empty()) {
        throw std::runtime_error("Symbol cannot be empty");
    }
    if (config.backoffBaseMs > config.backoffCapMs) {
        throw std::runtime_error("--backoff-base-ms must not exceed --backoff-cap-ms");
    }

    if (config.cache == "duck") {
        if (config.duckdbPath.empty()) {
            throw std::runtime_error("DuckDB cache requires a non-empty --duckdb path");
        }
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw std::runtime_error("Unable to create DuckDB directory (" + parentDir.string() + "): " +
                                         ec.message());
            }
        }
        LOG_INFO(csync::log::Category::App, "DuckDB cache path: " << duckPath.string());
    }

    return config;
}

}  // namespace csync::common

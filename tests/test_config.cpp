#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::optional<std::string>{current} : std::nullopt);
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (saved_[i]) {
                ::setenv(names_[i].c_str(), saved_[i]->c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

private:
    std::vector<std::string> names_;
    std::vector<std::optional<std::string>> saved_;
};

csync::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return csync::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsFor(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard env({"LOG_LEVEL", "CANDLESYNC_CACHE", "CANDLESYNC_DUCKDB_PATH"});

    {
        const auto config = runConfig({"candlesync", "--cache=memory"});
        if (config.symbol != "BTCUSDT" || config.granularity != "1h" || config.cacheTtlSec != 3600 ||
            config.maxRecordsPerCall != 1000 || config.backoffBaseMs != 500 || config.backoffCapMs != 15000 ||
            config.backfillStepSec != 7 * 24 * 3600 || config.retentionSec != 30 * 24 * 3600 ||
            config.latestPriceMinIntervalMs != 0 || config.logLevel != csync::log::Level::Info) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
    }

    {
        const auto config = runConfig({"candlesync", "--symbol", "eth usdt", "--granularity=60m", "--cache", "none",
                                       "--max-records=500", "--backoff-base-ms=250", "--backoff-cap-ms=4000",
                                       "--latest-price-min-interval-ms=10000", "--rest-retries=0"});
        if (config.symbol != "ETHUSDT" || config.granularity != "1h" || config.cache != "none" ||
            config.maxRecordsPerCall != 500 || config.backoffBaseMs != 250 || config.backoffCapMs != 4000 ||
            config.latestPriceMinIntervalMs != 10000 || config.restMaxRetries != 0) {
            std::cerr << "Flags were not applied\n";
            return 1;
        }
    }

    {
        const std::string envDir = "/tmp/candlesync-tests/env";
        std::filesystem::remove_all(envDir);
        env.set("CANDLESYNC_DUCKDB_PATH", envDir + "/cache.duckdb");
        env.set("CANDLESYNC_CACHE", "duck");
        env.set("LOG_LEVEL", "debug");
        auto config = runConfig({"candlesync"});
        if (config.cache != "duck" || config.duckdbPath != envDir + "/cache.duckdb" ||
            config.logLevel != csync::log::Level::Debug) {
            std::cerr << "Environment was not applied\n";
            return 1;
        }
        if (!std::filesystem::is_directory(envDir)) {
            std::cerr << "Expected DuckDB parent directory to be created: " << envDir << "\n";
            return 1;
        }

        const std::string flagDir = "/tmp/candlesync-tests/flag";
        config = runConfig({"candlesync", "--duckdb=" + flagDir + "/cache.duckdb", "--log-level=warn"});
        if (config.duckdbPath != flagDir + "/cache.duckdb" || config.logLevel != csync::log::Level::Warn) {
            std::cerr << "Flags should override the environment\n";
            return 1;
        }
        ::unsetenv("CANDLESYNC_DUCKDB_PATH");
        ::unsetenv("CANDLESYNC_CACHE");
        ::unsetenv("LOG_LEVEL");
    }

    {
        const std::vector<std::vector<std::string>> invalid{
            {"candlesync", "--cache=memory", "--granularity=1M"},
            {"candlesync", "--cache=redis"},
            {"candlesync", "--cache=memory", "--max-records=0"},
            {"candlesync", "--cache=memory", "--backoff-base-ms=20000"},
            {"candlesync", "--cache=memory", "--backoff-jitter=1.5"},
            {"candlesync", "--cache=memory", "--retention-sec=-1"},
            {"candlesync", "--cache=memory", "--log-level=loud"},
            {"candlesync", "--cache=memory", "--rest-timeout-sec=ten"},
        };
        for (const auto& args : invalid) {
            if (!throwsFor(args)) {
                std::cerr << "Expected configuration error for " << args.back() << "\n";
                return 1;
            }
        }
    }

    std::cout << "test_config passed\n";
    return 0;
}

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include "adapters/binance/BinanceHistoryProvider.hpp"
#include "adapters/binance/BinanceLiveStream.hpp"
#include "app/ConsoleCommands.h"
#include "app/LoggingRenderSink.h"
#include "app/SyncController.h"
#include "bootstrap/CacheFactory.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"

namespace {
using csync::log::Category;

void logStatus(const app::SyncController& controller) {
    const auto& key = controller.key();
    LOG_INFO(Category::App,
             "Status state=" << domain::syncStateLabel(controller.state())
                             << " key=" << (key ? domain::toString(*key) : std::string("-"))
                             << " candles=" << controller.snapshot().size()
                             << " older_in_flight=" << controller.isBackfillingOlder()
                             << " newer_in_flight=" << controller.isBackfillingNewer());
    if (const auto bounds = controller.bounds()) {
        LOG_INFO(Category::App, "  bounds oldest=" << bounds->oldest << " newest=" << bounds->newest);
    }
    const auto metrics = csync::common::metrics::Registry::instance().snapshot();
    for (const auto& [name, counter] : metrics.counters) {
        LOG_INFO(Category::App, "  " << name << "=" << counter.value);
    }
    for (const auto& [name, gauge] : metrics.gauges) {
        LOG_INFO(Category::App, "  " << name << "=" << gauge.value);
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = csync::common::Config::fromArgs(argc, argv);
        csync::log::setLevel(config.logLevel);

        const auto granularity = domain::granularityFromString(config.granularity);
        if (!granularity) {
            throw std::runtime_error("Invalid granularity: " + config.granularity);
        }
        const auto key = domain::makeSeriesKey(config.symbol, *granularity);

        LOG_INFO(Category::App, "Configuration loaded");
        LOG_INFO(Category::App, "  Series: " << domain::toString(key));
        LOG_INFO(Category::App, "  Log level: " << csync::log::levelToString(config.logLevel));
        LOG_INFO(Category::App, "  Cache: " << config.cache << " ttl=" << config.cacheTtlSec << "s");
        LOG_INFO(Category::App,
                 "  REST: " << config.restHost << " max_records=" << config.maxRecordsPerCall
                            << " timeout=" << config.restTimeoutSec << "s retries=" << config.restMaxRetries);
        LOG_INFO(Category::App,
                 "  WS: " << config.wsHost << ":" << config.wsPort << " backoff=" << config.backoffBaseMs << ".."
                          << config.backoffCapMs << " ms");
        LOG_INFO(Category::App,
                 "  Backfill step=" << config.backfillStepSec << "s retention=" << config.retentionSec << "s");

        boost::asio::io_context ioContext;
        auto work = boost::asio::make_work_guard(ioContext);

        adapters::binance::HistoryProviderConfig historyConfig;
        historyConfig.host = config.restHost;
        historyConfig.maxRecordsPerCall = config.maxRecordsPerCall;
        historyConfig.timeoutSec = static_cast<int>(config.restTimeoutSec);
        historyConfig.maxRetries = config.restMaxRetries;
        historyConfig.threads = config.restThreads;
        adapters::binance::BinanceHistoryProvider history(ioContext, historyConfig);

        adapters::binance::LiveStreamConfig liveConfig;
        liveConfig.host = config.wsHost;
        liveConfig.port = config.wsPort;
        liveConfig.idleTimeoutSec = static_cast<int>(config.wsIdleTimeoutSec);
        liveConfig.backoff.base = std::chrono::milliseconds(config.backoffBaseMs);
        liveConfig.backoff.cap = std::chrono::milliseconds(config.backoffCapMs);
        liveConfig.backoff.jitterRatio = config.backoffJitter;
        adapters::binance::BinanceLiveStream live(ioContext, liveConfig);

        auto cache = bootstrap::makeCandleCache(config);

        app::SyncConfig syncConfig;
        syncConfig.backfillStepSec = config.backfillStepSec;
        syncConfig.retentionSec = config.retentionSec;
        syncConfig.latestPriceMinIntervalMs = config.latestPriceMinIntervalMs;

        app::LoggingRenderSink sink;
        core::SystemClock clock;
        app::SyncController controller(history, live, cache.get(), sink, clock, syncConfig);

        auto shutdown = [&]() {
            LOG_INFO(Category::App, "Starting graceful shutdown");
            controller.stop();
            work.reset();
            ioContext.stop();
        };

        boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
            if (ec) {
                return;
            }
            LOG_INFO(Category::App, "Signal " << signalNumber << " received");
            shutdown();
        });

        auto handleLine = [&](const std::string& line) {
            std::optional<app::Command> command;
            try {
                command = app::parseCommand(line);
            } catch (const std::invalid_argument& ex) {
                LOG_WARN(Category::App, "Ignoring command: " << ex.what());
                return;
            }
            if (!command) {
                return;
            }
            switch (command->kind) {
            case app::CommandKind::Older:
                controller.onViewportNearOlderEdge(command->time);
                break;
            case app::CommandKind::Newer:
                controller.onViewportNearNewerEdge(command->time);
                break;
            case app::CommandKind::Switch:
                controller.switchTo(command->key);
                break;
            case app::CommandKind::Status:
                logStatus(controller);
                break;
            case app::CommandKind::Quit:
                shutdown();
                break;
            }
        };

        std::unique_ptr<boost::asio::posix::stream_descriptor> console;
        boost::asio::streambuf consoleBuffer;
        std::function<void()> readConsole;
        try {
            console = std::make_unique<boost::asio::posix::stream_descriptor>(ioContext, ::dup(STDIN_FILENO));
        } catch (const std::exception& ex) {
            LOG_WARN(Category::App, "Console commands disabled: " << ex.what());
        }
        if (console) {
            readConsole = [&]() {
                boost::asio::async_read_until(
                    *console, consoleBuffer, '\n', [&](const boost::system::error_code& ec, std::size_t) {
                        if (ec) {
                            if (ec != boost::asio::error::operation_aborted) {
                                LOG_INFO(Category::App, "Console closed: " << ec.message());
                            }
                            return;
                        }
                        std::istream stream(&consoleBuffer);
                        std::string line;
                        std::getline(stream, line);
                        handleLine(line);
                        if (ioContext.stopped()) {
                            return;
                        }
                        readConsole();
                    });
            };
            readConsole();
        }

        controller.start(key);
        LOG_INFO(Category::App, "candlesync running. Commands: older <t>, newer <t>, switch <sym> <gran>, status, quit");
        ioContext.run();

        LOG_INFO(Category::App, "Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR(Category::App, "Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

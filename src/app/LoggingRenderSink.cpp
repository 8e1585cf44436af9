#include "app/LoggingRenderSink.h"

#include "common/Log.hpp"

namespace app {
namespace {
using csync::log::Category;
}

void LoggingRenderSink::onSeriesReplaced(const domain::CandleSeries& series, const domain::ViewAnchor& anchor) {
    seriesSize_ = series.size();
    if (series.empty()) {
        LOG_INFO(Category::App, "Series replaced: empty");
        return;
    }
    if (anchor.preserveTime) {
        LOG_INFO(Category::App,
                 "Series replaced: " << series.size() << " candles [" << series.front().time << ", "
                                     << series.back().time << "] anchor=" << *anchor.preserveTime);
    } else {
        LOG_INFO(Category::App,
                 "Series replaced: " << series.size() << " candles [" << series.front().time << ", "
                                     << series.back().time << "]");
    }
}

void LoggingRenderSink::onCandleUpserted(const domain::Candle& candle) {
    LOG_DEBUG(Category::App,
              "Candle t=" << candle.time << " o=" << candle.open << " h=" << candle.high << " l=" << candle.low
                          << " c=" << candle.close);
}

void LoggingRenderSink::onLatestPrice(double price) {
    LOG_INFO(Category::App, "Latest price " << price);
}

void LoggingRenderSink::onSyncStateChanged(domain::SyncState state) {
    LOG_INFO(Category::App, "Sync state " << domain::syncStateLabel(state));
}

}  // namespace app

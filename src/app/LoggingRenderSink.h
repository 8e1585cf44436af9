#pragma once

#include <cstddef>

#include "domain/Ports.hpp"

namespace app {

// Renderer stand-in for the console host: reports every engine notification
// through the log.
class LoggingRenderSink : public domain::IRenderSink {
public:
    void onSeriesReplaced(const domain::CandleSeries& series, const domain::ViewAnchor& anchor) override;
    void onCandleUpserted(const domain::Candle& candle) override;
    void onLatestPrice(double price) override;
    void onSyncStateChanged(domain::SyncState state) override;

    std::size_t seriesSize() const noexcept { return seriesSize_; }

private:
    std::size_t seriesSize_{0};
};

}  // namespace app

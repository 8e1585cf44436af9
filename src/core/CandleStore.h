#pragma once

#include <cstddef>
#include <optional>

#include "domain/Types.h"

namespace core {

// Authoritative in-memory series for one SeriesKey. Merge is last-write-wins
// per time, so repeated or overlapping inputs converge to the same series.
class CandleStore {
public:
    CandleStore() = default;

    const domain::CandleSeries& merge(const domain::CandleSeries& incoming);
    const domain::CandleSeries& upsert(const domain::Candle& candle);

    std::optional<domain::TimeBounds> bounds() const;
    const domain::CandleSeries& series() const noexcept { return series_; }
    std::size_t size() const noexcept { return series_.size(); }
    bool empty() const noexcept { return series_.empty(); }

    void reset();

    // Pure union of two series; entries in `incoming` replace equal times in `base`.
    static domain::CandleSeries mergeSeries(const domain::CandleSeries& base,
                                            const domain::CandleSeries& incoming);

private:
    domain::CandleSeries series_;
};

}  // namespace core

#include "core/CandleStore.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace core {
namespace {

bool byTime(const domain::Candle& lhs, const domain::Candle& rhs) {
    return lhs.time < rhs.time;
}

// Sorted, valid, one entry per time; the last occurrence in input order wins.
domain::CandleSeries normalizeIncoming(const domain::CandleSeries& incoming) {
    domain::CandleSeries sorted;
    sorted.reserve(incoming.size());
    std::copy_if(incoming.begin(), incoming.end(), std::back_inserter(sorted), [](const domain::Candle& c) {
        return domain::isValidCandle(c);
    });
    std::stable_sort(sorted.begin(), sorted.end(), byTime);

    domain::CandleSeries unique;
    unique.reserve(sorted.size());
    for (const auto& candle : sorted) {
        if (!unique.empty() && unique.back().time == candle.time) {
            unique.back() = candle;
        } else {
            unique.push_back(candle);
        }
    }
    return unique;
}

}  // namespace

domain::CandleSeries CandleStore::mergeSeries(const domain::CandleSeries& base,
                                              const domain::CandleSeries& incoming) {
    const auto normalized = normalizeIncoming(incoming);
    if (normalized.empty()) {
        return base;
    }

    domain::CandleSeries merged;
    merged.reserve(base.size() + normalized.size());

    auto lhs = base.begin();
    auto rhs = normalized.begin();
    while (lhs != base.end() && rhs != normalized.end()) {
        if (lhs->time < rhs->time) {
            merged.push_back(*lhs++);
        } else if (rhs->time < lhs->time) {
            merged.push_back(*rhs++);
        } else {
            merged.push_back(*rhs++);
            ++lhs;
        }
    }
    merged.insert(merged.end(), lhs, base.end());
    merged.insert(merged.end(), rhs, normalized.end());
    return merged;
}

const domain::CandleSeries& CandleStore::merge(const domain::CandleSeries& incoming) {
    if (incoming.size() == 1U) {
        return upsert(incoming.front());
    }
    series_ = mergeSeries(series_, incoming);
    return series_;
}

const domain::CandleSeries& CandleStore::upsert(const domain::Candle& candle) {
    if (!domain::isValidCandle(candle)) {
        return series_;
    }

    // Live updates almost always touch the newest bucket.
    if (series_.empty() || series_.back().time < candle.time) {
        series_.push_back(candle);
        return series_;
    }
    if (series_.back().time == candle.time) {
        series_.back() = candle;
        return series_;
    }

    auto it = std::lower_bound(series_.begin(), series_.end(), candle, byTime);
    if (it != series_.end() && it->time == candle.time) {
        *it = candle;
    } else {
        series_.insert(it, candle);
    }
    return series_;
}

std::optional<domain::TimeBounds> CandleStore::bounds() const {
    if (series_.empty()) {
        return std::nullopt;
    }
    return domain::TimeBounds{series_.front().time, series_.back().time};
}

void CandleStore::reset() {
    domain::CandleSeries empty;
    series_.swap(empty);
}

}  // namespace core

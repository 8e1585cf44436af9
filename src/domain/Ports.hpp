#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "domain/Types.h"

namespace domain {

enum class FetchDirection {
    Initial,
    Older,
    Newer,
};

enum class FetchStatus {
    Ok,
    FetchFailed,
};

inline const char* fetchDirectionLabel(FetchDirection direction) {
    switch (direction) {
    case FetchDirection::Initial:
        return "initial";
    case FetchDirection::Older:
        return "older";
    case FetchDirection::Newer:
        return "newer";
    }
    return "?";
}

// Both bounds are inclusive bucket opens, in seconds.
struct FetchRequest {
    SeriesKey key;
    std::int64_t fromTime{0};
    std::int64_t toTime{0};
    FetchDirection direction{FetchDirection::Initial};
    std::uint64_t tag{0};
};

struct FetchResult {
    FetchRequest request;
    CandleSeries candles;
    FetchStatus status{FetchStatus::Ok};
    std::size_t invalidRecords{0};

    bool failed() const noexcept { return status != FetchStatus::Ok; }
};

using FetchCallback = std::function<void(FetchResult)>;

// Pull-based access to a remote candle history. fetch() never throws and
// never hangs: failures resolve to an empty FetchFailed result.
class IHistoryProvider {
public:
    virtual ~IHistoryProvider() = default;

    virtual void fetch(const FetchRequest& request, FetchCallback callback) = 0;
    virtual std::size_t maxRecordsPerCall() const = 0;
};

// Push-based candle updates for one key at a time. Handlers run on the
// consumer's executor; nothing is delivered after unsubscribe() returns.
class ILiveStream {
public:
    using UpdateHandler = std::function<void(const SeriesKey&, const CandleUpdate&)>;
    using StateHandler = std::function<void(ConnectionState)>;

    virtual ~ILiveStream() = default;

    virtual void subscribe(const SeriesKey& key, UpdateHandler onUpdate, StateHandler onState) = 0;
    virtual void unsubscribe() = 0;
    virtual ConnectionState state() const = 0;
};

// Keyed snapshot store with a freshness window. Implementations absorb
// their own storage failures: a broken cache behaves like an empty one.
class ICandleCache {
public:
    virtual ~ICandleCache() = default;

    virtual std::optional<CandleSeries> get(const SeriesKey& key, TimestampMs nowMs) = 0;
    virtual void put(const SeriesKey& key, const CandleSeries& candles, TimestampMs nowMs) = 0;
    virtual void remove(const SeriesKey& key) = 0;
};

enum class SyncState {
    Idle,
    InitialLoad,
    Ready,
};

inline const char* syncStateLabel(SyncState state) {
    switch (state) {
    case SyncState::Idle:
        return "Idle";
    case SyncState::InitialLoad:
        return "InitialLoad";
    case SyncState::Ready:
        return "Ready";
    }
    return "Unknown";
}

struct ViewAnchor {
    // Time the viewport should stay pinned to after the series was replaced.
    std::optional<std::int64_t> preserveTime;
};

class IRenderSink {
public:
    virtual ~IRenderSink() = default;

    virtual void onSeriesReplaced(const CandleSeries& series, const ViewAnchor& anchor) = 0;
    virtual void onCandleUpserted(const Candle& candle) = 0;
    virtual void onLatestPrice(double price) = 0;
    virtual void onSyncStateChanged(SyncState state) { (void)state; }
};

class IClock {
public:
    virtual ~IClock() = default;

    virtual TimestampMs nowMs() const = 0;
};

}  // namespace domain

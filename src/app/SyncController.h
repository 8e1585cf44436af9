#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "core/CandleStore.h"
#include "domain/Ports.hpp"

namespace app {

struct SyncConfig {
    std::int64_t backfillStepSec = 7 * 24 * 60 * 60;
    std::int64_t retentionSec = 30 * 24 * 60 * 60;
    // 0 forwards every live close price.
    std::int64_t latestPriceMinIntervalMs = 0;
};

// Initial window requested on a cache miss.
std::int64_t defaultLookbackSeconds(domain::Granularity granularity) noexcept;

// Owns the active series and drives it through Idle -> InitialLoad -> Ready.
// Every public call and every collaborator callback runs on one executor; the
// controller never blocks and never throws out of a collaborator callback.
class SyncController {
public:
    SyncController(domain::IHistoryProvider& provider,
                   domain::ILiveStream& stream,
                   domain::ICandleCache* cache,
                   domain::IRenderSink& sink,
                   const domain::IClock& clock,
                   SyncConfig config = {});
    ~SyncController();

    SyncController(const SyncController&) = delete;
    SyncController& operator=(const SyncController&) = delete;

    void start(const domain::SeriesKey& key);
    void switchTo(const domain::SeriesKey& key);
    void stop();

    void onViewportNearOlderEdge(std::int64_t requestedTime);
    void onViewportNearNewerEdge(std::int64_t requestedTime);

    domain::SyncState state() const noexcept { return state_; }
    const std::optional<domain::SeriesKey>& key() const noexcept { return key_; }
    const domain::CandleSeries& snapshot() const noexcept { return store_.series(); }
    std::optional<domain::TimeBounds> bounds() const { return store_.bounds(); }
    bool isBackfillingOlder() const noexcept { return olderInFlight_; }
    bool isBackfillingNewer() const noexcept { return newerInFlight_; }
    bool isCatchingUp() const noexcept { return catchUpFrom_.has_value(); }
    std::uint64_t session() const noexcept { return session_; }

    // Backfill step actually used for the active granularity.
    std::int64_t effectiveBackfillStep() const;

private:
    void beginInitialLoad_();
    void onInitialFetch_(domain::FetchResult result);
    void finishInitialLoad_(bool fromCache);
    void openLiveStream_();
    void closeLiveStream_();

    void onLiveUpdate_(std::uint64_t session, const domain::SeriesKey& key, const domain::CandleUpdate& update);
    void onConnectionState_(std::uint64_t session, domain::ConnectionState connection);

    void armCatchUp_(const char* reason);
    void resumeCatchUp_();
    void advanceCatchUp_(const domain::FetchRequest& fetched);
    void issueFetch_(const domain::FetchRequest& request);
    void onBackfillResult_(domain::FetchResult result);

    bool isCurrent_(const domain::FetchRequest& request) const;
    void dropStale_(const char* what);
    void transitionTo_(domain::SyncState next);
    void persistSnapshot_();
    void publishLatestPrice_(double price);
    std::int64_t nowSeconds_() const;

    domain::IHistoryProvider& provider_;
    domain::ILiveStream& stream_;
    domain::ICandleCache* cache_{nullptr};
    domain::IRenderSink& sink_;
    const domain::IClock& clock_;
    SyncConfig config_;

    core::CandleStore store_;
    std::optional<domain::SeriesKey> key_;
    domain::SyncState state_{domain::SyncState::Idle};
    std::uint64_t session_{0};
    bool olderInFlight_{false};
    bool newerInFlight_{false};
    bool streamOpen_{false};
    domain::ConnectionState connection_{domain::ConnectionState::Disconnected};
    // First bucket that may be missing after a cache load or a lost transport;
    // newer fetches walk it forward until it passes the current bucket.
    std::optional<std::int64_t> catchUpFrom_;
    std::optional<domain::TimestampMs> lastPricePublishMs_;

    // Callbacks hold a weak reference and bail out once the controller is gone.
    std::shared_ptr<int> alive_{std::make_shared<int>(0)};
};

}  // namespace app

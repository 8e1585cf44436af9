#include "app/SyncController.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {
using csync::log::Category;
namespace metric = csync::common::metrics;

constexpr std::int64_t kHour = 60 * 60;
constexpr std::int64_t kDay = 24 * kHour;

}  // namespace

std::int64_t defaultLookbackSeconds(domain::Granularity granularity) noexcept {
    switch (granularity) {
    case domain::Granularity::OneMinute:
        return 12 * kHour;
    case domain::Granularity::FiveMinutes:
        return 2 * kDay;
    case domain::Granularity::FifteenMinutes:
    case domain::Granularity::ThirtyMinutes:
    case domain::Granularity::OneHour:
        return 7 * kDay;
    case domain::Granularity::FourHours:
    case domain::Granularity::OneDay:
        return 30 * kDay;
    }
    return 7 * kDay;
}

SyncController::SyncController(domain::IHistoryProvider& provider,
                               domain::ILiveStream& stream,
                               domain::ICandleCache* cache,
                               domain::IRenderSink& sink,
                               const domain::IClock& clock,
                               SyncConfig config)
    : provider_(provider), stream_(stream), cache_(cache), sink_(sink), clock_(clock), config_(config) {
    if (config_.backfillStepSec <= 0) {
        config_.backfillStepSec = SyncConfig{}.backfillStepSec;
    }
    if (config_.retentionSec <= 0) {
        config_.retentionSec = SyncConfig{}.retentionSec;
    }
}

SyncController::~SyncController() {
    alive_.reset();
    closeLiveStream_();
}

void SyncController::start(const domain::SeriesKey& key) {
    if (state_ != domain::SyncState::Idle) {
        switchTo(key);
        return;
    }
    key_ = key;
    ++session_;
    LOG_INFO(Category::App, "Sync start " << domain::toString(key) << " session=" << session_);
    beginInitialLoad_();
}

void SyncController::switchTo(const domain::SeriesKey& key) {
    if (state_ == domain::SyncState::Idle) {
        start(key);
        return;
    }
    if (key_ && *key_ == key) {
        LOG_DEBUG(Category::App, "Sync switch ignored, already on " << domain::toString(key));
        return;
    }

    LOG_INFO(Category::App,
             "Sync switch " << (key_ ? domain::toString(*key_) : std::string("-")) << " -> "
                            << domain::toString(key));
    closeLiveStream_();
    store_.reset();
    olderInFlight_ = false;
    newerInFlight_ = false;
    catchUpFrom_.reset();
    lastPricePublishMs_.reset();
    key_ = key;
    ++session_;
    beginInitialLoad_();
}

void SyncController::stop() {
    if (state_ == domain::SyncState::Idle) {
        return;
    }
    LOG_INFO(Category::App, "Sync stop session=" << session_);
    closeLiveStream_();
    ++session_;
    store_.reset();
    olderInFlight_ = false;
    newerInFlight_ = false;
    catchUpFrom_.reset();
    lastPricePublishMs_.reset();
    key_.reset();
    transitionTo_(domain::SyncState::Idle);
}

std::int64_t SyncController::effectiveBackfillStep() const {
    const auto granularity = key_ ? key_->granularity : domain::Granularity::OneHour;
    const auto bucket = domain::granularitySeconds(granularity);
    auto step = std::max(config_.backfillStepSec, bucket);
    const auto maxRecords = static_cast<std::int64_t>(provider_.maxRecordsPerCall());
    if (maxRecords > 0) {
        step = std::min(step, maxRecords * bucket);
    }
    return step;
}

void SyncController::beginInitialLoad_() {
    transitionTo_(domain::SyncState::InitialLoad);
    const auto& key = *key_;

    if (cache_ != nullptr) {
        if (auto cached = cache_->get(key, clock_.nowMs())) {
            LOG_INFO(Category::App,
                     "Initial load from cache " << domain::toString(key) << " candles=" << cached->size());
            store_.merge(*cached);
            finishInitialLoad_(true);
            return;
        }
    }

    const auto now = nowSeconds_();
    domain::FetchRequest request;
    request.key = key;
    request.direction = domain::FetchDirection::Initial;
    request.toTime = domain::alignDown(now, key.granularity);
    request.fromTime = domain::alignDown(now - defaultLookbackSeconds(key.granularity), key.granularity);
    request.tag = session_;
    LOG_INFO(Category::App,
             "Initial load fetch " << domain::toString(key) << " from=" << request.fromTime
                                   << " to=" << request.toTime);
    issueFetch_(request);
}

void SyncController::onInitialFetch_(domain::FetchResult result) {
    if (!isCurrent_(result.request) || state_ != domain::SyncState::InitialLoad) {
        dropStale_("initial fetch");
        return;
    }

    if (result.failed()) {
        LOG_WARN(Category::App,
                 "Initial fetch failed for " << domain::toString(*key_) << ", continuing with an empty series");
    } else {
        store_.merge(result.candles);
        if (!store_.empty()) {
            persistSnapshot_();
        }
    }
    finishInitialLoad_(false);
}

void SyncController::finishInitialLoad_(bool fromCache) {
    sink_.onSeriesReplaced(store_.series(), domain::ViewAnchor{});
    openLiveStream_();
    transitionTo_(domain::SyncState::Ready);
    if (fromCache) {
        // The snapshot ends where it was written; the stream only covers what comes next.
        armCatchUp_("cache load");
    }
    LOG_INFO(Category::App,
             "Sync ready " << domain::toString(*key_) << " candles=" << store_.size());
}

void SyncController::openLiveStream_() {
    const auto session = session_;
    std::weak_ptr<int> alive = alive_;
    connection_ = domain::ConnectionState::Disconnected;
    catchUpFrom_.reset();
    try {
        stream_.subscribe(
            *key_,
            [this, alive, session](const domain::SeriesKey& key, const domain::CandleUpdate& update) {
                if (alive.expired()) {
                    return;
                }
                onLiveUpdate_(session, key, update);
            },
            [this, alive, session](domain::ConnectionState connection) {
                if (alive.expired()) {
                    return;
                }
                onConnectionState_(session, connection);
            });
        streamOpen_ = true;
    } catch (const std::exception& ex) {
        LOG_ERR(Category::App, "Live stream subscribe failed for " << domain::toString(*key_) << ": " << ex.what());
    }
}

void SyncController::closeLiveStream_() {
    if (!streamOpen_) {
        return;
    }
    streamOpen_ = false;
    connection_ = domain::ConnectionState::Disconnected;
    try {
        stream_.unsubscribe();
    } catch (const std::exception& ex) {
        LOG_WARN(Category::App, "Live stream unsubscribe failed: " << ex.what());
    }
}

void SyncController::onLiveUpdate_(std::uint64_t session,
                                   const domain::SeriesKey& key,
                                   const domain::CandleUpdate& update) {
    if (session != session_ || !key_ || key != *key_ || state_ != domain::SyncState::Ready) {
        dropStale_("live update");
        return;
    }
    const auto& candle = update.candle;
    if (!domain::isValidCandle(candle) || !domain::isAligned(candle, key.granularity)) {
        metric::Registry::instance().incrementCounter(metric::names::kInvalidRecords);
        LOG_DEBUG(Category::Data, "Dropping invalid live candle t=" << candle.time);
        return;
    }

    store_.upsert(candle);
    sink_.onCandleUpserted(candle);
    if (update.isFinal) {
        LOG_DEBUG(Category::Data, "Live candle closed t=" << candle.time << " close=" << candle.close);
        persistSnapshot_();
    }
    publishLatestPrice_(candle.close);
}

void SyncController::onConnectionState_(std::uint64_t session, domain::ConnectionState connection) {
    if (session != session_) {
        return;
    }
    const auto previous = connection_;
    connection_ = connection;
    LOG_INFO(Category::Net,
             "Live stream " << domain::connectionStateLabel(previous) << " -> "
                            << domain::connectionStateLabel(connection));

    if (connection == domain::ConnectionState::Backoff) {
        if (state_ == domain::SyncState::Ready) {
            armCatchUp_("transport lost");
        }
        return;
    }
    if (connection == domain::ConnectionState::Connected) {
        resumeCatchUp_();
    }
}

void SyncController::onViewportNearOlderEdge(std::int64_t requestedTime) {
    if (state_ != domain::SyncState::Ready) {
        LOG_DEBUG(Category::App, "Older edge ignored in state " << domain::syncStateLabel(state_));
        return;
    }
    if (olderInFlight_) {
        LOG_DEBUG(Category::App, "Older backfill already in flight");
        return;
    }
    const auto bounds = store_.bounds();
    if (!bounds) {
        LOG_DEBUG(Category::App, "Older edge ignored on an empty series");
        return;
    }
    if (requestedTime >= bounds->oldest) {
        return;
    }

    const auto granularity = key_->granularity;
    const auto bucket = domain::granularitySeconds(granularity);
    const auto horizon = domain::alignUp(nowSeconds_() - config_.retentionSec, granularity);

    domain::FetchRequest request;
    request.key = *key_;
    request.direction = domain::FetchDirection::Older;
    request.fromTime = std::max(domain::alignDown(requestedTime - effectiveBackfillStep(), granularity), horizon);
    request.toTime = bounds->oldest - bucket;
    request.tag = session_;
    if (request.fromTime > request.toTime) {
        LOG_INFO(Category::App, "Older backfill stopped at retention horizon " << horizon);
        return;
    }

    olderInFlight_ = true;
    LOG_INFO(Category::App,
             "Backfill older " << domain::toString(*key_) << " from=" << request.fromTime
                               << " to=" << request.toTime);
    issueFetch_(request);
}

void SyncController::onViewportNearNewerEdge(std::int64_t requestedTime) {
    if (state_ != domain::SyncState::Ready) {
        LOG_DEBUG(Category::App, "Newer edge ignored in state " << domain::syncStateLabel(state_));
        return;
    }
    if (newerInFlight_) {
        LOG_DEBUG(Category::App, "Newer backfill already in flight");
        return;
    }
    const auto bounds = store_.bounds();
    if (!bounds || requestedTime <= bounds->newest) {
        return;
    }

    const auto granularity = key_->granularity;
    const auto bucket = domain::granularitySeconds(granularity);

    domain::FetchRequest request;
    request.key = *key_;
    request.direction = domain::FetchDirection::Newer;
    request.fromTime = bounds->newest + bucket;
    request.toTime = std::min({domain::alignDown(requestedTime, granularity),
                               domain::alignDown(nowSeconds_(), granularity),
                               request.fromTime + effectiveBackfillStep() - bucket});
    request.tag = session_;
    if (request.fromTime > request.toTime) {
        return;
    }

    newerInFlight_ = true;
    LOG_INFO(Category::App,
             "Backfill newer " << domain::toString(*key_) << " from=" << request.fromTime
                               << " to=" << request.toTime);
    issueFetch_(request);
}

void SyncController::armCatchUp_(const char* reason) {
    const auto bounds = store_.bounds();
    if (catchUpFrom_ || !bounds) {
        return;
    }
    catchUpFrom_ = bounds->newest + domain::granularitySeconds(key_->granularity);
    LOG_INFO(Category::App, "Catch-up armed (" << reason << ") from=" << *catchUpFrom_);
}

void SyncController::resumeCatchUp_() {
    if (!catchUpFrom_ || state_ != domain::SyncState::Ready ||
        connection_ != domain::ConnectionState::Connected || newerInFlight_) {
        return;
    }

    const auto granularity = key_->granularity;
    const auto bucket = domain::granularitySeconds(granularity);
    const auto now = nowSeconds_();
    const auto horizon = domain::alignUp(now - config_.retentionSec, granularity);

    catchUpFrom_ = std::max(*catchUpFrom_, horizon);

    domain::FetchRequest request;
    request.key = *key_;
    request.direction = domain::FetchDirection::Newer;
    request.fromTime = *catchUpFrom_;
    request.toTime = std::min(domain::alignDown(now, granularity), request.fromTime + effectiveBackfillStep() - bucket);
    request.tag = session_;
    if (request.fromTime > request.toTime) {
        LOG_DEBUG(Category::App, "Catch-up complete at " << request.fromTime);
        catchUpFrom_.reset();
        return;
    }

    newerInFlight_ = true;
    LOG_INFO(Category::App,
             "Catch-up " << domain::toString(*key_) << " from=" << request.fromTime << " to=" << request.toTime);
    issueFetch_(request);
}

void SyncController::advanceCatchUp_(const domain::FetchRequest& fetched) {
    // Only a fetch that starts at or before the cursor leaves no hole behind it.
    if (!catchUpFrom_ || fetched.fromTime > *catchUpFrom_) {
        return;
    }
    const auto bucket = domain::granularitySeconds(fetched.key.granularity);
    catchUpFrom_ = std::max(*catchUpFrom_, fetched.toTime + bucket);
}

void SyncController::issueFetch_(const domain::FetchRequest& request) {
    std::weak_ptr<int> alive = alive_;
    provider_.fetch(request, [this, alive](domain::FetchResult result) {
        if (alive.expired()) {
            return;
        }
        if (result.request.direction == domain::FetchDirection::Initial) {
            onInitialFetch_(std::move(result));
        } else {
            onBackfillResult_(std::move(result));
        }
    });
}

void SyncController::onBackfillResult_(domain::FetchResult result) {
    if (!isCurrent_(result.request)) {
        dropStale_("backfill");
        return;
    }

    const auto direction = result.request.direction;
    const bool older = direction == domain::FetchDirection::Older;
    if (older) {
        olderInFlight_ = false;
    } else {
        newerInFlight_ = false;
    }

    if (result.failed()) {
        // A pending catch-up waits for the next reconnect or newer result.
        LOG_WARN(Category::App,
                 "Backfill " << domain::fetchDirectionLabel(direction) << " failed for "
                             << domain::toString(*key_));
        return;
    }
    if (!older) {
        advanceCatchUp_(result.request);
    }
    if (result.candles.empty()) {
        LOG_INFO(Category::App, "Backfill " << domain::fetchDirectionLabel(direction) << " returned no candles");
        if (!older) {
            resumeCatchUp_();
        }
        return;
    }

    // Pin the view to the edge that was loaded before this fetch.
    const auto bucket = domain::granularitySeconds(result.request.key.granularity);
    domain::ViewAnchor anchor;
    anchor.preserveTime = older ? result.request.toTime + bucket : result.request.fromTime - bucket;

    const auto before = store_.size();
    store_.merge(result.candles);
    LOG_INFO(Category::Data,
             "Backfill " << domain::fetchDirectionLabel(direction) << " merged " << store_.size() - before
                         << " new candles, total=" << store_.size());
    sink_.onSeriesReplaced(store_.series(), anchor);
    if (!older) {
        resumeCatchUp_();
    }
}

bool SyncController::isCurrent_(const domain::FetchRequest& request) const {
    return request.tag == session_ && key_ && request.key == *key_;
}

void SyncController::dropStale_(const char* what) {
    metric::Registry::instance().incrementCounter(metric::names::kStaleResultsDropped);
    LOG_DEBUG(Category::App, "Dropped stale " << what << " (session=" << session_ << ")");
}

void SyncController::transitionTo_(domain::SyncState next) {
    if (state_ == next) {
        return;
    }
    LOG_DEBUG(Category::App,
              "Sync state " << domain::syncStateLabel(state_) << " -> " << domain::syncStateLabel(next));
    state_ = next;
    sink_.onSyncStateChanged(next);
}

void SyncController::persistSnapshot_() {
    if (cache_ == nullptr || !key_) {
        return;
    }
    cache_->put(*key_, store_.series(), clock_.nowMs());
}

void SyncController::publishLatestPrice_(double price) {
    if (config_.latestPriceMinIntervalMs > 0) {
        const auto now = clock_.nowMs();
        if (lastPricePublishMs_ && now - *lastPricePublishMs_ < config_.latestPriceMinIntervalMs) {
            return;
        }
        lastPricePublishMs_ = now;
    }
    sink_.onLatestPrice(price);
}

std::int64_t SyncController::nowSeconds_() const {
    return static_cast<std::int64_t>(clock_.nowMs() / 1000);
}

}  // namespace app

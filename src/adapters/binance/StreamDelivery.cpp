#include "adapters/binance/StreamDelivery.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "adapters/binance/KlineParser.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::binance {
namespace {
using csync::log::Category;
}

StreamDelivery::StreamDelivery(boost::asio::io_context& callbackContext) : callbackContext_(callbackContext) {}

std::uint64_t StreamDelivery::open(const domain::SeriesKey& key,
                                   domain::ILiveStream::UpdateHandler onUpdate,
                                   domain::ILiveStream::StateHandler onState) {
    std::lock_guard<std::mutex> lock(mutex_);
    key_ = key;
    onUpdate_ = std::move(onUpdate);
    onState_ = std::move(onState);
    return generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

void StreamDelivery::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    onUpdate_ = nullptr;
    onState_ = nullptr;
}

void StreamDelivery::deliverFrame(std::uint64_t generation, std::string_view payload) {
    if (!current_(generation)) {
        return;
    }

    auto message = parseKlineMessage(payload);
    switch (message.kind) {
    case KlineMessageKind::Control:
        LOG_DEBUG(Category::Net, "Live stream control frame " << message.detail);
        return;
    case KlineMessageKind::Malformed:
        LOG_WARN(Category::Net, "Live stream dropped malformed frame: " << message.detail);
        return;
    case KlineMessageKind::InvalidRecord:
        csync::common::metrics::Registry::instance().incrementCounter(
            csync::common::metrics::names::kInvalidRecords);
        LOG_WARN(Category::Net, "Live stream dropped invalid kline: " << message.detail);
        return;
    case KlineMessageKind::Update:
        break;
    }

    domain::SeriesKey key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        key = key_;
    }
    if (message.symbol != key.symbol || !message.granularity || *message.granularity != key.granularity) {
        LOG_DEBUG(Category::Net,
                  "Live stream ignoring kline for " << message.symbol << " while subscribed to "
                                                    << domain::toString(key));
        return;
    }

    boost::asio::post(callbackContext_,
                      [self = shared_from_this(), generation, key = std::move(key), update = message.update]() {
                          domain::ILiveStream::UpdateHandler handler;
                          {
                              std::lock_guard<std::mutex> lock(self->mutex_);
                              if (!self->current_(generation)) {
                                  return;
                              }
                              handler = self->onUpdate_;
                          }
                          if (handler) {
                              handler(key, update);
                          }
                      });
}

void StreamDelivery::deliverState(std::uint64_t generation, domain::ConnectionState state) {
    if (!current_(generation)) {
        return;
    }
    boost::asio::post(callbackContext_, [self = shared_from_this(), generation, state]() {
        domain::ILiveStream::StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (!self->current_(generation)) {
                return;
            }
            handler = self->onState_;
        }
        if (handler) {
            handler(state);
        }
    });
}

}  // namespace adapters::binance

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "domain/Ports.hpp"

namespace adapters::binance {

// Hands decoded kline frames and connection changes over to the consumer's
// io_context. Every subscription gets a generation; anything tagged with an
// older generation is dropped, both before posting and again when the posted
// handler runs.
class StreamDelivery : public std::enable_shared_from_this<StreamDelivery> {
public:
    explicit StreamDelivery(boost::asio::io_context& callbackContext);

    std::uint64_t open(const domain::SeriesKey& key,
                       domain::ILiveStream::UpdateHandler onUpdate,
                       domain::ILiveStream::StateHandler onState);
    void close();

    std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }

    void deliverFrame(std::uint64_t generation, std::string_view payload);
    void deliverState(std::uint64_t generation, domain::ConnectionState state);

private:
    bool current_(std::uint64_t generation) const noexcept { return this->generation() == generation; }

    boost::asio::io_context& callbackContext_;
    std::atomic<std::uint64_t> generation_{0};
    mutable std::mutex mutex_;
    domain::SeriesKey key_;
    domain::ILiveStream::UpdateHandler onUpdate_;
    domain::ILiveStream::StateHandler onState_;
};

}  // namespace adapters::binance

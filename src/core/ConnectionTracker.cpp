#include "core/ConnectionTracker.h"

#include <utility>

#include "common/Log.hpp"

namespace core {

using domain::ConnectionState;

ConnectionTracker::ConnectionTracker(Backoff::Config backoff) : backoff_(backoff) {}

void ConnectionTracker::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

ConnectionState ConnectionTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ConnectionTracker::attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_.attempt();
}

bool ConnectionTracker::beginConnect() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Disconnected && state_ != ConnectionState::Backoff) {
        return false;
    }
    transition_(ConnectionState::Connecting, lock);
    return true;
}

bool ConnectionTracker::onConnected() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connecting) {
        return false;
    }
    backoff_.reset();
    transition_(ConnectionState::Connected, lock);
    return true;
}

std::optional<std::chrono::milliseconds> ConnectionTracker::onTransportLost() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connecting && state_ != ConnectionState::Connected) {
        return std::nullopt;
    }
    const auto delay = backoff_.nextDelay();
    LOG_INFO(csync::log::Category::Net,
             "Live stream lost, reconnect attempt=" << backoff_.attempt() << " wait_ms=" << delay.count());
    transition_(ConnectionState::Backoff, lock);
    return delay;
}

void ConnectionTracker::onClosed() {
    std::unique_lock<std::mutex> lock(mutex_);
    backoff_.reset();
    if (state_ == ConnectionState::Disconnected) {
        return;
    }
    transition_(ConnectionState::Disconnected, lock);
}

void ConnectionTracker::transition_(ConnectionState next, std::unique_lock<std::mutex>& lock) {
    const auto previous = state_;
    state_ = next;
    auto listener = listener_;
    lock.unlock();

    LOG_DEBUG(csync::log::Category::Net,
              "Live stream state " << domain::connectionStateLabel(previous) << " -> "
                                   << domain::connectionStateLabel(next));
    if (listener) {
        listener(next);
    }
}

}  // namespace core

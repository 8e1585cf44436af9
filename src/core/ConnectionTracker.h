#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>

#include "core/Backoff.h"
#include "domain/Types.h"

namespace core {

// ConnectionState machine for one live stream:
//   Disconnected|Backoff -> Connecting -> Connected
//   Connecting|Connected -> Backoff on transport loss (with a reconnect delay)
//   any -> Disconnected on explicit close
class ConnectionTracker {
public:
    using Listener = std::function<void(domain::ConnectionState)>;

    explicit ConnectionTracker(Backoff::Config backoff = {});

    void setListener(Listener listener);

    domain::ConnectionState state() const;
    std::size_t attempt() const;

    bool beginConnect();
    bool onConnected();
    std::optional<std::chrono::milliseconds> onTransportLost();
    void onClosed();

private:
    void transition_(domain::ConnectionState next, std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    domain::ConnectionState state_{domain::ConnectionState::Disconnected};
    Backoff backoff_;
    Listener listener_;
};

}  // namespace core

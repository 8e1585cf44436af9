#include <chrono>
#include <iostream>
#include <vector>

#include "core/Backoff.h"
#include "core/ConnectionTracker.h"

using namespace std::chrono_literals;

int main() {
    using core::Backoff;
    using domain::ConnectionState;

    {
        const auto d0 = Backoff::computeDelay(500ms, 15000ms, 0);
        const auto d1 = Backoff::computeDelay(500ms, 15000ms, 1);
        const auto d4 = Backoff::computeDelay(500ms, 15000ms, 4);
        const auto d5 = Backoff::computeDelay(500ms, 15000ms, 5);
        const auto dHuge = Backoff::computeDelay(500ms, 15000ms, 500);
        if (d0 != 500ms || d1 != 1000ms || d4 != 8000ms || d5 != 15000ms || dHuge != 15000ms) {
            std::cerr << "Unexpected delays " << d0.count() << "," << d1.count() << "," << d4.count() << ","
                      << d5.count() << "," << dHuge.count() << "\n";
            return 1;
        }
    }

    {
        Backoff backoff(Backoff::Config{500ms, 15000ms, 0.0});
        std::chrono::milliseconds previous{0};
        for (int i = 0; i < 64; ++i) {
            const auto delay = backoff.nextDelay();
            if (delay > 15000ms) {
                std::cerr << "Delay exceeded cap at attempt " << i << ": " << delay.count() << "\n";
                return 1;
            }
            if (delay < previous) {
                std::cerr << "Delay decreased without reset at attempt " << i << "\n";
                return 1;
            }
            previous = delay;
        }
        backoff.reset();
        if (backoff.nextDelay() != 500ms) {
            std::cerr << "Expected base delay after reset\n";
            return 1;
        }
    }

    {
        Backoff backoff(Backoff::Config{1000ms, 5000ms, 0.5});
        for (int i = 0; i < 20; ++i) {
            const auto floor = backoff.peekDelay();
            const auto delay = backoff.nextDelay();
            if (delay < floor || delay > 5000ms) {
                std::cerr << "Jittered delay " << delay.count() << " outside [" << floor.count() << ", 5000]\n";
                return 1;
            }
        }
    }

    {
        core::ConnectionTracker tracker(Backoff::Config{500ms, 15000ms, 0.0});
        std::vector<ConnectionState> seen;
        tracker.setListener([&](ConnectionState state) { seen.push_back(state); });

        if (tracker.onConnected() || tracker.onTransportLost().has_value()) {
            std::cerr << "Disconnected tracker accepted an illegal transition\n";
            return 1;
        }

        tracker.beginConnect();
        auto delay = tracker.onTransportLost();
        if (!delay || *delay != 500ms || tracker.state() != ConnectionState::Backoff) {
            std::cerr << "First failed connect should back off for the base delay\n";
            return 1;
        }
        tracker.beginConnect();
        delay = tracker.onTransportLost();
        if (!delay || *delay != 1000ms) {
            std::cerr << "Second failed connect should double the delay\n";
            return 1;
        }

        tracker.beginConnect();
        if (!tracker.onConnected() || tracker.attempt() != 0) {
            std::cerr << "Connected should reset the attempt counter\n";
            return 1;
        }
        delay = tracker.onTransportLost();
        if (!delay || *delay != 500ms) {
            std::cerr << "Delay after a successful connection should restart at base\n";
            return 1;
        }

        tracker.onClosed();
        if (tracker.state() != ConnectionState::Disconnected || tracker.beginConnect() == false) {
            std::cerr << "Closed tracker should be Disconnected and connectable again\n";
            return 1;
        }

        const std::vector<ConnectionState> expected{
            ConnectionState::Connecting, ConnectionState::Backoff,   ConnectionState::Connecting,
            ConnectionState::Backoff,    ConnectionState::Connecting, ConnectionState::Connected,
            ConnectionState::Backoff,    ConnectionState::Disconnected, ConnectionState::Connecting,
        };
        if (seen != expected) {
            std::cerr << "Unexpected transition sequence (" << seen.size() << " transitions)\n";
            return 1;
        }
    }

    std::cout << "test_backoff passed\n";
    return 0;
}

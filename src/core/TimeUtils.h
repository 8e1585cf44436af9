#pragma once

#include <chrono>

#include "domain/Ports.hpp"

namespace core {

class SystemClock final : public domain::IClock {
public:
    domain::TimestampMs nowMs() const override {
        const auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }
};

inline std::int64_t msToSeconds(domain::TimestampMs ms) {
    return static_cast<std::int64_t>(ms / 1000);
}

}  // namespace core

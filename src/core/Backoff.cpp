#include "core/Backoff.h"

#include <algorithm>

namespace core {
namespace {
constexpr std::size_t kMaxExponent = 30;
}

Backoff::Backoff() : Backoff(Config{}) {}

Backoff::Backoff(Config config) : config_(config), rng_(std::random_device{}()) {
    if (config_.base.count() <= 0) {
        config_.base = std::chrono::milliseconds{1};
    }
    if (config_.cap < config_.base) {
        config_.cap = config_.base;
    }
    config_.jitterRatio = std::clamp(config_.jitterRatio, 0.0, 1.0);
}

std::chrono::milliseconds Backoff::computeDelay(std::chrono::milliseconds base,
                                                std::chrono::milliseconds cap,
                                                std::size_t attempt) {
    const auto exponent = std::min(attempt, kMaxExponent);
    const std::int64_t multiplier = std::int64_t{1} << exponent;
    const std::int64_t limit = cap.count();
    if (base.count() > 0 && base.count() > limit / multiplier) {
        return cap;
    }
    return std::min(cap, std::chrono::milliseconds(base.count() * multiplier));
}

std::chrono::milliseconds Backoff::peekDelay() const {
    return computeDelay(config_.base, config_.cap, attempt_);
}

std::chrono::milliseconds Backoff::nextDelay() {
    auto delay = peekDelay();
    ++attempt_;
    if (config_.jitterRatio > 0.0 && delay.count() > 0) {
        const auto spread = static_cast<std::int64_t>(static_cast<double>(delay.count()) * config_.jitterRatio);
        if (spread > 0) {
            std::uniform_int_distribution<std::int64_t> jitterDist(0, spread);
            delay = std::min(config_.cap, delay + std::chrono::milliseconds(jitterDist(rng_)));
        }
    }
    return delay;
}

}  // namespace core

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>

namespace core {

// Capped exponential backoff: delay(attempt) = min(cap, base * 2^attempt).
class Backoff {
public:
    struct Config {
        std::chrono::milliseconds base{500};
        std::chrono::milliseconds cap{15000};
        // Fraction of the delay added as random jitter; the result never exceeds cap.
        double jitterRatio{0.0};
    };

    Backoff();
    explicit Backoff(Config config);

    std::chrono::milliseconds nextDelay();
    std::chrono::milliseconds peekDelay() const;
    void reset() noexcept { attempt_ = 0; }
    std::size_t attempt() const noexcept { return attempt_; }
    const Config& config() const noexcept { return config_; }

    static std::chrono::milliseconds computeDelay(std::chrono::milliseconds base,
                                                  std::chrono::milliseconds cap,
                                                  std::size_t attempt);

private:
    Config config_;
    std::size_t attempt_{0};
    std::mt19937 rng_;
};

}  // namespace core

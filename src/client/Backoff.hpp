#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace client {

// Capped exponential reconnect delay. Each delay is drawn from a window of
// width delay/2 that starts at the base delay and never ends past the cap.
class Backoff {
public:
    struct Options {
        std::chrono::milliseconds base{1000};
        std::chrono::milliseconds cap{30000};
        std::size_t maxAttempts = 0;  // 0 = unlimited
    };

    explicit Backoff(Options options, std::uint32_t seed = std::random_device{}());

    // Delay before the next attempt, or std::nullopt once maxAttempts is spent.
    std::optional<std::chrono::milliseconds> next();
    void reset() noexcept { attempts_ = 0; }

    std::size_t attempts() const noexcept { return attempts_; }
    const Options& options() const noexcept { return options_; }

    // Delay for the n-th attempt (1-based) before jitter.
    std::chrono::milliseconds baseDelay(std::size_t attempt) const;

private:
    Options options_;
    std::size_t attempts_ = 0;
    std::mt19937 rng_;
};

}  // namespace client

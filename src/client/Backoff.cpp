#include "client/Backoff.hpp"

#include <algorithm>

namespace client {

Backoff::Backoff(Options options, std::uint32_t seed) : options_(options), rng_(seed) {
    if (options_.base.count() <= 0) {
        options_.base = std::chrono::milliseconds(1);
    }
    options_.cap = std::max(options_.cap, options_.base);
}

std::chrono::milliseconds Backoff::baseDelay(std::size_t attempt) const {
    const auto exponent = std::min<std::size_t>(attempt > 0 ? attempt - 1 : 0, static_cast<std::size_t>(10));
    const std::uint64_t multiplier = 1ULL << exponent;
    auto delay = std::chrono::milliseconds(options_.base.count() * static_cast<std::int64_t>(multiplier));
    return std::min(delay, options_.cap);
}

std::optional<std::chrono::milliseconds> Backoff::next() {
    if (options_.maxAttempts != 0 && attempts_ >= options_.maxAttempts) {
        return std::nullopt;
    }
    ++attempts_;

    // The jitter window slides below the cap instead of being clipped by it.
    const auto delay = baseDelay(attempts_);
    const auto spread = delay.count() / 2;
    const auto upper = std::min<std::int64_t>(delay.count() + spread, options_.cap.count());
    std::uniform_int_distribution<std::int64_t> jitterDist(upper - spread, upper);
    return std::chrono::milliseconds(jitterDist(rng_));
}

}  // namespace client

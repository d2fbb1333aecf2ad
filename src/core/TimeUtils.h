#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kMillisPerMinute = kMillisPerSecond * kSecondsPerMinute;
constexpr std::int64_t kMillisPerHour = kMillisPerMinute * 60;
}  // namespace TimeUtils

// Wall clock in epoch milliseconds. Components that apply TTLs take one of these
// so tests can drive time explicitly.
using NowFn = std::function<std::int64_t()>;

inline std::int64_t systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline NowFn systemClock() { return &systemNowMs; }

inline std::int64_t hoursToMillis(std::int64_t h) { return h * TimeUtils::kMillisPerHour; }

}  // namespace core

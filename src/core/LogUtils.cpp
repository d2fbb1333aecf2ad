#include "core/LogUtils.h"

namespace core {

RateLogger::RateLogger(std::chrono::milliseconds interval) : interval_(interval) {}

bool RateLogger::allow(const std::string& key, std::size_t& suppressedOut) {
    const auto now = std::chrono::steady_clock::now();
    std::scoped_lock lk(mutex_);
    auto [it, inserted] = entries_.try_emplace(key);
    auto& entry = it->second;
    if (inserted || now >= entry.nextAllowed) {
        suppressedOut = entry.suppressed;
        entry.suppressed = 0;
        entry.nextAllowed = now + interval_;
        return true;
    }
    ++entry.suppressed;
    suppressedOut = 0;
    return false;
}

void RateLogger::reset(const std::string& key) {
    std::scoped_lock lk(mutex_);
    entries_.erase(key);
}

}  // namespace core

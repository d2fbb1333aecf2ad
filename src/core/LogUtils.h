#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace core {

// Per-key throttle for repetitive warnings. Suppressed calls are counted and
// reported back on the next allowed call so the log still shows the volume.
class RateLogger {
public:
    explicit RateLogger(std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    bool allow(const std::string& key, std::size_t& suppressedOut);
    void reset(const std::string& key);

private:
    struct Entry {
        std::chrono::steady_clock::time_point nextAllowed{};
        std::size_t suppressed = 0;
    };

    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace core

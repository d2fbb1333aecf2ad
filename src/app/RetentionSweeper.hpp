#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "core/ConnectionRegistry.hpp"
#include "core/EventStore.hpp"
#include "core/PresenceTracker.hpp"

namespace app {

// Periodic housekeeping: purges expired events, sweeps expired presence and
// drops connections that reported closed.
class RetentionSweeper {
public:
    RetentionSweeper(std::shared_ptr<core::EventStore> store,
                     std::shared_ptr<core::PresenceTracker> presence,
                     std::shared_ptr<core::ConnectionRegistry> registry,
                     std::chrono::milliseconds interval);
    ~RetentionSweeper();

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    void start();
    void stop();

    // One pass, synchronously.
    void runOnce();

private:
    void run_();

    std::shared_ptr<core::EventStore> store_;
    std::shared_ptr<core::PresenceTracker> presence_;
    std::shared_ptr<core::ConnectionRegistry> registry_;
    const std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace app

#include "app/RetentionSweeper.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace app {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::STORE;
}

RetentionSweeper::RetentionSweeper(std::shared_ptr<core::EventStore> store,
                                   std::shared_ptr<core::PresenceTracker> presence,
                                   std::shared_ptr<core::ConnectionRegistry> registry,
                                   std::chrono::milliseconds interval)
    : store_(std::move(store)),
      presence_(std::move(presence)),
      registry_(std::move(registry)),
      interval_(interval) {
    if (!store_ || !presence_ || !registry_) {
        throw std::invalid_argument("RetentionSweeper requires store, presence and registry");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("RetentionSweeper interval must be positive");
    }
}

RetentionSweeper::~RetentionSweeper() { stop(); }

void RetentionSweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    worker_ = std::thread(&RetentionSweeper::run_, this);
    LOG_INFO(kLogCategory, "RetentionSweeper started interval_ms=%lld", static_cast<long long>(interval_.count()));
}

void RetentionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        LOG_INFO(kLogCategory, "RetentionSweeper stopped");
    }
}

void RetentionSweeper::runOnce() {
    const auto purged = store_->purgeExpired();
    if (purged > 0) {
        tsync::common::metrics::Registry::instance().incrementCounter("events_purged_total", purged);
    }
    const auto expiredPresence = presence_->sweepExpired();
    const auto closed = registry_->sweepClosed();

    if (purged > 0 || expiredPresence > 0 || closed > 0) {
        LOG_INFO(kLogCategory,
                 "RetentionSweeper pass purged_events=%zu expired_presence=%zu closed_connections=%zu",
                 purged,
                 expiredPresence,
                 closed);
    }
}

void RetentionSweeper::run_() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            runOnce();
        } catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "RetentionSweeper pass failed: %s", ex.what());
        }
        lock.lock();
    }
}

}  // namespace app

#include "adapters/api/ws/SessionSendQueue.hpp"

#include <utility>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace adapters::api::ws {
namespace {
constexpr std::chrono::seconds kLogInterval{1};
}

SessionSendQueue::SessionSendQueue(std::string label, const Config& config, Callbacks callbacks)
    : label_(std::move(label)), config_(config), callbacks_(std::move(callbacks)) {}

bool SessionSendQueue::enqueue(const std::shared_ptr<const std::string>& payload, Clock::time_point now) {
    if (!payload) {
        return false;
    }

    std::shared_ptr<const std::string> toWrite;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        queue_.push_back(PendingMessage{payload, payload->size()});
        queuedBytes_ += payload->size();

        updateStallTimerLocked_(now);
        logQueueLocked_("enqueue", now);

        if (!writeInProgress_) {
            writeInProgress_ = true;
            toWrite = queue_.front().payload;
        }
    }

    if (toWrite && callbacks_.startWrite) {
        callbacks_.startWrite(toWrite);
    }
    return true;
}

void SessionSendQueue::onWriteComplete(Clock::time_point now) {
    std::shared_ptr<const std::string> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.empty()) {
            writeInProgress_ = false;
            return;
        }

        const auto finished = queue_.front().bytes;
        queue_.pop_front();
        queuedBytes_ = queuedBytes_ >= finished ? queuedBytes_ - finished : 0;

        writeInProgress_ = !queue_.empty();
        if (writeInProgress_) {
            next = queue_.front().payload;
        }

        updateStallTimerLocked_(now);
        logQueueLocked_("drain", now);
    }

    if (next && callbacks_.startWrite) {
        callbacks_.startWrite(next);
    }
}

bool SessionSendQueue::checkStall(Clock::time_point now) {
    std::function<void()> closeCb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !stallArmed_ || now < stallDeadline_) {
            return false;
        }
        if (!aboveThresholdLocked_()) {
            stallArmed_ = false;
            return false;
        }

        stallArmed_ = false;
        logQueueLocked_("stall_timeout", Clock::time_point{});
        LOG_WARN(::logging::LogCategory::NET,
                 "ws_send_queue closing session=%s for backpressure queued_msgs=%zu queued_bytes=%zu",
                 label_.c_str(),
                 queue_.size(),
                 queuedBytes_);
        closed_ = true;
        clearQueueLocked_();
        closeCb = callbacks_.closeForBackpressure;
    }

    tsync::common::metrics::Registry::instance().incrementCounter("ws_backpressure_closes_total");
    if (closeCb) {
        closeCb();
    }
    return true;
}

void SessionSendQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    stallArmed_ = false;
    clearQueueLocked_();
}

bool SessionSendQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t SessionSendQueue::queuedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t SessionSendQueue::queuedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queuedBytes_;
}

bool SessionSendQueue::aboveThresholdLocked_() const {
    if (config_.maxMessages > 0 && queue_.size() > config_.maxMessages) {
        return true;
    }
    if (config_.maxBytes > 0 && queuedBytes_ > config_.maxBytes) {
        return true;
    }
    return false;
}

void SessionSendQueue::updateStallTimerLocked_(Clock::time_point now) {
    if (aboveThresholdLocked_()) {
        if (!stallArmed_) {
            stallArmed_ = true;
            stallDeadline_ = now + config_.stallTimeout;
        }
    } else {
        stallArmed_ = false;
    }
}

void SessionSendQueue::logQueueLocked_(const char* reason, Clock::time_point now) {
    if (now != Clock::time_point{} && now - lastLogTime_ < kLogInterval && queue_.size() == lastLoggedMessages_ &&
        queuedBytes_ == lastLoggedBytes_) {
        return;
    }

    lastLogTime_ = now;
    lastLoggedMessages_ = queue_.size();
    lastLoggedBytes_ = queuedBytes_;

    LOG_DEBUG(::logging::LogCategory::NET,
              "ws_send_queue session=%s reason=%s queued_msgs=%zu queued_bytes=%zu write_in_progress=%d",
              label_.c_str(),
              reason,
              lastLoggedMessages_,
              lastLoggedBytes_,
              writeInProgress_ ? 1 : 0);
}

void SessionSendQueue::clearQueueLocked_() {
    queue_.clear();
    queuedBytes_ = 0;
    writeInProgress_ = false;
}

}  // namespace adapters::api::ws

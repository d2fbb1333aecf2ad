#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace adapters::api::ws {

// Outbound frame queue of one WebSocket session. Only one write is in flight at
// a time; the owner reports completion through onWriteComplete(). When the
// queue stays above its thresholds for longer than stallTimeout, the next
// checkStall() closes the queue and asks the owner to drop the peer.
class SessionSendQueue {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        std::size_t maxMessages = 500;
        std::size_t maxBytes = 15 * 1024 * 1024;  // 15 MB
        std::chrono::milliseconds stallTimeout{20000};
    };

    struct Callbacks {
        std::function<void(const std::shared_ptr<const std::string>&)> startWrite;
        std::function<void()> closeForBackpressure;
    };

    SessionSendQueue(std::string label, const Config& config, Callbacks callbacks);

    SessionSendQueue(const SessionSendQueue&) = delete;
    SessionSendQueue& operator=(const SessionSendQueue&) = delete;

    // False once the queue is closed; the payload is not retained then.
    bool enqueue(const std::shared_ptr<const std::string>& payload, Clock::time_point now = Clock::now());
    void onWriteComplete(Clock::time_point now = Clock::now());

    // Returns true when this call closed the queue for backpressure.
    bool checkStall(Clock::time_point now = Clock::now());

    void close();
    bool closed() const;

    std::size_t queuedMessages() const;
    std::size_t queuedBytes() const;

private:
    struct PendingMessage {
        std::shared_ptr<const std::string> payload;
        std::size_t bytes = 0;
    };

    bool aboveThresholdLocked_() const;
    void updateStallTimerLocked_(Clock::time_point now);
    void logQueueLocked_(const char* reason, Clock::time_point now);
    void clearQueueLocked_();

    const std::string label_;
    const Config config_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    std::deque<PendingMessage> queue_;
    std::size_t queuedBytes_ = 0;
    bool writeInProgress_ = false;
    bool closed_ = false;

    bool stallArmed_ = false;
    Clock::time_point stallDeadline_{};

    Clock::time_point lastLogTime_{};
    std::size_t lastLoggedMessages_ = 0;
    std::size_t lastLoggedBytes_ = 0;
};

}  // namespace adapters::api::ws

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "domain/Presence.hpp"

namespace client {

// Announces what record the local user has open. attach() sends `viewing`,
// tick() sends a heartbeat every period, detach() sends `left`. Thread-safe.
class PresenceBeacon {
public:
    using Clock = std::chrono::steady_clock;
    using SendFn = std::function<bool(const std::string&)>;

    static constexpr std::chrono::milliseconds kDefaultHeartbeat{30000};

    PresenceBeacon(SendFn send, std::string userName, std::chrono::milliseconds heartbeat = kDefaultHeartbeat);

    PresenceBeacon(const PresenceBeacon&) = delete;
    PresenceBeacon& operator=(const PresenceBeacon&) = delete;

    // Switching records sends `left` for the previous one first.
    void attach(const std::string& entityType, const std::string& entityId, Clock::time_point now = Clock::now());
    void setAction(domain::PresenceAction action, Clock::time_point now = Clock::now());
    void detach();

    void tick(Clock::time_point now = Clock::now());

    // Re-sends the current state, e.g. after the server dropped it on reconnect.
    void announce(Clock::time_point now = Clock::now());

    bool attached() const;

private:
    struct Target {
        std::string entityType;
        std::string entityId;
        domain::PresenceAction action = domain::PresenceAction::Viewing;
    };

    void sendLocked_(domain::PresenceSignal signal, Clock::time_point now);

    SendFn send_;
    const std::string userName_;
    const std::chrono::milliseconds heartbeat_;

    mutable std::mutex mutex_;
    std::optional<Target> target_;
    Clock::time_point lastSentAt_{};
};

}  // namespace client

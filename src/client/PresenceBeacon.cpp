#include "client/PresenceBeacon.hpp"

#include <utility>

#include "core/WireProtocol.hpp"
#include "logging/Log.h"

namespace client {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::PRESENCE;

domain::PresenceSignal signalFor(domain::PresenceAction action) {
    switch (action) {
    case domain::PresenceAction::Viewing:
        return domain::PresenceSignal::Viewing;
    case domain::PresenceAction::Editing:
        return domain::PresenceSignal::Editing;
    case domain::PresenceAction::Idle:
        return domain::PresenceSignal::Idle;
    }
    return domain::PresenceSignal::Viewing;
}

}  // namespace

PresenceBeacon::PresenceBeacon(SendFn send, std::string userName, std::chrono::milliseconds heartbeat)
    : send_(std::move(send)), userName_(std::move(userName)), heartbeat_(heartbeat) {}

void PresenceBeacon::attach(const std::string& entityType, const std::string& entityId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (target_ && target_->entityType == entityType && target_->entityId == entityId) {
        return;
    }
    if (target_) {
        sendLocked_(domain::PresenceSignal::Left, now);
    }
    target_ = Target{entityType, entityId, domain::PresenceAction::Viewing};
    sendLocked_(domain::PresenceSignal::Viewing, now);
}

void PresenceBeacon::setAction(domain::PresenceAction action, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_ || target_->action == action) {
        return;
    }
    target_->action = action;
    sendLocked_(signalFor(action), now);
}

void PresenceBeacon::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_) {
        return;
    }
    sendLocked_(domain::PresenceSignal::Left, Clock::now());
    target_.reset();
}

void PresenceBeacon::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_ || now - lastSentAt_ < heartbeat_) {
        return;
    }
    sendLocked_(domain::PresenceSignal::Heartbeat, now);
}

void PresenceBeacon::announce(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_) {
        return;
    }
    sendLocked_(signalFor(target_->action), now);
}

bool PresenceBeacon::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_.has_value();
}

void PresenceBeacon::sendLocked_(domain::PresenceSignal signal, Clock::time_point now) {
    lastSentAt_ = now;
    if (!send_) {
        return;
    }
    const auto text = core::wire::encodePresence(target_->entityType, target_->entityId, signal, userName_);
    if (!send_(text)) {
        LOG_DEBUG(kLogCategory,
                  "Presence %s for %s/%s not sent (offline)",
                  domain::presenceSignalToString(signal),
                  target_->entityType.c_str(),
                  target_->entityId.c_str());
    }
}

}  // namespace client

#include "client/SyncStateMachine.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "logging/Log.h"

namespace client {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::CLIENT;

}  // namespace

const char* syncStateToString(SyncState state) noexcept {
    switch (state) {
    case SyncState::Disconnected:
        return "disconnected";
    case SyncState::Connecting:
        return "connecting";
    case SyncState::Syncing:
        return "syncing";
    case SyncState::Live:
        return "live";
    case SyncState::GaveUp:
        return "gave_up";
    }
    return "disconnected";
}

SyncStateMachine::SyncStateMachine(Options options, Callbacks callbacks, domain::SequenceNumber initialCursor)
    : options_(options),
      callbacks_(std::move(callbacks)),
      cursor_(std::max<domain::SequenceNumber>(initialCursor, 0)),
      dedup_(options.dedupCapacity),
      backoff_(options.backoff, options.seed) {}

void SyncStateMachine::on(domain::EventType type, EventHandler handler) {
    handlers_[type] = std::move(handler);
}

void SyncStateMachine::setSubscriptions(std::vector<domain::EventType> eventTypes) {
    subscriptions_ = std::move(eventTypes);
    if (state_ == SyncState::Syncing || state_ == SyncState::Live) {
        send_(core::wire::encodeSubscribe(subscriptions_));
    }
}

void SyncStateMachine::onConnecting() {
    if (state_ == SyncState::GaveUp) {
        return;
    }
    transition_(SyncState::Connecting);
}

void SyncStateMachine::onTransportOpen(Clock::time_point now) {
    if (state_ == SyncState::GaveUp) {
        return;
    }
    lastInboundAt_ = now;
    buffered_.clear();
    if (!subscriptions_.empty()) {
        send_(core::wire::encodeSubscribe(subscriptions_));
    }
    transition_(SyncState::Syncing);
    requestSync_();
}

std::optional<std::chrono::milliseconds> SyncStateMachine::onTransportClosed() {
    if (state_ == SyncState::GaveUp) {
        return std::nullopt;
    }
    buffered_.clear();
    transition_(SyncState::Disconnected);

    const auto delay = backoff_.next();
    if (!delay) {
        LOG_WARN(kLogCategory,
                 "Giving up after %zu reconnect attempts cursor=%lld",
                 backoff_.attempts(),
                 static_cast<long long>(cursor_));
        transition_(SyncState::GaveUp);
        if (callbacks_.onGaveUp) {
            callbacks_.onGaveUp();
        }
        return std::nullopt;
    }

    LOG_INFO(kLogCategory,
             "Reconnect scheduled attempt=%zu wait_ms=%lld",
             backoff_.attempts(),
             static_cast<long long>(delay->count()));
    return delay;
}

bool SyncStateMachine::isStale(Clock::time_point now) const {
    if (state_ != SyncState::Syncing && state_ != SyncState::Live) {
        return false;
    }
    return now - lastInboundAt_ > options_.staleTimeout;
}

void SyncStateMachine::onText(std::string_view text, Clock::time_point now) {
    lastInboundAt_ = now;

    core::wire::ServerMessage message;
    try {
        message = core::wire::decodeServerMessage(text);
    } catch (const core::wire::ProtocolError& ex) {
        LOG_WARN(kLogCategory, "Dropping malformed server message: %s", ex.what());
        return;
    }

    std::visit([this](const auto& decoded) { handle_(decoded); }, message);
}

void SyncStateMachine::handle_(const core::wire::EventPush& push) {
    switch (state_) {
    case SyncState::Syncing:
        if (buffered_.size() >= options_.maxBufferedEvents) {
            // Dropped pushes are recovered by the gap check once live.
            buffered_.erase(buffered_.begin());
        }
        buffered_.push_back(push.event);
        return;
    case SyncState::Live:
        applyLive_(push.event);
        return;
    case SyncState::Disconnected:
    case SyncState::Connecting:
    case SyncState::GaveUp:
        LOG_DEBUG(kLogCategory,
                  "Ignoring push seq=%lld in state=%s",
                  static_cast<long long>(push.event.sequenceNumber),
                  syncStateToString(state_));
        return;
    }
}

void SyncStateMachine::handle_(const core::wire::SyncResponse& response) {
    if (state_ != SyncState::Syncing) {
        LOG_DEBUG(kLogCategory, "Unexpected sync_response in state=%s", syncStateToString(state_));
        return;
    }
    const auto& batch = response.batch;
    backoff_.reset();

    const auto requestedFrom = cursor_;
    for (const auto& event : batch.events) {
        apply_(event);
    }

    if (batch.gap) {
        LOG_INFO(kLogCategory,
                 "Cursor outside retention cursor=%lld latest=%lld; full refresh",
                 static_cast<long long>(cursor_),
                 static_cast<long long>(batch.latestSequence));
        if (callbacks_.onFullRefresh) {
            callbacks_.onFullRefresh(batch.latestSequence);
        }
        cursor_ = batch.latestSequence;
    }
    else {
        // Covers events the server withheld from this connection.
        cursor_ = std::max(cursor_, batch.nextCursor);
    }

    if (batch.hasMore) {
        if (cursor_ > requestedFrom) {
            requestSync_();
            return;
        }
        LOG_WARN(kLogCategory,
                 "sync_response with hasMore did not advance cursor=%lld; going live",
                 static_cast<long long>(cursor_));
    }

    enterLive_();
}

void SyncStateMachine::handle_(const core::wire::Ping&) {
    send_(core::wire::encodePong(cursor_));
}

void SyncStateMachine::handle_(const core::wire::PresenceChange& change) {
    if (callbacks_.onPresence) {
        callbacks_.onPresence(change);
    }
}

void SyncStateMachine::handle_(const core::wire::InitialPresence& snapshot) {
    if (callbacks_.onInitialPresence) {
        callbacks_.onInitialPresence(snapshot);
    }
}

void SyncStateMachine::handle_(const core::wire::ErrorReply& error) {
    LOG_WARN(kLogCategory, "Server reported error: %s", error.message.c_str());
}

void SyncStateMachine::requestSync_() {
    LOG_DEBUG(kLogCategory, "Requesting sync since=%lld", static_cast<long long>(cursor_));
    send_(core::wire::encodeSync(cursor_));
}

void SyncStateMachine::enterLive_() {
    auto pending = std::move(buffered_);
    buffered_.clear();
    std::stable_sort(pending.begin(), pending.end(), [](const domain::Event& lhs, const domain::Event& rhs) {
        return lhs.sequenceNumber < rhs.sequenceNumber;
    });

    transition_(SyncState::Live);
    LOG_INFO(kLogCategory,
             "Live cursor=%lld buffered=%zu",
             static_cast<long long>(cursor_),
             pending.size());

    for (std::size_t i = 0; i < pending.size(); ++i) {
        applyLive_(pending[i]);
        if (state_ != SyncState::Live) {
            // A hole sent us back to syncing; keep the rest for the next drain.
            buffered_.insert(buffered_.end(),
                             std::make_move_iterator(pending.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                             std::make_move_iterator(pending.end()));
            return;
        }
    }
}

void SyncStateMachine::applyLive_(const domain::Event& event) {
    if (event.sequenceNumber > cursor_ + 1) {
        LOG_INFO(kLogCategory,
                 "Sequence hole cursor=%lld received=%lld; resyncing",
                 static_cast<long long>(cursor_),
                 static_cast<long long>(event.sequenceNumber));
        buffered_.push_back(event);
        transition_(SyncState::Syncing);
        requestSync_();
        return;
    }
    apply_(event);
}

bool SyncStateMachine::apply_(const domain::Event& event) {
    if (dedup_.isDuplicate(event.id)) {
        LOG_TRACE(kLogCategory, "Duplicate event id=%s", event.id.c_str());
        cursor_ = std::max(cursor_, event.sequenceNumber);
        return false;
    }

    if (const auto it = handlers_.find(event.eventType); it != handlers_.end() && it->second) {
        dispatch_(it->second, event);
    }
    if (callbacks_.onEvent) {
        dispatch_(callbacks_.onEvent, event);
    }

    cursor_ = std::max(cursor_, event.sequenceNumber);
    return true;
}

void SyncStateMachine::dispatch_(const EventHandler& handler, const domain::Event& event) {
    try {
        handler(event);
    } catch (const std::exception& ex) {
        LOG_WARN(kLogCategory,
                 "Event handler failed type=%s seq=%lld: %s",
                 domain::eventTypeToString(event.eventType),
                 static_cast<long long>(event.sequenceNumber),
                 ex.what());
    }
}

void SyncStateMachine::transition_(SyncState next) {
    if (next == state_) {
        return;
    }
    const auto previous = state_;
    state_ = next;
    LOG_DEBUG(kLogCategory, "State %s -> %s", syncStateToString(previous), syncStateToString(next));
    if (callbacks_.onStateChange) {
        callbacks_.onStateChange(previous, next);
    }
}

void SyncStateMachine::send_(const std::string& text) {
    if (callbacks_.send) {
        callbacks_.send(text);
    }
}

}  // namespace client

#include "app/SyncProtocolHandler.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>
#include <variant>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::SYNC;
constexpr logging::LogCategory kPresenceCategory = logging::LogCategory::PRESENCE;

std::shared_ptr<const std::string> frame(std::string text) {
    return std::make_shared<const std::string>(std::move(text));
}

// Mirrors live delivery: a user's lifecycle events reach only that user and
// skip the subscription filter; everything else must match the subscriptions.
void filterForReader(std::vector<domain::Event>& events,
                     const std::optional<domain::UserId>& userId,
                     const std::set<domain::EventType>& subscriptions) {
    events.erase(std::remove_if(events.begin(),
                                events.end(),
                                [&](const domain::Event& event) {
                                    if (domain::isSessionLifecycle(event.eventType) && event.userId) {
                                        return !userId || *userId != *event.userId;
                                    }
                                    return !subscriptions.empty() && subscriptions.count(event.eventType) == 0;
                                }),
                 events.end());
}

}  // namespace

SyncProtocolHandler::SyncProtocolHandler(std::shared_ptr<core::EventStore> store,
                                         std::shared_ptr<core::ConnectionRegistry> registry,
                                         std::shared_ptr<core::PresenceTracker> presence,
                                         Options options)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      presence_(std::move(presence)),
      options_(options) {
    if (!store_ || !registry_ || !presence_) {
        throw std::invalid_argument("SyncProtocolHandler requires store, registry and presence");
    }
    if (options_.syncBatchLimit == 0) {
        options_.syncBatchLimit = store_->defaultLimit();
    }
}

bool SyncProtocolHandler::onOpen(const std::shared_ptr<core::IConnection>& connection, const std::string& userName) {
    if (!registry_->registerConnection(connection)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(peersMutex_);
    peers_[connection->connectionId()] = PeerState{userName, 0};
    return true;
}

bool SyncProtocolHandler::onMessage(const std::shared_ptr<core::IConnection>& connection, std::string_view text) {
    std::string userName;
    {
        std::lock_guard<std::mutex> lock(peersMutex_);
        auto it = peers_.find(connection->connectionId());
        if (it == peers_.end()) {
            LOG_WARN(kLogCategory, "message from unknown connection=%s", connection->connectionId().c_str());
            return false;
        }
        userName = it->second.userName;
    }

    try {
        const auto message = core::wire::decodeClientMessage(text);
        std::visit([&](const auto& request) { handle_(connection, userName, request); }, message);
    } catch (const core::wire::ProtocolError& ex) {
        std::size_t errors = 0;
        {
            std::lock_guard<std::mutex> lock(peersMutex_);
            auto it = peers_.find(connection->connectionId());
            if (it != peers_.end()) {
                errors = ++it->second.consecutiveErrors;
            }
        }

        std::size_t suppressed = 0;
        if (protocolErrorLog_.allow(connection->connectionId(), suppressed)) {
            LOG_WARN(kLogCategory,
                     "protocol error connection=%s tenant=%s consecutive=%zu suppressed=%zu: %s",
                     connection->connectionId().c_str(),
                     connection->tenantId().c_str(),
                     errors,
                     suppressed,
                     ex.what());
        }
        tsync::common::metrics::Registry::instance().incrementCounter("protocol_errors_total");
        connection->send(frame(core::wire::encodeError(ex.what())));

        if (options_.maxProtocolErrors > 0 && errors >= options_.maxProtocolErrors) {
            LOG_WARN(kLogCategory,
                     "closing connection=%s after %zu consecutive protocol errors",
                     connection->connectionId().c_str(),
                     errors);
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "failed to handle message connection=%s tenant=%s: %s",
                  connection->connectionId().c_str(),
                  connection->tenantId().c_str(),
                  ex.what());
        connection->send(frame(core::wire::encodeError("internal_error")));
        return true;
    }

    std::lock_guard<std::mutex> lock(peersMutex_);
    if (auto it = peers_.find(connection->connectionId()); it != peers_.end()) {
        it->second.consecutiveErrors = 0;
    }
    return true;
}

std::size_t SyncProtocolHandler::disconnectAll() {
    return registry_->disconnectAll();
}

std::size_t SyncProtocolHandler::openSessions() const {
    std::lock_guard<std::mutex> lock(peersMutex_);
    return peers_.size();
}

void SyncProtocolHandler::onClose(const core::IConnection& connection) {
    {
        std::lock_guard<std::mutex> lock(peersMutex_);
        if (peers_.erase(connection.connectionId()) == 0) {
            return;
        }
    }
    protocolErrorLog_.reset(connection.connectionId());
    registry_->unregisterConnection(connection.tenantId(), connection.connectionId());

    if (const auto& userId = connection.userId()) {
        const auto removed = presence_->removePresence(connection.tenantId(), *userId);
        if (removed > 0) {
            LOG_DEBUG(kPresenceCategory,
                      "cleared presence on disconnect tenant=%s user=%s records=%zu",
                      connection.tenantId().c_str(),
                      userId->c_str(),
                      removed);
        }
    }
}

void SyncProtocolHandler::handle_(const std::shared_ptr<core::IConnection>& connection,
                                  const std::string&,
                                  const core::wire::SubscribeRequest& request) {
    if (request.unknownTypes > 0) {
        LOG_DEBUG(kLogCategory,
                  "subscribe ignored unknown types connection=%s count=%zu",
                  connection->connectionId().c_str(),
                  request.unknownTypes);
    }
    registry_->setSubscriptions(connection->tenantId(), connection->connectionId(), request.eventTypes);
}

void SyncProtocolHandler::handle_(const std::shared_ptr<core::IConnection>& connection,
                                  const std::string&,
                                  const core::wire::SyncRequest& request) {
    const auto& tenantId = connection->tenantId();
    auto& metrics = tsync::common::metrics::Registry::instance();
    metrics.incrementCounter(tsync::common::metrics::tenantKey("sync_requests_total", tenantId));
    if (request.lastEventId > 0) {
        metrics.incrementCounter(tsync::common::metrics::tenantKey("reconnections_total", tenantId));
    }

    auto batch = store_->getEventsSince(tenantId, request.lastEventId, options_.syncBatchLimit);
    const auto scanned = batch.events.size();
    const auto subscriptions = registry_->subscriptionsOf(tenantId, connection->connectionId());
    filterForReader(batch.events, connection->userId(), subscriptions.value_or(std::set<domain::EventType>{}));

    LOG_DEBUG(kLogCategory,
              "sync connection=%s tenant=%s since=%lld events=%zu withheld=%zu has_more=%d gap=%d latest=%lld next=%lld",
              connection->connectionId().c_str(),
              tenantId.c_str(),
              static_cast<long long>(request.lastEventId),
              batch.events.size(),
              scanned - batch.events.size(),
              batch.hasMore ? 1 : 0,
              batch.gap ? 1 : 0,
              static_cast<long long>(batch.latestSequence),
              static_cast<long long>(batch.nextCursor));

    connection->send(frame(core::wire::encodeSyncResponse(batch)));
}

void SyncProtocolHandler::handle_(const std::shared_ptr<core::IConnection>& connection,
                                  const std::string& userName,
                                  const core::wire::PresenceRequest& request) {
    const auto& userId = connection->userId();
    if (!userId) {
        throw core::wire::ProtocolError("presence requires a user identity");
    }
    const auto& tenantId = connection->tenantId();
    const std::string displayName = !request.userName.empty() ? request.userName : (!userName.empty() ? userName : *userId);

    domain::PresenceState announced;
    if (request.signal == domain::PresenceSignal::Left) {
        presence_->removePresence(tenantId, *userId, request.entityType, request.entityId);
        announced.userId = *userId;
        announced.userName = displayName;
        announced.timestamp = core::systemNowMs();
    } else {
        auto state = presence_->trackPresence(tenantId, *userId, displayName, request.entityType, request.entityId, request.signal);
        if (!state) {
            return;
        }
        announced = *state;
    }

    LOG_DEBUG(kPresenceCategory,
              "presence tenant=%s user=%s entity=%s/%s action=%s",
              tenantId.c_str(),
              userId->c_str(),
              request.entityType.c_str(),
              request.entityId.c_str(),
              domain::presenceSignalToString(request.signal));

    registry_->broadcastToTenant(
        tenantId, frame(core::wire::encodePresenceChange(request.entityType, request.entityId, request.signal, announced)));

    if (request.signal == domain::PresenceSignal::Viewing) {
        const auto users = presence_->getPresence(tenantId, request.entityType, request.entityId);
        connection->send(frame(core::wire::encodeInitialPresence(request.entityType, request.entityId, users)));
    }
}

void SyncProtocolHandler::handle_(const std::shared_ptr<core::IConnection>& connection,
                                  const std::string&,
                                  const core::wire::PongReply& reply) {
    LOG_TRACE(kLogCategory,
              "pong connection=%s last_event_id=%lld",
              connection->connectionId().c_str(),
              static_cast<long long>(reply.lastEventId.value_or(-1)));
}

}  // namespace app

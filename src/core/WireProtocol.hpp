#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "core/EventStore.hpp"
#include "domain/Event.hpp"
#include "domain/Presence.hpp"

// JSON text frames exchanged between the sync server and its clients.
namespace core::wire {

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Client -> server

struct SubscribeRequest {
    std::vector<domain::EventType> eventTypes;
    std::size_t unknownTypes = 0;
};

struct SyncRequest {
    domain::SequenceNumber lastEventId = 0;
};

struct PresenceRequest {
    std::string entityType;
    std::string entityId;
    domain::PresenceSignal signal{domain::PresenceSignal::Viewing};
    std::string userName;
};

struct PongReply {
    std::optional<domain::SequenceNumber> lastEventId;
};

using ClientMessage = std::variant<SubscribeRequest, SyncRequest, PresenceRequest, PongReply>;

// Server -> client

struct EventPush {
    domain::Event event;
};

struct SyncResponse {
    CatchUpBatch batch;
};

struct Ping {};

struct PresenceChange {
    std::string entityType;
    std::string entityId;
    domain::PresenceSignal signal{domain::PresenceSignal::Viewing};
    domain::PresenceState state;
};

struct InitialPresence {
    std::string entityType;
    std::string entityId;
    std::vector<domain::PresenceState> users;
};

struct ErrorReply {
    std::string message;
};

using ServerMessage = std::variant<EventPush, SyncResponse, Ping, PresenceChange, InitialPresence, ErrorReply>;

boost::json::object eventToJson(const domain::Event& event);
domain::Event eventFromJson(const boost::json::value& value);

std::string encodeEvent(const domain::Event& event);
std::string encodeSyncResponse(const CatchUpBatch& batch);
std::string encodePing();
std::string encodePresenceChange(const std::string& entityType,
                                 const std::string& entityId,
                                 domain::PresenceSignal signal,
                                 const domain::PresenceState& state);
std::string encodeInitialPresence(const std::string& entityType,
                                  const std::string& entityId,
                                  const std::vector<domain::PresenceState>& users);
std::string encodeError(const std::string& message);

std::string encodeSubscribe(const std::vector<domain::EventType>& eventTypes);
std::string encodeSync(domain::SequenceNumber lastEventId);
std::string encodePresence(const std::string& entityType,
                           const std::string& entityId,
                           domain::PresenceSignal signal,
                           const std::string& userName);
std::string encodePong(domain::SequenceNumber lastEventId);

// Both throw ProtocolError on malformed input.
ClientMessage decodeClientMessage(std::string_view text);
ServerMessage decodeServerMessage(std::string_view text);

}  // namespace core::wire

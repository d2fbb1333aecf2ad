#include "core/WireProtocol.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

#include <boost/json.hpp>

namespace core::wire {
namespace {

constexpr std::string_view kPresencePrefix = "presence_";

ProtocolError make_error(const std::string& message) { return ProtocolError("wire: " + message); }

boost::json::object parseObject_(std::string_view text) {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw make_error("invalid JSON: " + ec.message());
    }
    if (!json.is_object()) {
        throw make_error("message is not a JSON object");
    }
    return std::move(json.as_object());
}

std::string toStdString(const boost::json::string& value) { return std::string(value.data(), value.size()); }

std::int64_t parse_json_int_(const boost::json::value& value, const char* field) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str = toStdString(value.as_string());
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                throw make_error(std::string("trailing characters in integer field ") + field);
            }
            return static_cast<std::int64_t>(parsed);
        } catch (const ProtocolError&) {
            throw;
        } catch (const std::exception& ex) {
            throw make_error(std::string("failed to parse integer field ") + field + ": " + ex.what());
        }
    }
    throw make_error(std::string("unsupported JSON type for integer field ") + field);
}

std::string requireString_(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || !value->is_string()) {
        throw make_error(std::string("missing string field ") + field);
    }
    return toStdString(value->as_string());
}

std::optional<std::string> optionalString_(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw make_error(std::string("field is not a string: ") + field);
    }
    return toStdString(value->as_string());
}

std::int64_t requireInt_(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr) {
        throw make_error(std::string("missing integer field ") + field);
    }
    return parse_json_int_(*value, field);
}

bool optionalBool_(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || value->is_null()) {
        return false;
    }
    if (!value->is_bool()) {
        throw make_error(std::string("field is not a boolean: ") + field);
    }
    return value->as_bool();
}

boost::json::object presenceToJson_(const domain::PresenceState& state) {
    boost::json::object row;
    row["userId"] = state.userId;
    row["userName"] = state.userName;
    row["action"] = domain::presenceActionToString(state.action);
    row["timestamp"] = state.timestamp;
    return row;
}

domain::PresenceAction presenceActionFrom_(domain::PresenceSignal signal) {
    switch (signal) {
    case domain::PresenceSignal::Editing:
        return domain::PresenceAction::Editing;
    case domain::PresenceSignal::Idle:
        return domain::PresenceAction::Idle;
    case domain::PresenceSignal::Viewing:
    case domain::PresenceSignal::Heartbeat:
    case domain::PresenceSignal::Left:
        break;
    }
    return domain::PresenceAction::Viewing;
}

domain::PresenceState presenceFromJson_(const boost::json::object& obj) {
    domain::PresenceState state;
    state.userId = requireString_(obj, "userId");
    state.userName = optionalString_(obj, "userName").value_or(std::string{});
    if (auto action = optionalString_(obj, "action")) {
        const auto signal = domain::presenceSignalFromString(*action);
        if (!signal) {
            throw make_error("unknown presence action: " + *action);
        }
        state.action = presenceActionFrom_(*signal);
    }
    if (obj.if_contains("timestamp") != nullptr) {
        state.timestamp = requireInt_(obj, "timestamp");
    }
    return state;
}

const boost::json::object& requirePayloadObject_(const boost::json::object& obj) {
    const auto* payload = obj.if_contains("payload");
    if (payload == nullptr || !payload->is_object()) {
        throw make_error("missing payload object");
    }
    return payload->as_object();
}

}  // namespace

boost::json::object eventToJson(const domain::Event& event) {
    boost::json::object obj;
    obj["id"] = event.id;
    obj["sequenceNumber"] = event.sequenceNumber;
    obj["tenantId"] = event.tenantId;
    obj["eventType"] = domain::eventTypeToString(event.eventType);
    obj["payload"] = event.payload;
    if (event.userId) {
        obj["userId"] = *event.userId;
    }
    obj["timestamp"] = event.timestamp;
    return obj;
}

domain::Event eventFromJson(const boost::json::value& value) {
    if (!value.is_object()) {
        throw make_error("event is not a JSON object");
    }
    const auto& obj = value.as_object();

    domain::Event event;
    event.id = requireString_(obj, "id");
    event.sequenceNumber = requireInt_(obj, "sequenceNumber");
    event.tenantId = requireString_(obj, "tenantId");
    const auto typeText = requireString_(obj, "eventType");
    const auto type = domain::eventTypeFromString(typeText);
    if (!type) {
        throw make_error("unknown eventType: " + typeText);
    }
    event.eventType = *type;
    if (const auto* payload = obj.if_contains("payload"); payload != nullptr) {
        event.payload = *payload;
    }
    event.userId = optionalString_(obj, "userId");
    if (obj.if_contains("timestamp") != nullptr) {
        event.timestamp = requireInt_(obj, "timestamp");
    }
    return event;
}

std::string encodeEvent(const domain::Event& event) { return boost::json::serialize(eventToJson(event)); }

std::string encodeSyncResponse(const CatchUpBatch& batch) {
    boost::json::array events;
    events.reserve(batch.events.size());
    for (const auto& event : batch.events) {
        events.emplace_back(eventToJson(event));
    }

    boost::json::object obj;
    obj["type"] = "sync_response";
    obj["events"] = std::move(events);
    obj["hasMore"] = batch.hasMore;
    obj["gap"] = batch.gap;
    obj["latestSequence"] = batch.latestSequence;
    obj["nextCursor"] = batch.nextCursor;
    return boost::json::serialize(obj);
}

std::string encodePing() { return R"({"type":"ping"})"; }

std::string encodePresenceChange(const std::string& entityType,
                                 const std::string& entityId,
                                 domain::PresenceSignal signal,
                                 const domain::PresenceState& state) {
    boost::json::object payload;
    payload["entityType"] = entityType;
    payload["entityId"] = entityId;
    payload["userId"] = state.userId;
    payload["userName"] = state.userName;
    payload["action"] = domain::presenceSignalToString(signal);
    payload["timestamp"] = state.timestamp;

    boost::json::object obj;
    obj["type"] = std::string(kPresencePrefix) + domain::presenceSignalToString(signal);
    obj["payload"] = std::move(payload);
    return boost::json::serialize(obj);
}

std::string encodeInitialPresence(const std::string& entityType,
                                  const std::string& entityId,
                                  const std::vector<domain::PresenceState>& users) {
    boost::json::array rows;
    rows.reserve(users.size());
    for (const auto& state : users) {
        rows.emplace_back(presenceToJson_(state));
    }

    boost::json::object payload;
    payload["entityType"] = entityType;
    payload["entityId"] = entityId;
    payload["users"] = std::move(rows);

    boost::json::object obj;
    obj["type"] = "initial_presence";
    obj["payload"] = std::move(payload);
    return boost::json::serialize(obj);
}

std::string encodeError(const std::string& message) {
    boost::json::object obj;
    obj["type"] = "error";
    obj["message"] = message;
    return boost::json::serialize(obj);
}

std::string encodeSubscribe(const std::vector<domain::EventType>& eventTypes) {
    boost::json::array events;
    for (const auto type : eventTypes) {
        events.emplace_back(domain::eventTypeToString(type));
    }
    boost::json::object obj;
    obj["action"] = "subscribe";
    obj["events"] = std::move(events);
    return boost::json::serialize(obj);
}

std::string encodeSync(domain::SequenceNumber lastEventId) {
    boost::json::object obj;
    obj["action"] = "sync";
    obj["lastEventId"] = lastEventId;
    return boost::json::serialize(obj);
}

std::string encodePresence(const std::string& entityType,
                           const std::string& entityId,
                           domain::PresenceSignal signal,
                           const std::string& userName) {
    boost::json::object obj;
    obj["action"] = "presence";
    obj["entityType"] = entityType;
    obj["entityId"] = entityId;
    obj["presenceAction"] = domain::presenceSignalToString(signal);
    obj["userName"] = userName;
    return boost::json::serialize(obj);
}

std::string encodePong(domain::SequenceNumber lastEventId) {
    boost::json::object obj;
    obj["type"] = "pong";
    obj["lastEventId"] = lastEventId;
    return boost::json::serialize(obj);
}

ClientMessage decodeClientMessage(std::string_view text) {
    const auto obj = parseObject_(text);

    const auto* action = obj.if_contains("action");
    if (action == nullptr) {
        const auto* type = obj.if_contains("type");
        if (type != nullptr && type->is_string() && type->as_string() == "pong") {
            PongReply pong;
            if (const auto* last = obj.if_contains("lastEventId"); last != nullptr && !last->is_null()) {
                pong.lastEventId = parse_json_int_(*last, "lastEventId");
            }
            return pong;
        }
        throw make_error("message has neither action nor a known type");
    }
    if (!action->is_string()) {
        throw make_error("action is not a string");
    }
    const auto& verb = action->as_string();

    if (verb == "subscribe") {
        SubscribeRequest request;
        const auto* events = obj.if_contains("events");
        if (events == nullptr || events->is_null()) {
            return request;
        }
        if (!events->is_array()) {
            throw make_error("subscribe events is not an array");
        }
        for (const auto& entry : events->as_array()) {
            if (!entry.is_string()) {
                ++request.unknownTypes;
                continue;
            }
            const auto& name = entry.as_string();
            if (auto type = domain::eventTypeFromString(std::string_view(name.data(), name.size()))) {
                request.eventTypes.push_back(*type);
            } else {
                ++request.unknownTypes;
            }
        }
        return request;
    }

    if (verb == "sync") {
        SyncRequest request;
        if (const auto* last = obj.if_contains("lastEventId"); last != nullptr && !last->is_null()) {
            request.lastEventId = parse_json_int_(*last, "lastEventId");
        }
        if (request.lastEventId < 0) {
            throw make_error("lastEventId must not be negative");
        }
        return request;
    }

    if (verb == "presence") {
        PresenceRequest request;
        request.entityType = requireString_(obj, "entityType");
        request.entityId = requireString_(obj, "entityId");
        if (request.entityType.empty() || request.entityId.empty()) {
            throw make_error("presence requires entityType and entityId");
        }
        const auto signalText = requireString_(obj, "presenceAction");
        const auto signal = domain::presenceSignalFromString(signalText);
        if (!signal) {
            throw make_error("unknown presenceAction: " + signalText);
        }
        request.signal = *signal;
        request.userName = optionalString_(obj, "userName").value_or(std::string{});
        return request;
    }

    throw make_error("unknown action: " + toStdString(verb));
}

ServerMessage decodeServerMessage(std::string_view text) {
    const auto obj = parseObject_(text);

    const auto* typeValue = obj.if_contains("type");
    if (typeValue == nullptr) {
        return EventPush{eventFromJson(obj)};
    }
    if (!typeValue->is_string()) {
        throw make_error("type is not a string");
    }
    const std::string type = toStdString(typeValue->as_string());

    if (type == "ping") {
        return Ping{};
    }

    if (type == "sync_response") {
        SyncResponse response;
        const auto* events = obj.if_contains("events");
        if (events != nullptr && !events->is_null()) {
            if (!events->is_array()) {
                throw make_error("sync_response events is not an array");
            }
            for (const auto& entry : events->as_array()) {
                response.batch.events.push_back(eventFromJson(entry));
            }
        }
        response.batch.hasMore = optionalBool_(obj, "hasMore");
        response.batch.gap = optionalBool_(obj, "gap");
        if (obj.if_contains("latestSequence") != nullptr) {
            response.batch.latestSequence = requireInt_(obj, "latestSequence");
        }
        if (obj.if_contains("nextCursor") != nullptr) {
            response.batch.nextCursor = requireInt_(obj, "nextCursor");
        }
        else if (response.batch.hasMore) {
            response.batch.nextCursor =
                response.batch.events.empty() ? 0 : response.batch.events.back().sequenceNumber;
        }
        else {
            response.batch.nextCursor = response.batch.latestSequence;
        }
        return response;
    }

    if (type == "initial_presence") {
        const auto& payload = requirePayloadObject_(obj);
        InitialPresence snapshot;
        snapshot.entityType = requireString_(payload, "entityType");
        snapshot.entityId = requireString_(payload, "entityId");
        if (const auto* users = payload.if_contains("users"); users != nullptr && users->is_array()) {
            for (const auto& entry : users->as_array()) {
                if (!entry.is_object()) {
                    throw make_error("presence user is not an object");
                }
                snapshot.users.push_back(presenceFromJson_(entry.as_object()));
            }
        }
        return snapshot;
    }

    if (type.compare(0, kPresencePrefix.size(), kPresencePrefix) == 0) {
        const auto signal = domain::presenceSignalFromString(std::string_view(type).substr(kPresencePrefix.size()));
        if (!signal) {
            throw make_error("unknown presence message: " + type);
        }
        const auto& payload = requirePayloadObject_(obj);
        PresenceChange change;
        change.entityType = requireString_(payload, "entityType");
        change.entityId = requireString_(payload, "entityId");
        change.signal = *signal;
        change.state = presenceFromJson_(payload);
        return change;
    }

    if (type == "error") {
        return ErrorReply{optionalString_(obj, "message").value_or(std::string{})};
    }

    throw make_error("unknown message type: " + type);
}

}  // namespace core::wire

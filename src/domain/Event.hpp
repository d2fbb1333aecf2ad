#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json/value.hpp>

namespace domain {

using TenantId = std::string;
using UserId = std::string;
using SequenceNumber = std::int64_t;
using TimestampMs = std::int64_t;

enum class EventType {
    LeadCreated,
    LeadUpdated,
    LeadDeleted,
    CaseCreated,
    CaseUpdated,
    CaseDeleted,
    DocumentCreated,
    DocumentUpdated,
    DocumentDeleted,
    SessionInvalidated,
    PermissionsChanged,
    AccountLocked,
    SessionExpiring,
};

inline constexpr std::array<EventType, 13> kAllEventTypes{
    EventType::LeadCreated,        EventType::LeadUpdated,        EventType::LeadDeleted,
    EventType::CaseCreated,        EventType::CaseUpdated,        EventType::CaseDeleted,
    EventType::DocumentCreated,    EventType::DocumentUpdated,    EventType::DocumentDeleted,
    EventType::SessionInvalidated, EventType::PermissionsChanged, EventType::AccountLocked,
    EventType::SessionExpiring,
};

const char* eventTypeToString(EventType type) noexcept;
std::optional<EventType> eventTypeFromString(std::string_view text) noexcept;

// Session-lifecycle events concern one user and are never fanned out to the tenant.
bool isSessionLifecycle(EventType type) noexcept;

struct Event {
    std::string id;
    SequenceNumber sequenceNumber{0};
    TenantId tenantId;
    EventType eventType{EventType::LeadCreated};
    boost::json::value payload;
    std::optional<UserId> userId;
    TimestampMs timestamp{0};
    TimestampMs expiresAt{0};

    bool expiredAt(TimestampMs nowMs) const noexcept { return expiresAt <= nowMs; }
};

}  // namespace domain

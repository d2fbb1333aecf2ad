#include "domain/Event.hpp"

namespace domain {

const char* eventTypeToString(EventType type) noexcept {
    switch (type) {
    case EventType::LeadCreated:
        return "lead_created";
    case EventType::LeadUpdated:
        return "lead_updated";
    case EventType::LeadDeleted:
        return "lead_deleted";
    case EventType::CaseCreated:
        return "case_created";
    case EventType::CaseUpdated:
        return "case_updated";
    case EventType::CaseDeleted:
        return "case_deleted";
    case EventType::DocumentCreated:
        return "document_created";
    case EventType::DocumentUpdated:
        return "document_updated";
    case EventType::DocumentDeleted:
        return "document_deleted";
    case EventType::SessionInvalidated:
        return "session_invalidated";
    case EventType::PermissionsChanged:
        return "permissions_changed";
    case EventType::AccountLocked:
        return "account_locked";
    case EventType::SessionExpiring:
        return "session_expiring";
    }
    return "unknown";
}

std::optional<EventType> eventTypeFromString(std::string_view text) noexcept {
    for (const auto type : kAllEventTypes) {
        if (text == eventTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

bool isSessionLifecycle(EventType type) noexcept {
    switch (type) {
    case EventType::SessionInvalidated:
    case EventType::PermissionsChanged:
    case EventType::AccountLocked:
    case EventType::SessionExpiring:
        return true;
    default:
        return false;
    }
}

}  // namespace domain

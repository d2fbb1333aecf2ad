#include "client/InvalidationTable.hpp"

#include <boost/json.hpp>

namespace client {
namespace {

// First of the given fields that holds a string or integer id.
std::string recordId(const boost::json::value& payload, const char* primary, const char* fallback) {
    const auto* object = payload.if_object();
    if (object == nullptr) {
        return {};
    }
    for (const char* field : {primary, fallback}) {
        const auto* value = object->if_contains(field);
        if (value == nullptr) {
            continue;
        }
        if (value->is_string()) {
            const auto& str = value->get_string();
            if (!str.empty()) {
                return std::string(str.data(), str.size());
            }
        } else if (value->is_int64()) {
            return std::to_string(value->get_int64());
        } else if (value->is_uint64()) {
            return std::to_string(value->get_uint64());
        }
    }
    return {};
}

}  // namespace

const char* InvalidationTable::scopeFor(domain::EventType type) noexcept {
    switch (type) {
    case domain::EventType::LeadCreated:
    case domain::EventType::LeadUpdated:
    case domain::EventType::LeadDeleted:
        return "leads";
    case domain::EventType::CaseCreated:
    case domain::EventType::CaseUpdated:
    case domain::EventType::CaseDeleted:
        return "cases";
    case domain::EventType::DocumentCreated:
    case domain::EventType::DocumentUpdated:
    case domain::EventType::DocumentDeleted:
        return "documents";
    case domain::EventType::SessionInvalidated:
    case domain::EventType::PermissionsChanged:
    case domain::EventType::AccountLocked:
    case domain::EventType::SessionExpiring:
        return "session";
    }
    return "session";
}

std::vector<std::string> InvalidationTable::keysFor(const domain::Event& event) {
    std::vector<std::string> keys{scopeFor(event.eventType)};

    std::string id;
    const char* prefix = nullptr;
    switch (event.eventType) {
    case domain::EventType::LeadCreated:
    case domain::EventType::LeadUpdated:
    case domain::EventType::LeadDeleted:
        prefix = "lead/";
        id = recordId(event.payload, "id", "leadId");
        break;
    case domain::EventType::CaseCreated:
    case domain::EventType::CaseUpdated:
    case domain::EventType::CaseDeleted:
        prefix = "case/";
        id = recordId(event.payload, "caseId", "id");
        break;
    case domain::EventType::DocumentCreated:
    case domain::EventType::DocumentUpdated:
    case domain::EventType::DocumentDeleted:
        prefix = "document/";
        id = recordId(event.payload, "documentId", "id");
        break;
    case domain::EventType::SessionInvalidated:
    case domain::EventType::PermissionsChanged:
    case domain::EventType::AccountLocked:
    case domain::EventType::SessionExpiring:
        break;
    }

    if (prefix != nullptr && !id.empty()) {
        keys.push_back(prefix + id);
    }
    return keys;
}

}  // namespace client

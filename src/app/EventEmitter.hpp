#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include "core/EventStore.hpp"
#include "core/SequenceService.hpp"
#include "core/TimeUtils.h"
#include "domain/Event.hpp"
#include "domain/Ports.hpp"

namespace app {

// Entry point for mutation handlers. Every emit allocates a sequence number,
// stores the event and fans it out. Nothing here throws into the caller: the
// result is empty only when no sequence number could be allocated.
class EventEmitter {
public:
    struct Options {
        std::chrono::milliseconds retention{std::chrono::hours(24)};
    };

    EventEmitter(std::shared_ptr<core::SequenceService> sequences,
                 std::shared_ptr<core::EventStore> store,
                 std::shared_ptr<domain::contracts::IEventFanout> fanout,
                 Options options,
                 core::NowFn now = core::systemClock());

    std::optional<domain::Event> emit(const domain::TenantId& tenantId,
                                      domain::EventType type,
                                      boost::json::value payload,
                                      std::optional<domain::UserId> userId = std::nullopt);

    std::optional<domain::Event> emitLeadCreated(const domain::TenantId& tenantId, boost::json::value lead);
    std::optional<domain::Event> emitLeadUpdated(const domain::TenantId& tenantId, boost::json::value lead);
    std::optional<domain::Event> emitLeadDeleted(const domain::TenantId& tenantId, const std::string& leadId);

    std::optional<domain::Event> emitCaseCreated(const domain::TenantId& tenantId, boost::json::value caseData);
    std::optional<domain::Event> emitCaseUpdated(const domain::TenantId& tenantId, boost::json::value caseData);
    std::optional<domain::Event> emitCaseDeleted(const domain::TenantId& tenantId, const std::string& caseId);

    std::optional<domain::Event> emitDocumentCreated(const domain::TenantId& tenantId, boost::json::value document);
    std::optional<domain::Event> emitDocumentUpdated(const domain::TenantId& tenantId, boost::json::value document);
    std::optional<domain::Event> emitDocumentDeleted(const domain::TenantId& tenantId, const std::string& documentId);

    std::optional<domain::Event> emitSessionInvalidated(const domain::TenantId& tenantId,
                                                        const domain::UserId& userId,
                                                        boost::json::value payload);
    std::optional<domain::Event> emitPermissionsChanged(const domain::TenantId& tenantId,
                                                        const domain::UserId& userId,
                                                        boost::json::value payload);
    std::optional<domain::Event> emitAccountLocked(const domain::TenantId& tenantId,
                                                   const domain::UserId& userId,
                                                   boost::json::value payload);
    std::optional<domain::Event> emitSessionExpiring(const domain::TenantId& tenantId,
                                                     const domain::UserId& userId,
                                                     boost::json::value payload);

private:
    void publish_(const domain::Event& event);

    std::shared_ptr<core::SequenceService> sequences_;
    std::shared_ptr<core::EventStore> store_;
    std::shared_ptr<domain::contracts::IEventFanout> fanout_;
    Options options_;
    core::NowFn now_;
};

}  // namespace app

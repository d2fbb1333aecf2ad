#include "app/EventEmitter.hpp"

#include <stdexcept>
#include <utility>

#include <boost/json/object.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "common/Metrics.hpp"
#include "core/WireProtocol.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::SYNC;

std::string newEventId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

boost::json::value idPayload(const char* key, const std::string& id) {
    boost::json::object obj;
    obj[key] = id;
    return obj;
}

}  // namespace

EventEmitter::EventEmitter(std::shared_ptr<core::SequenceService> sequences,
                           std::shared_ptr<core::EventStore> store,
                           std::shared_ptr<domain::contracts::IEventFanout> fanout,
                           Options options,
                           core::NowFn now)
    : sequences_(std::move(sequences)),
      store_(std::move(store)),
      fanout_(std::move(fanout)),
      options_(options),
      now_(now ? std::move(now) : core::systemClock()) {
    if (!sequences_ || !store_ || !fanout_) {
        throw std::invalid_argument("EventEmitter requires sequences, store and fanout");
    }
}

std::optional<domain::Event> EventEmitter::emit(const domain::TenantId& tenantId,
                                                domain::EventType type,
                                                boost::json::value payload,
                                                std::optional<domain::UserId> userId) {
    auto& metrics = tsync::common::metrics::Registry::instance();
    tsync::common::metrics::Registry::ScopedTimer timer("emit");

    domain::Event event;
    try {
        const auto sequence = sequences_->next(tenantId);
        if (!sequence) {
            LOG_ERROR(kLogCategory,
                      "emit failed: no sequence number tenant=%s type=%s",
                      tenantId.c_str(),
                      domain::eventTypeToString(type));
            metrics.incrementCounter("emit_failures_total");
            return std::nullopt;
        }

        event.id = newEventId();
        event.sequenceNumber = *sequence;
        event.tenantId = tenantId;
        event.eventType = type;
        event.payload = std::move(payload);
        event.userId = std::move(userId);
        event.timestamp = now_();
        event.expiresAt = event.timestamp + static_cast<domain::TimestampMs>(options_.retention.count());
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "emit failed tenant=%s type=%s: %s",
                  tenantId.c_str(),
                  domain::eventTypeToString(type),
                  ex.what());
        metrics.incrementCounter("emit_failures_total");
        return std::nullopt;
    }

    try {
        if (!store_->store(event)) {
            LOG_WARN(kLogCategory,
                     "emit stored in neither tier tenant=%s seq=%lld",
                     tenantId.c_str(),
                     static_cast<long long>(event.sequenceNumber));
            metrics.incrementCounter("emit_failures_total");
        }
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "emit store error tenant=%s seq=%lld: %s",
                  tenantId.c_str(),
                  static_cast<long long>(event.sequenceNumber),
                  ex.what());
        metrics.incrementCounter("emit_failures_total");
    }

    publish_(event);

    metrics.incrementCounter(tsync::common::metrics::tenantKey("events_emitted_total", tenantId));
    LOG_DEBUG(kLogCategory,
              "emitted tenant=%s seq=%lld type=%s id=%s",
              tenantId.c_str(),
              static_cast<long long>(event.sequenceNumber),
              domain::eventTypeToString(event.eventType),
              event.id.c_str());
    return event;
}

void EventEmitter::publish_(const domain::Event& event) {
    try {
        auto message = std::make_shared<const std::string>(core::wire::encodeEvent(event));
        std::size_t delivered = 0;
        if (domain::isSessionLifecycle(event.eventType) && event.userId) {
            delivered = fanout_->broadcastToUser(event.tenantId, *event.userId, message);
        } else {
            delivered = fanout_->broadcastToTenant(event.tenantId, message, event.eventType);
        }
        LOG_TRACE(kLogCategory,
                  "fanout tenant=%s seq=%lld delivered=%zu",
                  event.tenantId.c_str(),
                  static_cast<long long>(event.sequenceNumber),
                  delivered);
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "emit fanout error tenant=%s seq=%lld: %s",
                  event.tenantId.c_str(),
                  static_cast<long long>(event.sequenceNumber),
                  ex.what());
        tsync::common::metrics::Registry::instance().incrementCounter("emit_failures_total");
    }
}

std::optional<domain::Event> EventEmitter::emitLeadCreated(const domain::TenantId& tenantId, boost::json::value lead) {
    return emit(tenantId, domain::EventType::LeadCreated, std::move(lead));
}

std::optional<domain::Event> EventEmitter::emitLeadUpdated(const domain::TenantId& tenantId, boost::json::value lead) {
    return emit(tenantId, domain::EventType::LeadUpdated, std::move(lead));
}

std::optional<domain::Event> EventEmitter::emitLeadDeleted(const domain::TenantId& tenantId, const std::string& leadId) {
    return emit(tenantId, domain::EventType::LeadDeleted, idPayload("leadId", leadId));
}

std::optional<domain::Event> EventEmitter::emitCaseCreated(const domain::TenantId& tenantId,
                                                           boost::json::value caseData) {
    return emit(tenantId, domain::EventType::CaseCreated, std::move(caseData));
}

std::optional<domain::Event> EventEmitter::emitCaseUpdated(const domain::TenantId& tenantId,
                                                           boost::json::value caseData) {
    return emit(tenantId, domain::EventType::CaseUpdated, std::move(caseData));
}

std::optional<domain::Event> EventEmitter::emitCaseDeleted(const domain::TenantId& tenantId, const std::string& caseId) {
    return emit(tenantId, domain::EventType::CaseDeleted, idPayload("caseId", caseId));
}

std::optional<domain::Event> EventEmitter::emitDocumentCreated(const domain::TenantId& tenantId,
                                                               boost::json::value document) {
    return emit(tenantId, domain::EventType::DocumentCreated, std::move(document));
}

std::optional<domain::Event> EventEmitter::emitDocumentUpdated(const domain::TenantId& tenantId,
                                                               boost::json::value document) {
    return emit(tenantId, domain::EventType::DocumentUpdated, std::move(document));
}

std::optional<domain::Event> EventEmitter::emitDocumentDeleted(const domain::TenantId& tenantId,
                                                               const std::string& documentId) {
    return emit(tenantId, domain::EventType::DocumentDeleted, idPayload("documentId", documentId));
}

std::optional<domain::Event> EventEmitter::emitSessionInvalidated(const domain::TenantId& tenantId,
                                                                  const domain::UserId& userId,
                                                                  boost::json::value payload) {
    return emit(tenantId, domain::EventType::SessionInvalidated, std::move(payload), userId);
}

std::optional<domain::Event> EventEmitter::emitPermissionsChanged(const domain::TenantId& tenantId,
                                                                  const domain::UserId& userId,
                                                                  boost::json::value payload) {
    return emit(tenantId, domain::EventType::PermissionsChanged, std::move(payload), userId);
}

std::optional<domain::Event> EventEmitter::emitAccountLocked(const domain::TenantId& tenantId,
                                                             const domain::UserId& userId,
                                                             boost::json::value payload) {
    return emit(tenantId, domain::EventType::AccountLocked, std::move(payload), userId);
}

std::optional<domain::Event> EventEmitter::emitSessionExpiring(const domain::TenantId& tenantId,
                                                               const domain::UserId& userId,
                                                               boost::json::value payload) {
    return emit(tenantId, domain::EventType::SessionExpiring, std::move(payload), userId);
}

}  // namespace app

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/Event.hpp"

namespace domain::contracts {

// Durable, queryable event log (cold tier of the event store).
class IEventLog {
public:
    virtual ~IEventLog() = default;

    virtual bool append(const Event& event) = 0;

    // Unexpired events with sequenceNumber > since, ascending, at most `limit`.
    // std::nullopt signals a read failure, not an empty range.
    virtual std::optional<std::vector<Event>> readSince(const TenantId& tenantId,
                                                        SequenceNumber since,
                                                        std::size_t limit,
                                                        TimestampMs nowMs) const = 0;

    virtual std::optional<SequenceNumber> oldestRetained(const TenantId& tenantId, TimestampMs nowMs) const = 0;

    // Highest sequence ever appended for the tenant; purges never lower it.
    virtual std::optional<SequenceNumber> highWatermark(const TenantId& tenantId) const = 0;

    virtual std::size_t purgeExpired(TimestampMs nowMs) = 0;
};

// Backing counter for sequence allocation. Implementations must be atomic for
// every caller that shares the same instance (or the same backing store).
class ISequenceCounter {
public:
    virtual ~ISequenceCounter() = default;

    virtual std::optional<SequenceNumber> next(const TenantId& tenantId) = 0;
};

// Delivery of serialized frames to connected clients.
class IEventFanout {
public:
    virtual ~IEventFanout() = default;

    virtual std::size_t broadcastToTenant(const TenantId& tenantId,
                                          const std::shared_ptr<const std::string>& message,
                                          std::optional<EventType> eventType = std::nullopt) = 0;

    virtual std::size_t broadcastToUser(const TenantId& tenantId,
                                        const UserId& userId,
                                        const std::shared_ptr<const std::string>& message) = 0;
};

}  // namespace domain::contracts

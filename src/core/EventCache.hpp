#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "domain/Event.hpp"

namespace core {

// Hot tier of the event store: a bounded, sequence-ordered ring per tenant.
// Entries carry their own expiry and are dropped lazily on read or by purge.
class EventCache {
public:
    explicit EventCache(std::size_t capacityPerTenant = 1000);

    void push(const domain::Event& event);

    // Events with sequenceNumber > since, ascending, at most `limit`, or
    // std::nullopt when the cache cannot prove it holds the whole range.
    std::optional<std::vector<domain::Event>> readSince(const domain::TenantId& tenantId,
                                                        domain::SequenceNumber since,
                                                        std::size_t limit,
                                                        domain::TimestampMs nowMs);

    std::optional<domain::SequenceNumber> latestSequence(const domain::TenantId& tenantId) const;

    std::size_t purgeExpired(domain::TimestampMs nowMs);

    std::size_t size(const domain::TenantId& tenantId) const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    using Ring = std::deque<domain::Event>;

    static std::size_t dropExpiredLocked_(Ring& ring, domain::TimestampMs nowMs);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<domain::TenantId, Ring> rings_;
};

}  // namespace core

#include "core/EventCache.hpp"

#include <algorithm>

namespace core {

EventCache::EventCache(std::size_t capacityPerTenant) : capacity_(std::max<std::size_t>(capacityPerTenant, 1)) {}

void EventCache::push(const domain::Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ring = rings_[event.tenantId];

    // Concurrent emitters may store slightly out of allocation order.
    if (ring.empty() || ring.back().sequenceNumber < event.sequenceNumber) {
        ring.push_back(event);
    }
    else {
        auto pos = std::lower_bound(ring.begin(), ring.end(), event.sequenceNumber,
                                    [](const domain::Event& lhs, domain::SequenceNumber seq) {
                                        return lhs.sequenceNumber < seq;
                                    });
        if (pos != ring.end() && pos->sequenceNumber == event.sequenceNumber) {
            return;
        }
        ring.insert(pos, event);
    }

    while (ring.size() > capacity_) {
        ring.pop_front();
    }
}

std::size_t EventCache::dropExpiredLocked_(Ring& ring, domain::TimestampMs nowMs) {
    const auto before = ring.size();
    ring.erase(std::remove_if(ring.begin(), ring.end(),
                              [nowMs](const domain::Event& event) { return event.expiredAt(nowMs); }),
               ring.end());
    return before - ring.size();
}

std::optional<std::vector<domain::Event>> EventCache::readSince(const domain::TenantId& tenantId,
                                                                domain::SequenceNumber since,
                                                                std::size_t limit,
                                                                domain::TimestampMs nowMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rings_.find(tenantId);
    if (it == rings_.end()) {
        return std::nullopt;
    }
    auto& ring = it->second;
    dropExpiredLocked_(ring, nowMs);
    if (ring.empty() || ring.front().sequenceNumber > since + 1) {
        return std::nullopt;
    }

    auto first = std::upper_bound(ring.begin(), ring.end(), since,
                                  [](domain::SequenceNumber seq, const domain::Event& rhs) {
                                      return seq < rhs.sequenceNumber;
                                  });

    std::vector<domain::Event> events;
    auto expected = since + 1;
    for (auto cursor = first; cursor != ring.end() && events.size() < limit; ++cursor) {
        if (cursor->sequenceNumber != expected) {
            // A hole means a store is still in flight; let the durable log answer.
            return std::nullopt;
        }
        events.push_back(*cursor);
        ++expected;
    }
    return events;
}

std::optional<domain::SequenceNumber> EventCache::latestSequence(const domain::TenantId& tenantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rings_.find(tenantId);
    if (it == rings_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back().sequenceNumber;
}

std::size_t EventCache::purgeExpired(domain::TimestampMs nowMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = rings_.begin(); it != rings_.end();) {
        removed += dropExpiredLocked_(it->second, nowMs);
        if (it->second.empty()) {
            it = rings_.erase(it);
        }
        else {
            ++it;
        }
    }
    return removed;
}

std::size_t EventCache::size(const domain::TenantId& tenantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rings_.find(tenantId);
    return it == rings_.end() ? 0 : it->second.size();
}

}  // namespace core

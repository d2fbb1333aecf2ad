#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "core/TimeUtils.h"
#include "domain/Presence.hpp"

namespace core {

// TTL key-value store of who is on which record. Keys are (tenant, entityType,
// entityId) and each key holds one record per user. Expired records are hidden
// from reads immediately and physically removed by sweepExpired().
class PresenceTracker {
public:
    static constexpr std::chrono::milliseconds kDefaultTtl{5 * 60 * 1000};

    explicit PresenceTracker(std::chrono::milliseconds ttl = kDefaultTtl, NowFn now = systemClock());

    // Returns the stored record, or std::nullopt when the signal removed it.
    std::optional<domain::PresenceState> trackPresence(const domain::TenantId& tenantId,
                                                       const domain::UserId& userId,
                                                       const std::string& userName,
                                                       const std::string& entityType,
                                                       const std::string& entityId,
                                                       domain::PresenceSignal signal);

    std::vector<domain::PresenceState> getPresence(const domain::TenantId& tenantId,
                                                   const std::string& entityType,
                                                   const std::string& entityId) const;

    // Without an entity, removes every record the user holds in the tenant.
    std::size_t removePresence(const domain::TenantId& tenantId,
                               const domain::UserId& userId,
                               const std::optional<std::string>& entityType = std::nullopt,
                               const std::optional<std::string>& entityId = std::nullopt);

    std::size_t sweepExpired();

    std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    using EntityKey = std::tuple<domain::TenantId, std::string, std::string>;
    using UserRecords = std::map<domain::UserId, domain::PresenceState>;

    bool expired_(const domain::PresenceState& state, domain::TimestampMs nowMs) const noexcept;

    const std::chrono::milliseconds ttl_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<EntityKey, UserRecords> entries_;
};

}  // namespace core

#include "core/PresenceTracker.hpp"

#include <utility>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::PRESENCE;

domain::PresenceAction actionForSignal(domain::PresenceSignal signal, domain::PresenceAction previous) {
    switch (signal) {
    case domain::PresenceSignal::Viewing:
        return domain::PresenceAction::Viewing;
    case domain::PresenceSignal::Editing:
        return domain::PresenceAction::Editing;
    case domain::PresenceSignal::Idle:
        return domain::PresenceAction::Idle;
    case domain::PresenceSignal::Heartbeat:
    case domain::PresenceSignal::Left:
        return previous;
    }
    return previous;
}

}  // namespace

PresenceTracker::PresenceTracker(std::chrono::milliseconds ttl, NowFn now)
    : ttl_(ttl.count() > 0 ? ttl : kDefaultTtl), now_(now ? std::move(now) : systemClock()) {}

bool PresenceTracker::expired_(const domain::PresenceState& state, domain::TimestampMs nowMs) const noexcept {
    return nowMs - state.timestamp > ttl_.count();
}

std::optional<domain::PresenceState> PresenceTracker::trackPresence(const domain::TenantId& tenantId,
                                                                    const domain::UserId& userId,
                                                                    const std::string& userName,
                                                                    const std::string& entityType,
                                                                    const std::string& entityId,
                                                                    domain::PresenceSignal signal) {
    LOG_GUARD_RET(!tenantId.empty() && !userId.empty() && !entityType.empty() && !entityId.empty(),
                  kLogCategory,
                  std::nullopt,
                  "PresenceTracker ignoring incomplete update tenant=%s user=%s entity=%s/%s",
                  tenantId.c_str(),
                  userId.c_str(),
                  entityType.c_str(),
                  entityId.c_str());

    if (signal == domain::PresenceSignal::Left) {
        removePresence(tenantId, userId, entityType, entityId);
        return std::nullopt;
    }

    const auto nowMs = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& users = entries_[EntityKey{tenantId, entityType, entityId}];
    auto [it, inserted] = users.try_emplace(userId);
    auto& state = it->second;
    const bool fresh = inserted || expired_(state, nowMs);
    const auto previous = fresh ? domain::PresenceAction::Viewing : state.action;

    state.userId = userId;
    if (!userName.empty() || fresh) {
        state.userName = userName;
    }
    state.action = actionForSignal(signal, previous);
    state.timestamp = nowMs;

    LOG_TRACE(kLogCategory,
              "PresenceTracker tenant=%s entity=%s/%s user=%s action=%s",
              tenantId.c_str(),
              entityType.c_str(),
              entityId.c_str(),
              userId.c_str(),
              domain::presenceActionToString(state.action));
    return state;
}

std::vector<domain::PresenceState> PresenceTracker::getPresence(const domain::TenantId& tenantId,
                                                                const std::string& entityType,
                                                                const std::string& entityId) const {
    const auto nowMs = now_();
    std::vector<domain::PresenceState> result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(EntityKey{tenantId, entityType, entityId});
    if (it == entries_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& [user, state] : it->second) {
        if (!expired_(state, nowMs)) {
            result.push_back(state);
        }
    }
    return result;
}

std::size_t PresenceTracker::removePresence(const domain::TenantId& tenantId,
                                            const domain::UserId& userId,
                                            const std::optional<std::string>& entityType,
                                            const std::optional<std::string>& entityId) {
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);

    if (entityType && entityId) {
        auto it = entries_.find(EntityKey{tenantId, *entityType, *entityId});
        if (it != entries_.end()) {
            removed = it->second.erase(userId);
            if (it->second.empty()) {
                entries_.erase(it);
            }
        }
        return removed;
    }

    // Keys are ordered by tenant first, so the tenant's records are contiguous.
    for (auto it = entries_.lower_bound(EntityKey{tenantId, std::string{}, std::string{}});
         it != entries_.end() && std::get<0>(it->first) == tenantId;) {
        if (entityType && std::get<1>(it->first) != *entityType) {
            ++it;
            continue;
        }
        removed += it->second.erase(userId);
        if (it->second.empty()) {
            it = entries_.erase(it);
        }
        else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG(kLogCategory,
                  "PresenceTracker removed tenant=%s user=%s records=%zu",
                  tenantId.c_str(),
                  userId.c_str(),
                  removed);
    }
    return removed;
}

std::size_t PresenceTracker::sweepExpired() {
    const auto nowMs = now_();
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto& users = it->second;
            for (auto userIt = users.begin(); userIt != users.end();) {
                if (expired_(userIt->second, nowMs)) {
                    userIt = users.erase(userIt);
                    ++removed;
                }
                else {
                    ++userIt;
                }
            }
            if (users.empty()) {
                it = entries_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        tsync::common::metrics::Registry::instance().incrementCounter("presence_expired_total", removed);
        LOG_DEBUG(kLogCategory, "PresenceTracker swept expired records=%zu", removed);
    }
    return removed;
}

}  // namespace core

#include "core/ConnectionRegistry.hpp"

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
}

bool ConnectionRegistry::registerConnection(const std::shared_ptr<IConnection>& connection) {
    LOG_GUARD_RET(connection != nullptr, kLogCategory, false, "ConnectionRegistry ignoring null connection");
    LOG_GUARD_RET(!connection->tenantId().empty(),
                  kLogCategory,
                  false,
                  "ConnectionRegistry rejected connection=%s without tenant",
                  connection->connectionId().c_str());

    std::lock_guard<std::mutex> lock(mutex_);
    auto& tenant = tenants_[connection->tenantId()];
    auto [it, inserted] = tenant.try_emplace(connection->connectionId(), Entry{connection, {}});
    if (!inserted) {
        it->second.connection = connection;
    }
    else {
        ++total_;
    }
    publishGaugeLocked_();

    LOG_INFO(kLogCategory,
             "ConnectionRegistry registered connection=%s tenant=%s user=%s tenant_connections=%zu",
             connection->connectionId().c_str(),
             connection->tenantId().c_str(),
             connection->userId() ? connection->userId()->c_str() : "-",
             tenant.size());
    return true;
}

void ConnectionRegistry::unregisterConnection(const domain::TenantId& tenantId, const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeLocked_(tenantId, connectionId);
    publishGaugeLocked_();
    LOG_INFO(kLogCategory, "ConnectionRegistry unregistered connection=%s tenant=%s", connectionId.c_str(), tenantId.c_str());
}

void ConnectionRegistry::setSubscriptions(const domain::TenantId& tenantId,
                                          const std::string& connectionId,
                                          const std::vector<domain::EventType>& eventTypes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tenantIt = tenants_.find(tenantId);
    if (tenantIt == tenants_.end()) {
        return;
    }
    auto it = tenantIt->second.find(connectionId);
    if (it == tenantIt->second.end()) {
        return;
    }
    it->second.subscriptions = std::set<domain::EventType>(eventTypes.begin(), eventTypes.end());
    LOG_DEBUG(kLogCategory,
              "ConnectionRegistry subscriptions connection=%s types=%zu",
              connectionId.c_str(),
              it->second.subscriptions.size());
}

std::size_t ConnectionRegistry::broadcastToTenant(const domain::TenantId& tenantId,
                                                  const std::shared_ptr<const std::string>& message,
                                                  std::optional<domain::EventType> eventType) {
    if (!message) {
        return 0;
    }

    std::vector<std::shared_ptr<IConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto tenantIt = tenants_.find(tenantId);
        if (tenantIt == tenants_.end()) {
            return 0;
        }
        targets.reserve(tenantIt->second.size());
        for (const auto& [id, entry] : tenantIt->second) {
            if (eventType && !entry.subscriptions.empty() && entry.subscriptions.count(*eventType) == 0) {
                continue;
            }
            targets.push_back(entry.connection);
        }
    }
    return deliver_(targets, message);
}

std::size_t ConnectionRegistry::broadcastToUser(const domain::TenantId& tenantId,
                                                const domain::UserId& userId,
                                                const std::shared_ptr<const std::string>& message) {
    if (!message || userId.empty()) {
        return 0;
    }

    std::vector<std::shared_ptr<IConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto tenantIt = tenants_.find(tenantId);
        if (tenantIt == tenants_.end()) {
            return 0;
        }
        for (const auto& [id, entry] : tenantIt->second) {
            const auto& connectionUser = entry.connection->userId();
            if (connectionUser && *connectionUser == userId) {
                targets.push_back(entry.connection);
            }
        }
    }
    return deliver_(targets, message);
}

std::size_t ConnectionRegistry::deliver_(const std::vector<std::shared_ptr<IConnection>>& targets,
                                         const std::shared_ptr<const std::string>& message) {
    std::size_t delivered = 0;
    for (const auto& connection : targets) {
        bool accepted = false;
        std::string reason = "closed";
        try {
            if (connection->isOpen()) {
                accepted = connection->send(message);
                reason = "rejected";
            }
        }
        catch (const std::exception& ex) {
            reason = ex.what();
        }

        if (accepted) {
            ++delivered;
            continue;
        }

        tsync::common::metrics::Registry::instance().incrementCounter("broadcast_send_failures_total");
        std::size_t suppressed = 0;
        if (sendFailureLog_.allow(connection->connectionId(), suppressed)) {
            LOG_WARN(kLogCategory,
                     "ConnectionRegistry send failed connection=%s tenant=%s reason=%s suppressed=%zu",
                     connection->connectionId().c_str(),
                     connection->tenantId().c_str(),
                     reason.c_str(),
                     suppressed);
        }
    }
    return delivered;
}

std::optional<std::set<domain::EventType>> ConnectionRegistry::subscriptionsOf(const domain::TenantId& tenantId,
                                                                               const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tenantIt = tenants_.find(tenantId);
    if (tenantIt == tenants_.end()) {
        return std::nullopt;
    }
    auto it = tenantIt->second.find(connectionId);
    if (it == tenantIt->second.end()) {
        return std::nullopt;
    }
    return it->second.subscriptions;
}

std::size_t ConnectionRegistry::disconnectAll() {
    std::vector<std::shared_ptr<IConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.reserve(total_);
        for (const auto& [tenantId, tenant] : tenants_) {
            for (const auto& [id, entry] : tenant) {
                connections.push_back(entry.connection);
            }
        }
        tenants_.clear();
        total_ = 0;
        publishGaugeLocked_();
    }

    for (const auto& connection : connections) {
        try {
            connection->disconnect();
        }
        catch (const std::exception& ex) {
            LOG_WARN(kLogCategory,
                     "ConnectionRegistry disconnect failed connection=%s: %s",
                     connection->connectionId().c_str(),
                     ex.what());
        }
        sendFailureLog_.reset(connection->connectionId());
    }
    LOG_INFO(kLogCategory, "ConnectionRegistry disconnected connections=%zu", connections.size());
    return connections.size();
}

std::size_t ConnectionRegistry::sweepClosed() {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto tenantIt = tenants_.begin(); tenantIt != tenants_.end();) {
            auto& connections = tenantIt->second;
            for (auto it = connections.begin(); it != connections.end();) {
                if (!it->second.connection->isOpen()) {
                    dropped.push_back(it->first);
                    it = connections.erase(it);
                    --total_;
                }
                else {
                    ++it;
                }
            }
            if (connections.empty()) {
                tenantIt = tenants_.erase(tenantIt);
            }
            else {
                ++tenantIt;
            }
        }
        publishGaugeLocked_();
    }

    for (const auto& id : dropped) {
        sendFailureLog_.reset(id);
    }
    if (!dropped.empty()) {
        LOG_DEBUG(kLogCategory, "ConnectionRegistry swept closed connections=%zu", dropped.size());
    }
    return dropped.size();
}

std::size_t ConnectionRegistry::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::size_t ConnectionRegistry::connectionCount(const domain::TenantId& tenantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tenants_.find(tenantId);
    return it == tenants_.end() ? 0 : it->second.size();
}

void ConnectionRegistry::removeLocked_(const domain::TenantId& tenantId, const std::string& connectionId) {
    auto tenantIt = tenants_.find(tenantId);
    if (tenantIt == tenants_.end()) {
        return;
    }
    if (tenantIt->second.erase(connectionId) > 0) {
        --total_;
    }
    if (tenantIt->second.empty()) {
        tenants_.erase(tenantIt);
    }
}

void ConnectionRegistry::publishGaugeLocked_() const {
    tsync::common::metrics::Registry::instance().setGauge("ws_connections", static_cast<double>(total_));
}

}  // namespace core

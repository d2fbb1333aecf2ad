#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/LogUtils.h"
#include "domain/Ports.hpp"

namespace core {

// A live transport channel owned by the registry once registered. send() must
// not block: implementations enqueue and return.
class IConnection {
public:
    virtual ~IConnection() = default;

    virtual const std::string& connectionId() const = 0;
    virtual const domain::TenantId& tenantId() const = 0;
    virtual const std::optional<domain::UserId>& userId() const = 0;
    virtual bool isOpen() const = 0;
    virtual bool send(const std::shared_ptr<const std::string>& message) = 0;
    // Starts an orderly close; completion is reported by the transport.
    virtual void disconnect() = 0;
};

class ConnectionRegistry : public domain::contracts::IEventFanout {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    bool registerConnection(const std::shared_ptr<IConnection>& connection);
    void unregisterConnection(const domain::TenantId& tenantId, const std::string& connectionId);

    // An empty list subscribes the connection to every event type.
    void setSubscriptions(const domain::TenantId& tenantId,
                          const std::string& connectionId,
                          const std::vector<domain::EventType>& eventTypes);

    std::size_t broadcastToTenant(const domain::TenantId& tenantId,
                                  const std::shared_ptr<const std::string>& message,
                                  std::optional<domain::EventType> eventType = std::nullopt) override;

    std::size_t broadcastToUser(const domain::TenantId& tenantId,
                                const domain::UserId& userId,
                                const std::shared_ptr<const std::string>& message) override;

    // Types the connection asked for; empty means every type. std::nullopt for
    // an unknown connection.
    std::optional<std::set<domain::EventType>> subscriptionsOf(const domain::TenantId& tenantId,
                                                              const std::string& connectionId) const;

    std::size_t sweepClosed();

    // Forgets every connection and asks each to disconnect. Returns how many.
    std::size_t disconnectAll();

    std::size_t connectionCount() const;
    std::size_t connectionCount(const domain::TenantId& tenantId) const;

private:
    struct Entry {
        std::shared_ptr<IConnection> connection;
        std::set<domain::EventType> subscriptions;
    };
    using TenantConnections = std::unordered_map<std::string, Entry>;

    std::size_t deliver_(const std::vector<std::shared_ptr<IConnection>>& targets,
                         const std::shared_ptr<const std::string>& message);
    void removeLocked_(const domain::TenantId& tenantId, const std::string& connectionId);
    void publishGaugeLocked_() const;

    mutable std::mutex mutex_;
    std::unordered_map<domain::TenantId, TenantConnections> tenants_;
    std::size_t total_ = 0;
    RateLogger sendFailureLog_{};
};

}  // namespace core

#include <iostream>
#include <memory>
#include <string>

#include "FakeConnection.hpp"
#include "common/Metrics.hpp"
#include "core/ConnectionRegistry.hpp"

namespace {

std::shared_ptr<const std::string> msg(const std::string& text) {
    return std::make_shared<const std::string>(text);
}

}  // namespace

int main() {
    using domain::EventType;

    core::ConnectionRegistry registry;
    auto a1 = std::make_shared<FakeConnection>("a1", "tenant-a", "alice");
    auto a2 = std::make_shared<FakeConnection>("a2", "tenant-a", "bob");
    auto a3 = std::make_shared<FakeConnection>("a3", "tenant-a", "alice");
    auto b1 = std::make_shared<FakeConnection>("b1", "tenant-b", "alice");

    for (const auto& connection : {a1, a2, a3, b1}) {
        if (!registry.registerConnection(connection)) {
            std::cerr << "Failed to register " << connection->connectionId() << "\n";
            return 1;
        }
    }
    if (registry.registerConnection(std::make_shared<FakeConnection>("x", "")) ||
        registry.registerConnection(nullptr)) {
        std::cerr << "Connections without a tenant must be rejected\n";
        return 1;
    }
    if (registry.connectionCount() != 4 || registry.connectionCount("tenant-a") != 3) {
        std::cerr << "Unexpected connection counts\n";
        return 1;
    }

    // Tenant isolation.
    if (registry.broadcastToTenant("tenant-a", msg("hello-a")) != 3) {
        std::cerr << "Expected delivery to every tenant-a connection\n";
        return 1;
    }
    if (!b1->frames().empty()) {
        std::cerr << "tenant-b must never see tenant-a frames\n";
        return 1;
    }

    // Subscription filter; an empty set means everything.
    registry.setSubscriptions("tenant-a", "a2", {EventType::CaseCreated});
    for (const auto& connection : {a1, a2, a3}) {
        connection->clear();
    }
    const auto delivered = registry.broadcastToTenant("tenant-a", msg("lead"), EventType::LeadCreated);
    if (delivered != 2 || !a2->frames().empty() || a1->lastFrame() != "lead") {
        std::cerr << "Subscription filter not applied, delivered=" << delivered << "\n";
        return 1;
    }
    const auto a2Subscriptions = registry.subscriptionsOf("tenant-a", "a2");
    const auto a1Subscriptions = registry.subscriptionsOf("tenant-a", "a1");
    if (!a2Subscriptions || a2Subscriptions->size() != 1 || a2Subscriptions->count(EventType::CaseCreated) != 1 ||
        !a1Subscriptions || !a1Subscriptions->empty() || registry.subscriptionsOf("tenant-b", "a2")) {
        std::cerr << "subscriptionsOf must report per-connection subscriptions within the tenant\n";
        return 1;
    }
    if (registry.broadcastToTenant("tenant-a", msg("case"), EventType::CaseCreated) != 3) {
        std::cerr << "Subscribed type must reach every matching connection\n";
        return 1;
    }
    registry.setSubscriptions("tenant-a", "a2", {});
    if (registry.broadcastToTenant("tenant-a", msg("doc"), EventType::DocumentUpdated) != 3) {
        std::cerr << "Clearing subscriptions must restore all types\n";
        return 1;
    }

    // Targeted delivery reaches every connection of the user in that tenant only.
    for (const auto& connection : {a1, a2, a3, b1}) {
        connection->clear();
    }
    if (registry.broadcastToUser("tenant-a", "alice", msg("locked")) != 2) {
        std::cerr << "Expected both alice connections in tenant-a\n";
        return 1;
    }
    if (!a2->frames().empty() || !b1->frames().empty()) {
        std::cerr << "Targeted delivery leaked to another user or tenant\n";
        return 1;
    }
    if (registry.broadcastToUser("tenant-a", "", msg("nobody")) != 0) {
        std::cerr << "Empty user id must deliver nothing\n";
        return 1;
    }

    // A failing connection does not block the others and is counted.
    auto& metrics = tsync::common::metrics::Registry::instance();
    const auto failuresBefore = metrics.counter("broadcast_send_failures_total");
    a1->setThrowOnSend(true);
    a2->setOpen(false);
    a3->clear();
    if (registry.broadcastToTenant("tenant-a", msg("partial")) != 1 || a3->lastFrame() != "partial") {
        std::cerr << "Healthy connection must still receive the frame\n";
        return 1;
    }
    if (metrics.counter("broadcast_send_failures_total") != failuresBefore + 2) {
        std::cerr << "Send failures must be counted\n";
        return 1;
    }

    // Closed connections are swept; unregister removes explicitly.
    if (registry.sweepClosed() != 1 || registry.connectionCount("tenant-a") != 2) {
        std::cerr << "Expected one closed connection to be swept\n";
        return 1;
    }
    registry.unregisterConnection("tenant-a", "a1");
    registry.unregisterConnection("tenant-a", "missing");
    if (registry.connectionCount() != 2 || registry.connectionCount("tenant-a") != 1) {
        std::cerr << "Unexpected counts after unregister\n";
        return 1;
    }

    // Re-registering the same id replaces the connection without double counting.
    auto a3Again = std::make_shared<FakeConnection>("a3", "tenant-a", "alice");
    registry.registerConnection(a3Again);
    if (registry.connectionCount() != 2) {
        std::cerr << "Re-registration must not change the count\n";
        return 1;
    }
    registry.broadcastToTenant("tenant-a", msg("replaced"));
    if (a3Again->lastFrame() != "replaced") {
        std::cerr << "Re-registered connection must receive frames\n";
        return 1;
    }

    // Shutdown closes every registered connection and empties the registry.
    if (registry.disconnectAll() != 2 || registry.connectionCount() != 0 || a3Again->disconnects() != 1 ||
        b1->disconnects() != 1 || a3Again->isOpen()) {
        std::cerr << "disconnectAll must close every connection exactly once\n";
        return 1;
    }
    if (registry.broadcastToTenant("tenant-a", msg("after shutdown")) != 0) {
        std::cerr << "Nothing is delivered after disconnectAll\n";
        return 1;
    }

    return 0;
}

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "client/PresenceBeacon.hpp"
#include "client/SyncStateMachine.hpp"

namespace client {

// WebSocket transport for SyncStateMachine. A worker thread owns one
// io_context per connection attempt and runs the machine on it, reconnecting
// with backoff until stop() or until the machine gives up.
class SyncClient {
public:
    struct Options {
        std::string host = "127.0.0.1";
        std::string port = "8080";
        std::string path = "/";
        bool tls = false;

        domain::TenantId tenantId;
        std::optional<domain::UserId> userId;
        std::string userName;

        std::vector<domain::EventType> subscriptions;
        domain::SequenceNumber initialCursor = 0;
        SyncStateMachine::Options sync{};
    };

    SyncClient(Options options, SyncStateMachine::Callbacks callbacks);
    ~SyncClient();

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    // Handlers must be registered before start().
    void on(domain::EventType type, SyncStateMachine::EventHandler handler);

    // Its heartbeat is driven from the client's timer and it is re-announced
    // after every reconnect. The beacon must outlive the client.
    void attachBeacon(std::shared_ptr<PresenceBeacon> beacon);

    void start();
    void stop();

    // Queues a text frame on the live connection. False when offline.
    bool send(const std::string& text);

    SyncState state() const noexcept { return state_.load(std::memory_order_acquire); }
    domain::SequenceNumber cursor() const noexcept { return cursor_.load(std::memory_order_acquire); }

    // Upgrade target carrying the connection identity as query parameters.
    static std::string buildTarget(const Options& options);

private:
    class Link;
    template <class Stream>
    class LinkImpl;

    void run_();
    void scheduleTick_(const std::shared_ptr<boost::asio::steady_timer>& timer);
    void publishState_();

    Options options_;
    SyncStateMachine machine_;
    std::shared_ptr<PresenceBeacon> beacon_;

    std::atomic<bool> running_{false};
    std::atomic<SyncState> state_{SyncState::Disconnected};
    std::atomic<domain::SequenceNumber> cursor_{0};
    std::thread worker_;

    std::mutex linkMutex_;
    std::shared_ptr<boost::asio::io_context> activeIoc_;
    std::shared_ptr<Link> activeLink_;
};

}  // namespace client

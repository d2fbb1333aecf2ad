#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "adapters/api/ws/SessionSendQueue.hpp"
#include "app/SyncProtocolHandler.hpp"
#include "core/ConnectionRegistry.hpp"

namespace adapters::api::ws {

struct SessionIdentity {
    domain::TenantId tenantId;
    std::optional<domain::UserId> userId;
    std::string userName;
};

struct KeepAliveConfig {
    std::chrono::milliseconds pingPeriod{30000};
    std::chrono::milliseconds pongTimeout{75000};
};

// One accepted WebSocket peer. Reads run on the session strand; writes are
// serialized through the SessionSendQueue, so send() is safe from any thread.
class WsSession : public core::IConnection, public std::enable_shared_from_this<WsSession> {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

    WsSession(boost::asio::ip::tcp::socket&& socket,
              std::string connectionId,
              SessionIdentity identity,
              KeepAliveConfig keepAlive,
              const SessionSendQueue::Config& queueConfig,
              std::shared_ptr<app::SyncProtocolHandler> handler);

    void run(HttpRequest request);

    const std::string& connectionId() const override { return connectionId_; }
    const domain::TenantId& tenantId() const override { return identity_.tenantId; }
    const std::optional<domain::UserId>& userId() const override { return identity_.userId; }
    bool isOpen() const override { return open_.load(std::memory_order_acquire); }
    bool send(const std::shared_ptr<const std::string>& message) override;
    void disconnect() override { close(boost::beast::websocket::close_code::going_away); }

    // Posts a close onto the session strand.
    void close(boost::beast::websocket::close_code code);

private:
    using Clock = std::chrono::steady_clock;

    void onAccept_(boost::beast::error_code ec);
    void doRead_();
    void onRead_(boost::beast::error_code ec, std::size_t bytes);
    void startWrite_(const std::shared_ptr<const std::string>& payload);
    void onWrite_(boost::beast::error_code ec, std::size_t bytes);
    void scheduleTick_();
    void onTick_(boost::beast::error_code ec);
    void finish_(const char* reason);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::steady_timer tickTimer_;
    boost::beast::flat_buffer buffer_;

    const std::string connectionId_;
    const SessionIdentity identity_;
    const KeepAliveConfig keepAlive_;
    std::shared_ptr<app::SyncProtocolHandler> handler_;
    SessionSendQueue queue_;

    std::atomic<bool> open_{false};
    std::atomic<bool> finished_{false};
    Clock::time_point lastInboundAt_{};
    Clock::time_point lastPingAt_{};
};

}  // namespace adapters::api::ws

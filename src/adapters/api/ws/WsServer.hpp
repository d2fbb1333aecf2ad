#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "adapters/api/http/Router.hpp"
#include "adapters/api/ws/SessionSendQueue.hpp"
#include "adapters/api/ws/WsSession.hpp"
#include "app/SyncProtocolHandler.hpp"

namespace adapters::api::ws {

// Resolves who is connecting from the upgrade request: query parameters win
// over the X-Tenant-Id / X-User-Id / X-User-Name headers.
std::optional<SessionIdentity> identityFromRequest(const http::Request& request);

// Single listening port for WebSocket upgrades and the HTTP side channel.
class WsServer {
public:
    struct Options {
        std::string bindAddress = "0.0.0.0";
        std::uint16_t port = 8080;
        std::size_t threads = 2;
        KeepAliveConfig keepAlive{};
        SessionSendQueue::Config sendQueue{};
        // How long stop() waits for sessions to finish their close handshake.
        std::chrono::milliseconds shutdownGrace{1000};
    };

    WsServer(Options options,
             std::shared_ptr<app::SyncProtocolHandler> handler,
             std::shared_ptr<const http::Router> router);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    // Binds and starts the I/O threads. Throws std::runtime_error when the
    // address cannot be bound.
    void start();
    void stop();

    std::uint16_t boundPort() const noexcept { return boundPort_.load(); }

private:
    class HttpSession;

    void doAccept_();
    void onAccept_(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
    std::string nextConnectionId_();

    Options options_;
    std::shared_ptr<app::SyncProtocolHandler> handler_;
    std::shared_ptr<const http::Router> router_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> boundPort_{0};
    std::atomic<std::uint64_t> connectionCounter_{0};
};

}  // namespace adapters::api::ws

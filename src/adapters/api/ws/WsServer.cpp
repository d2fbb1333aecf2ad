#include "adapters/api/ws/WsServer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "adapters/api/http/QueryParams.hpp"
#include "logging/Log.h"

namespace adapters::api::ws {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr std::chrono::seconds kHttpReadTimeout{30};
constexpr std::uint64_t kMaxHttpBodyBytes = 1 * 1024 * 1024;

}  // namespace

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string toStdString(beast::string_view value) { return std::string(value.data(), value.size()); }

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

http::Request toRequest(const bhttp::request<bhttp::string_body>& req) {
    http::Request request;
    request.method = toStdString(req.method_string());
    request.target = toStdString(req.target());
    http::split_target(request.target, request.path, request.query);
    request.body = req.body();
    for (const auto& field : req) {
        request.headers[toLower(toStdString(field.name_string()))] = toStdString(field.value());
    }
    return request;
}

}  // namespace

std::optional<SessionIdentity> identityFromRequest(const http::Request& request) {
    auto tenantId = http::query_or_header(request, "tenantId", "x-tenant-id");
    if (!tenantId) {
        return std::nullopt;
    }

    SessionIdentity identity;
    identity.tenantId = std::move(*tenantId);
    identity.userId = http::query_or_header(request, "userId", "x-user-id");
    identity.userName = http::query_or_header(request, "userName", "x-user-name").value_or(std::string{});
    return identity;
}

class WsServer::HttpSession : public std::enable_shared_from_this<WsServer::HttpSession> {
public:
    HttpSession(tcp::socket&& socket, WsServer& server) : stream_(std::move(socket)), server_(server) {}

    void run() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::doRead_, shared_from_this()));
    }

private:
    void doRead_() {
        parser_.emplace();
        parser_->body_limit(kMaxHttpBodyBytes);
        stream_.expires_after(kHttpReadTimeout);
        bhttp::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::onRead_, shared_from_this()));
    }

    void onRead_(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream) {
            beast::error_code shutdownEc;
            stream_.socket().shutdown(tcp::socket::shutdown_send, shutdownEc);
            return;
        }
        if (ec) {
            LOG_DEBUG(kLogCategory, "HTTP read failed: %s", ec.message().c_str());
            return;
        }

        auto req = parser_->release();
        const auto request = toRequest(req);

        if (websocket::is_upgrade(req)) {
            auto identity = identityFromRequest(request);
            if (!identity) {
                LOG_WARN(kLogCategory, "WebSocket upgrade rejected without tenant target=%s", request.target.c_str());
                sendResponse_(http::json_error(400, http::errors::tenant_required), req.version(), false);
                return;
            }

            stream_.expires_never();
            auto session = std::make_shared<WsSession>(stream_.release_socket(),
                                                       server_.nextConnectionId_(),
                                                       std::move(*identity),
                                                       server_.options_.keepAlive,
                                                       server_.options_.sendQueue,
                                                       server_.handler_);
            session->run(std::move(req));
            return;
        }

        sendResponse_(server_.router_->handle(request), req.version(), req.keep_alive());
    }

    void sendResponse_(const http::Response& response, unsigned version, bool keepAlive) {
        auto res = std::make_shared<bhttp::response<bhttp::string_body>>(
            static_cast<bhttp::status>(response.statusCode), version);
        res->set(bhttp::field::server, "tenantsync");
        res->set(bhttp::field::content_type, response.contentType);
        for (const auto& [name, value] : response.headers) {
            res->set(name, value);
        }
        res->keep_alive(keepAlive);
        res->body() = response.body;
        res->prepare_payload();

        bhttp::async_write(stream_, *res, [self = shared_from_this(), res, keepAlive](beast::error_code ec, std::size_t) {
            self->onWrite_(keepAlive, ec);
        });
    }

    void onWrite_(bool keepAlive, beast::error_code ec) {
        if (ec) {
            LOG_DEBUG(kLogCategory, "HTTP write failed: %s", ec.message().c_str());
            return;
        }
        if (!keepAlive) {
            beast::error_code shutdownEc;
            stream_.socket().shutdown(tcp::socket::shutdown_send, shutdownEc);
            return;
        }
        doRead_();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    WsServer& server_;
};

WsServer::WsServer(Options options,
                   std::shared_ptr<app::SyncProtocolHandler> handler,
                   std::shared_ptr<const http::Router> router)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      router_(std::move(router)),
      ioc_(static_cast<int>(std::max<std::size_t>(1, options_.threads))),
      work_(net::make_work_guard(ioc_)),
      acceptor_(ioc_) {
    if (!handler_ || !router_) {
        throw std::invalid_argument("WsServer requires a protocol handler and a router");
    }
}

WsServer::~WsServer() { stop(); }

void WsServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    beast::error_code ec;
    const auto address = net::ip::make_address(options_.bindAddress, ec);
    if (ec) {
        running_.store(false);
        throw std::runtime_error("WsServer: invalid bind address '" + options_.bindAddress + "': " + ec.message());
    }
    const tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        running_.store(false);
        throw std::runtime_error("WsServer: cannot listen on " + options_.bindAddress + ":" +
                                 std::to_string(options_.port) + ": " + ec.message());
    }
    boundPort_.store(acceptor_.local_endpoint().port());

    doAccept_();

    const auto threadCount = std::max<std::size_t>(1, options_.threads);
    threads_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        threads_.emplace_back([this, i]() {
            try {
                ioc_.run();
            } catch (const std::exception& ex) {
                LOG_ERROR(kLogCategory, "WsServer io thread=%zu crashed: %s", i, ex.what());
            }
        });
    }

    LOG_INFO(kLogCategory,
             "WsServer listening on %s:%u threads=%zu",
             options_.bindAddress.c_str(),
             static_cast<unsigned>(boundPort_.load()),
             threadCount);
}

void WsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    net::post(ioc_, [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    // Send close frames while the I/O threads are still running.
    const auto closing = handler_->disconnectAll();
    const auto deadline = std::chrono::steady_clock::now() + options_.shutdownGrace;
    while (handler_->openSessions() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const auto lingering = handler_->openSessions();
    if (lingering > 0) {
        LOG_WARN(kLogCategory, "WsServer stopping with %zu of %zu sessions still closing", lingering, closing);
    }

    work_.reset();
    ioc_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LOG_INFO(kLogCategory, "WsServer stopped");
}

void WsServer::doAccept_() {
    acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&WsServer::onAccept_, this));
}

void WsServer::onAccept_(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || !running_.load()) {
            return;
        }
        LOG_WARN(kLogCategory, "WsServer accept failed: %s", ec.message().c_str());
    } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->run();
    }

    if (running_.load()) {
        doAccept_();
    }
}

std::string WsServer::nextConnectionId_() {
    return "c-" + std::to_string(connectionCounter_.fetch_add(1) + 1);
}

}  // namespace adapters::api::ws

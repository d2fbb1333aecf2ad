#include "adapters/api/ws/WsSession.hpp"

#include <utility>

#include <boost/asio/post.hpp>

#include "core/WireProtocol.hpp"
#include "logging/Log.h"

namespace adapters::api::ws {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr std::size_t kMaxFrameSize = 1 * 1024 * 1024;  // 1 MiB per inbound message
constexpr std::chrono::seconds kTickInterval{1};

}  // namespace

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

WsSession::WsSession(net::ip::tcp::socket&& socket,
                     std::string connectionId,
                     SessionIdentity identity,
                     KeepAliveConfig keepAlive,
                     const SessionSendQueue::Config& queueConfig,
                     std::shared_ptr<app::SyncProtocolHandler> handler)
    : ws_(std::move(socket)),
      tickTimer_(ws_.get_executor()),
      connectionId_(std::move(connectionId)),
      identity_(std::move(identity)),
      keepAlive_(keepAlive),
      handler_(std::move(handler)),
      queue_(connectionId_,
             queueConfig,
             SessionSendQueue::Callbacks{
                 [this](const std::shared_ptr<const std::string>& payload) { startWrite_(payload); },
                 [this]() { close(websocket::close_code::policy_error); }}) {}

void WsSession::run(HttpRequest request) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "tenantsync");
    }));
    ws_.read_message_max(kMaxFrameSize);
    ws_.text(true);

    ws_.async_accept(request, beast::bind_front_handler(&WsSession::onAccept_, shared_from_this()));
}

bool WsSession::send(const std::shared_ptr<const std::string>& message) {
    if (!isOpen()) {
        return false;
    }
    return queue_.enqueue(message);
}

void WsSession::close(websocket::close_code code) {
    auto self = weak_from_this().lock();
    if (!self) {
        return;
    }
    net::post(ws_.get_executor(), [self, code]() {
        if (!self->ws_.is_open()) {
            self->finish_("closed");
            return;
        }
        self->ws_.async_close(code, [self](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG(kLogCategory,
                          "WsSession close failed connection=%s: %s",
                          self->connectionId_.c_str(),
                          ec.message().c_str());
            }
            self->finish_("server_close");
        });
    });
}

void WsSession::onAccept_(beast::error_code ec) {
    if (ec) {
        LOG_WARN(kLogCategory, "WsSession handshake failed connection=%s: %s", connectionId_.c_str(), ec.message().c_str());
        return;
    }

    lastInboundAt_ = Clock::now();
    lastPingAt_ = lastInboundAt_;
    open_.store(true, std::memory_order_release);

    if (!handler_->onOpen(shared_from_this(), identity_.userName)) {
        open_.store(false, std::memory_order_release);
        finished_.store(true, std::memory_order_release);
        queue_.close();
        beast::error_code closeEc;
        ws_.close(websocket::close_code::policy_error, closeEc);
        return;
    }

    LOG_INFO(kLogCategory,
             "WsSession open connection=%s tenant=%s user=%s",
             connectionId_.c_str(),
             identity_.tenantId.c_str(),
             identity_.userId ? identity_.userId->c_str() : "-");

    scheduleTick_();
    doRead_();
}

void WsSession::doRead_() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::onRead_, shared_from_this()));
}

void WsSession::onRead_(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (ec == websocket::error::closed) {
            finish_("peer_close");
        } else {
            LOG_DEBUG(kLogCategory, "WsSession read failed connection=%s: %s", connectionId_.c_str(), ec.message().c_str());
            finish_("read_error");
        }
        return;
    }

    lastInboundAt_ = Clock::now();
    if (!ws_.got_text()) {
        buffer_.consume(bytes);
        queue_.enqueue(std::make_shared<const std::string>(core::wire::encodeError("binary frames are not supported")));
        doRead_();
        return;
    }

    const std::string text = beast::buffers_to_string(buffer_.cdata());
    buffer_.consume(buffer_.size());

    if (!handler_->onMessage(shared_from_this(), text)) {
        close(websocket::close_code::policy_error);
        return;
    }
    doRead_();
}

void WsSession::startWrite_(const std::shared_ptr<const std::string>& payload) {
    auto self = weak_from_this().lock();
    if (!self) {
        return;
    }
    net::post(ws_.get_executor(), [self, payload]() {
        self->ws_.async_write(net::buffer(*payload),
                              [self, payload](beast::error_code ec, std::size_t bytes) { self->onWrite_(ec, bytes); });
    });
}

void WsSession::onWrite_(beast::error_code ec, std::size_t) {
    if (ec) {
        LOG_DEBUG(kLogCategory, "WsSession write failed connection=%s: %s", connectionId_.c_str(), ec.message().c_str());
        finish_("write_error");
        beast::error_code closeEc;
        beast::get_lowest_layer(ws_).socket().close(closeEc);
        return;
    }
    queue_.onWriteComplete();
}

void WsSession::scheduleTick_() {
    tickTimer_.expires_after(kTickInterval);
    tickTimer_.async_wait(beast::bind_front_handler(&WsSession::onTick_, shared_from_this()));
}

void WsSession::onTick_(beast::error_code ec) {
    if (ec == net::error::operation_aborted || !isOpen()) {
        return;
    }

    const auto now = Clock::now();
    if (now - lastInboundAt_ > keepAlive_.pongTimeout) {
        LOG_WARN(kLogCategory,
                 "WsSession pong timeout connection=%s tenant=%s silent_ms=%lld",
                 connectionId_.c_str(),
                 identity_.tenantId.c_str(),
                 static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(now - lastInboundAt_).count()));
        close(websocket::close_code::policy_error);
        return;
    }

    if (queue_.checkStall(now)) {
        return;
    }

    if (now - lastPingAt_ >= keepAlive_.pingPeriod) {
        lastPingAt_ = now;
        queue_.enqueue(std::make_shared<const std::string>(core::wire::encodePing()), now);
    }

    scheduleTick_();
}

void WsSession::finish_(const char* reason) {
    if (finished_.exchange(true)) {
        return;
    }
    open_.store(false, std::memory_order_release);
    queue_.close();
    tickTimer_.cancel();

    LOG_INFO(kLogCategory,
             "WsSession closed connection=%s tenant=%s reason=%s",
             connectionId_.c_str(),
             identity_.tenantId.c_str(),
             reason);
    handler_->onClose(*this);
}

}  // namespace adapters::api::ws

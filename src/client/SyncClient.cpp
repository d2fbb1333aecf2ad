#include "client/SyncClient.hpp"

#include <cctype>
#include <cstdio>
#include <deque>
#include <functional>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Log.h"

namespace client {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::CLIENT;
constexpr std::chrono::seconds kConnectTimeout{10};
constexpr std::chrono::seconds kCloseTimeout{5};
constexpr std::chrono::seconds kTickInterval{1};
constexpr std::chrono::milliseconds kStopPoll{200};

}  // namespace

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<ssl::stream<beast::tcp_stream>>;

template <class Stream>
struct StreamTraits;

template <>
struct StreamTraits<PlainStream> {
    static constexpr bool kTls = false;
    static PlainStream make(net::io_context& ioc, ssl::context&) { return PlainStream(ioc); }
};

template <>
struct StreamTraits<TlsStream> {
    static constexpr bool kTls = true;
    static TlsStream make(net::io_context& ioc, ssl::context& ctx) { return TlsStream(ioc, ctx); }
};

std::string percentEncode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", ch);
            encoded.append(buf);
        }
    }
    return encoded;
}

}  // namespace

class SyncClient::Link {
public:
    struct Hooks {
        std::function<void()> onOpen;
        std::function<void(const std::string&)> onText;
        std::function<void(const char* reason)> onClosed;
    };

    virtual ~Link() = default;

    // All of these run on the link's io_context thread.
    virtual void start() = 0;
    virtual void send(std::string text) = 0;
    virtual void close() = 0;
    virtual void abort() = 0;
};

template <class Stream>
class SyncClient::LinkImpl : public SyncClient::Link, public std::enable_shared_from_this<SyncClient::LinkImpl<Stream>> {
public:
    LinkImpl(net::io_context& ioc, ssl::context& sslCtx, std::string host, std::string port, std::string target, Hooks hooks)
        : resolver_(ioc),
          ws_(StreamTraits<Stream>::make(ioc, sslCtx)),
          closeTimer_(ioc),
          host_(std::move(host)),
          port_(std::move(port)),
          target_(std::move(target)),
          hooks_(std::move(hooks)) {}

    void start() override {
        resolver_.async_resolve(host_, port_, beast::bind_front_handler(&LinkImpl::onResolve_, this->shared_from_this()));
    }

    void send(std::string text) override {
        if (!open_ || finished_ || closeRequested_) {
            return;
        }
        outbox_.push_back(std::make_shared<const std::string>(std::move(text)));
        if (outbox_.size() == 1) {
            doWrite_();
        }
    }

    void close() override {
        if (finished_ || closeRequested_) {
            return;
        }
        closeRequested_ = true;
        if (!open_) {
            abort();
            return;
        }

        auto self = this->shared_from_this();
        closeTimer_.expires_after(kCloseTimeout);
        closeTimer_.async_wait([self](const beast::error_code& ec) {
            if (!ec) {
                self->abort();
            }
        });
        if (outbox_.empty()) {
            doClose_();
        }
    }

    void abort() override {
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        finish_("aborted");
    }

private:
    void onResolve_(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail_("resolve", ec);
            return;
        }
        beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
        beast::get_lowest_layer(ws_).async_connect(
            results, beast::bind_front_handler(&LinkImpl::onConnect_, this->shared_from_this()));
    }

    void onConnect_(beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
        if (ec) {
            fail_("connect", ec);
            return;
        }

        if constexpr (StreamTraits<Stream>::kTls) {
            auto& tlsStream = ws_.next_layer();
            if (!::SSL_set_tlsext_host_name(tlsStream.native_handle(), host_.c_str())) {
                const beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                fail_("sni", sniEc);
                return;
            }
            tlsStream.set_verify_callback(ssl::host_name_verification(host_));
            beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
            tlsStream.async_handshake(ssl::stream_base::client,
                                      beast::bind_front_handler(&LinkImpl::onTlsHandshake_, this->shared_from_this()));
        } else {
            doHandshake_();
        }
    }

    void onTlsHandshake_(beast::error_code ec) {
        if (ec) {
            fail_("tls_handshake", ec);
            return;
        }
        doHandshake_();
    }

    void doHandshake_() {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "tenantsync-client");
        }));
        ws_.async_handshake(host_ + ":" + port_,
                            target_,
                            beast::bind_front_handler(&LinkImpl::onHandshake_, this->shared_from_this()));
    }

    void onHandshake_(beast::error_code ec) {
        if (ec) {
            fail_("ws_handshake", ec);
            return;
        }
        if (closeRequested_) {
            abort();
            return;
        }
        ws_.text(true);
        open_ = true;
        LOG_INFO(kLogCategory, "SyncClient connected to %s:%s%s", host_.c_str(), port_.c_str(), target_.c_str());
        if (hooks_.onOpen) {
            hooks_.onOpen();
        }
        doRead_();
    }

    void doRead_() {
        ws_.async_read(buffer_, beast::bind_front_handler(&LinkImpl::onRead_, this->shared_from_this()));
    }

    void onRead_(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                finish_("peer_close");
            } else {
                fail_("read", ec);
            }
            return;
        }

        const std::string text = beast::buffers_to_string(buffer_.cdata());
        buffer_.consume(buffer_.size());
        if (hooks_.onText) {
            hooks_.onText(text);
        }
        if (!finished_) {
            doRead_();
        }
    }

    void doWrite_() {
        ws_.async_write(net::buffer(*outbox_.front()),
                        beast::bind_front_handler(&LinkImpl::onWrite_, this->shared_from_this()));
    }

    void onWrite_(beast::error_code ec, std::size_t) {
        if (ec) {
            fail_("write", ec);
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            doWrite_();
        } else if (closeRequested_ && !finished_) {
            doClose_();
        }
    }

    void doClose_() {
        ws_.async_close(websocket::close_code::normal, [self = this->shared_from_this()](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG(kLogCategory, "SyncClient close handshake failed: %s", ec.message().c_str());
            }
            self->finish_("client_close");
        });
    }

    void fail_(const char* where, beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec != net::error::operation_aborted) {
            LOG_WARN(kLogCategory, "SyncClient %s failed: %s", where, ec.message().c_str());
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        finish_(where);
    }

    void finish_(const char* reason) {
        if (finished_) {
            return;
        }
        finished_ = true;
        open_ = false;
        outbox_.clear();
        closeTimer_.cancel();
        if (hooks_.onClosed) {
            hooks_.onClosed(reason);
        }
    }

    tcp::resolver resolver_;
    Stream ws_;
    net::steady_timer closeTimer_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> outbox_;

    const std::string host_;
    const std::string port_;
    const std::string target_;
    Hooks hooks_;

    bool open_ = false;
    bool closeRequested_ = false;
    bool finished_ = false;
};

SyncClient::SyncClient(Options options, SyncStateMachine::Callbacks callbacks)
    : options_(std::move(options)),
      machine_(options_.sync,
               [this, callbacks]() mutable {
                   callbacks.send = [this](const std::string& text) { send(text); };
                   auto userStateChange = std::move(callbacks.onStateChange);
                   callbacks.onStateChange = [this, userStateChange](SyncState from, SyncState to) {
                       state_.store(to, std::memory_order_release);
                       if (userStateChange) {
                           userStateChange(from, to);
                       }
                   };
                   return callbacks;
               }(),
               options_.initialCursor) {
    if (options_.tenantId.empty()) {
        throw std::invalid_argument("SyncClient requires a tenant id");
    }
    machine_.setSubscriptions(options_.subscriptions);
    cursor_.store(machine_.cursor(), std::memory_order_release);
}

SyncClient::~SyncClient() {
    stop();
}

void SyncClient::on(domain::EventType type, SyncStateMachine::EventHandler handler) {
    if (running_.load(std::memory_order_acquire)) {
        throw std::logic_error("SyncClient handlers must be registered before start()");
    }
    machine_.on(type, std::move(handler));
}

void SyncClient::attachBeacon(std::shared_ptr<PresenceBeacon> beacon) {
    if (running_.load(std::memory_order_acquire)) {
        throw std::logic_error("SyncClient beacon must be attached before start()");
    }
    beacon_ = std::move(beacon);
}

void SyncClient::start() {
    if (running_.exchange(true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread(&SyncClient::run_, this);
}

void SyncClient::stop() {
    running_.store(false, std::memory_order_release);

    std::shared_ptr<net::io_context> ioc;
    std::shared_ptr<Link> link;
    {
        std::lock_guard<std::mutex> lock(linkMutex_);
        ioc = activeIoc_;
        link = activeLink_;
    }
    if (ioc && link) {
        net::post(*ioc, [link]() { link->close(); });
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SyncClient::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(linkMutex_);
    if (!activeIoc_ || !activeLink_) {
        return false;
    }
    net::post(*activeIoc_, [link = activeLink_, text]() { link->send(text); });
    return true;
}

std::string SyncClient::buildTarget(const Options& options) {
    std::string target = options.path.empty() ? "/" : options.path;
    target += (target.find('?') == std::string::npos) ? '?' : '&';
    target += "tenantId=" + percentEncode(options.tenantId);
    if (options.userId) {
        target += "&userId=" + percentEncode(*options.userId);
    }
    if (!options.userName.empty()) {
        target += "&userName=" + percentEncode(options.userName);
    }
    return target;
}

void SyncClient::run_() {
    try {
        LOG_INFO(kLogCategory,
                 "SyncClient worker starting host=%s port=%s tenant=%s tls=%d",
                 options_.host.c_str(),
                 options_.port.c_str(),
                 options_.tenantId.c_str(),
                 options_.tls ? 1 : 0);

        ssl::context sslCtx(ssl::context::tls_client);
        if (options_.tls) {
            sslCtx.set_default_verify_paths();
            sslCtx.set_verify_mode(ssl::verify_peer);
        }
        const auto target = buildTarget(options_);

        while (running_.load(std::memory_order_acquire)) {
            auto ioc = std::make_shared<net::io_context>();
            auto tickTimer = std::make_shared<net::steady_timer>(*ioc);

            Link::Hooks hooks;
            hooks.onOpen = [this, tickTimer]() {
                machine_.onTransportOpen();
                if (beacon_) {
                    beacon_->announce();
                }
                publishState_();
                scheduleTick_(tickTimer);
            };
            hooks.onText = [this](const std::string& text) {
                machine_.onText(text);
                publishState_();
            };
            hooks.onClosed = [tickTimer](const char* reason) {
                tickTimer->cancel();
                LOG_INFO(kLogCategory, "SyncClient connection closed reason=%s", reason);
            };

            std::shared_ptr<Link> link;
            if (options_.tls) {
                link = std::make_shared<LinkImpl<TlsStream>>(*ioc, sslCtx, options_.host, options_.port, target, hooks);
            } else {
                link = std::make_shared<LinkImpl<PlainStream>>(*ioc, sslCtx, options_.host, options_.port, target, hooks);
            }

            {
                std::lock_guard<std::mutex> lock(linkMutex_);
                activeIoc_ = ioc;
                activeLink_ = link;
            }
            if (!running_.load(std::memory_order_acquire)) {
                std::lock_guard<std::mutex> lock(linkMutex_);
                activeLink_.reset();
                activeIoc_.reset();
                break;
            }

            machine_.onConnecting();
            publishState_();
            LOG_INFO(kLogCategory,
                     "SyncClient connecting to %s:%s (attempt=%zu)",
                     options_.host.c_str(),
                     options_.port.c_str(),
                     machine_.reconnectAttempts() + 1);

            link->start();
            ioc->run();

            {
                std::lock_guard<std::mutex> lock(linkMutex_);
                activeLink_.reset();
                activeIoc_.reset();
            }

            if (!running_.load(std::memory_order_acquire)) {
                break;
            }

            const auto delay = machine_.onTransportClosed();
            publishState_();
            if (!delay) {
                break;
            }

            auto waited = std::chrono::milliseconds{0};
            while (waited < *delay && running_.load(std::memory_order_acquire)) {
                std::this_thread::sleep_for(kStopPoll);
                waited += kStopPoll;
            }
        }

        LOG_INFO(kLogCategory, "SyncClient worker stopping cursor=%lld", static_cast<long long>(machine_.cursor()));
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "SyncClient worker crashed: %s", ex.what());
    }

    if (machine_.state() != SyncState::GaveUp) {
        state_.store(SyncState::Disconnected, std::memory_order_release);
    }
    running_.store(false, std::memory_order_release);
}

void SyncClient::scheduleTick_(const std::shared_ptr<net::steady_timer>& timer) {
    timer->expires_after(kTickInterval);
    timer->async_wait([this, timer](const beast::error_code& ec) {
        if (ec == net::error::operation_aborted || !running_.load(std::memory_order_acquire)) {
            return;
        }

        const auto now = SyncStateMachine::Clock::now();
        if (machine_.isStale(now)) {
            LOG_WARN(kLogCategory, "SyncClient connection stale; reconnecting");
            std::shared_ptr<Link> link;
            {
                std::lock_guard<std::mutex> lock(linkMutex_);
                link = activeLink_;
            }
            if (link) {
                link->abort();
            }
            return;
        }

        if (beacon_) {
            beacon_->tick(now);
        }
        scheduleTick_(timer);
    });
}

void SyncClient::publishState_() {
    state_.store(machine_.state(), std::memory_order_release);
    cursor_.store(machine_.cursor(), std::memory_order_release);
}

}  // namespace client

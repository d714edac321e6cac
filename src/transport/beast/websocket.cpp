#include "wirelink/core/transport/beast/websocket.hpp"

#include <future>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "lcr/log/logger.hpp"


namespace wirelink::core::transport::beast {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace websocket = boost::beast::websocket;
namespace http = boost::beast::http;

namespace {

// RFC 6455: control frame payloads are limited to 125 bytes
constexpr std::size_t MAX_CONTROL_PAYLOAD = 125;

// Host header value: the port is omitted when it is the scheme default
std::string host_header(const ParsedUrl& url) {
    const bool default_port = (url.secure && url.port == "443") || (!url.secure && url.port == "80");
    const bool ipv6 = url.host.find(':') != std::string::npos;
    std::string host = ipv6 ? "[" + url.host + "]" : url.host;
    return default_port ? host : host + ":" + url.port;
}

template <class Stream>
void configure_stream(Stream& ws, const std::string& user_agent) {
    // Keep-alive pings belong to the session layer's liveness scheduler
    ws.set_option(websocket::stream_base::timeout{
        websocket::stream_base::none(),   // handshake timeout
        websocket::stream_base::none(),   // idle timeout
        false                             // keep-alive pings
    });
    ws.set_option(websocket::stream_base::decorator([user_agent](websocket::request_type& req) {
        req.set(http::field::user_agent, user_agent);
    }));
}

template <class Stream, class Handler>
void async_write_frame(Stream& ws, const Frame& frame, Handler&& handler) {
    switch (frame.type) {
        case FrameType::Binary:
        case FrameType::Text:
            ws.binary(frame.type == FrameType::Binary);
            ws.async_write(net::buffer(frame.payload),
                [handler = std::forward<Handler>(handler)](const boost::system::error_code& ec, std::size_t) mutable {
                    handler(ec);
                });
            return;
        case FrameType::Ping:
        case FrameType::Pong: {
            // Copied into the stream's own frame buffer on initiation
            websocket::ping_data data(reinterpret_cast<const char*>(frame.payload.data()), frame.payload.size());
            if (frame.type == FrameType::Ping) {
                ws.async_ping(data, std::forward<Handler>(handler));
            }
            else {
                ws.async_pong(data, std::forward<Handler>(handler));
            }
            return;
        }
        case FrameType::Close:
            ws.async_close(websocket::close_code::normal, std::forward<Handler>(handler));
            return;
    }
}

} // namespace


// ============================================================================
// WebSocket
// ============================================================================

WebSocket::WebSocket() = default;

WebSocket::~WebSocket() {
    (void)close();
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

WebSocket::tcp::socket& WebSocket::socket_() noexcept {
    return wss_ ? boost::beast::get_lowest_layer(*wss_) : boost::beast::get_lowest_layer(*ws_);
}

Error WebSocket::open_(const ParsedUrl& url, const std::string& user_agent) {
    boost::system::error_code ec;

    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        WL_WARN("[WS] Resolve failed for " << url.host << ":" << url.port << " (" << ec.message() << ")");
        return Error::ConnectionFailed;
    }

    if (url.secure) {
        ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        ssl_ctx_->set_default_verify_paths(ec);
        if (ec) {
            WL_WARN("[WS] Could not load default certificate paths (" << ec.message() << ")");
            ec.clear();
        }
        ssl_ctx_->set_verify_mode(ssl::verify_peer);
        wss_ = std::make_unique<tls_stream>(ioc_, *ssl_ctx_);
    }
    else {
        ws_ = std::make_unique<plain_stream>(ioc_);
    }

    net::connect(socket_(), results, ec);
    if (ec) {
        WL_WARN("[WS] TCP connect to " << url.host << ":" << url.port << " failed (" << ec.message() << ")");
        return Error::ConnectionFailed;
    }
    socket_().set_option(tcp::no_delay(true), ec);
    ec.clear();

    const std::string host = host_header(url);
    if (wss_) {
        // SNI is only meaningful for DNS names
        boost::system::error_code addr_ec;
        (void)net::ip::make_address(url.host, addr_ec);
        if (addr_ec && !::SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), url.host.c_str())) {
            WL_WARN("[WS] Failed to set SNI host name " << url.host);
            return Error::HandshakeFailed;
        }
        wss_->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
        wss_->next_layer().handshake(ssl::stream_base::client, ec);
        if (ec) {
            WL_WARN("[WS] TLS handshake with " << url.host << " failed (" << ec.message() << ")");
            return Error::HandshakeFailed;
        }
        configure_stream(*wss_, user_agent);
        wss_->handshake(host, url.target, ec);
    }
    else {
        configure_stream(*ws_, user_agent);
        ws_->handshake(host, url.target, ec);
    }
    if (ec) {
        WL_WARN("[WS] WebSocket upgrade failed for " << host << url.target << " (" << ec.message() << ")");
        return Error::HandshakeFailed;
    }

    install_control_callback_();

    // From here on every stream operation runs on the I/O thread
    work_.emplace(net::make_work_guard(ioc_));
    io_thread_ = std::thread([this] { ioc_.run(); });

    WL_DEBUG("[WS] Connected to " << (url.secure ? "wss://" : "ws://") << host << url.target);
    return Error::None;
}

void WebSocket::install_control_callback_() {
    // Invoked from within async_read completion, on the I/O thread
    auto on_control = [this](websocket::frame_type kind, boost::beast::string_view payload) {
        Bytes data(payload.begin(), payload.end());
        switch (kind) {
            case websocket::frame_type::ping:
                inbox_.push_back(Frame{FrameType::Ping, std::move(data)});
                break;
            case websocket::frame_type::pong:
                inbox_.push_back(Frame{FrameType::Pong, std::move(data)});
                break;
            default:
                // Close is reported by read() through websocket::error::closed
                break;
        }
    };
    if (wss_) {
        wss_->control_callback(on_control);
    }
    else {
        ws_->control_callback(on_control);
    }
}

Error WebSocket::run_on_io_(std::function<void(Completion)> start) {
    auto result = std::make_shared<std::promise<Error>>();
    auto future = result->get_future();
    net::post(ioc_, [start = std::move(start), result]() mutable {
        start([result](Error err) { result->set_value(err); });
    });
    return future.get();
}

Error WebSocket::write(const Frame& frame) {
    if (closed_.load(std::memory_order_acquire) || !io_thread_.joinable()) {
        return Error::InvalidState;
    }
    switch (frame.type) {
        case FrameType::Binary:
        case FrameType::Text:
        case FrameType::Close:
            break;
        case FrameType::Ping:
        case FrameType::Pong:
            if (frame.payload.size() > MAX_CONTROL_PAYLOAD) {
                WL_WARN("[WS] " << frame.type << " payload of " << frame.payload.size()
                        << " bytes exceeds " << MAX_CONTROL_PAYLOAD);
                return Error::ProtocolError;
            }
            break;
        default:
            return Error::ProtocolError;
    }

    const Error err = run_on_io_([this, &frame](Completion done) {
        start_write_(frame, std::move(done));
    });
    if (err == Error::None) {
        WL_TRACE("[WS] Wrote " << frame.type << " frame (" << frame.payload.size() << " bytes)");
    }
    return err;
}

void WebSocket::start_write_(const Frame& frame, Completion done) {
    if (closed_.load(std::memory_order_acquire)) {
        done(Error::InvalidState);
        return;
    }
    auto on_written = [this, type = frame.type, done = std::move(done)](const boost::system::error_code& ec) {
        if (ec) {
            WL_DEBUG("[WS] Write of " << type << " frame failed (" << ec.message() << ")");
            done(classify_io_error_(ec));
            return;
        }
        done(Error::None);
    };
    if (wss_) {
        async_write_frame(*wss_, frame, std::move(on_written));
    }
    else {
        async_write_frame(*ws_, frame, std::move(on_written));
    }
}

Error WebSocket::read(Frame& out) {
    if (!io_thread_.joinable()) {
        return Error::LocalShutdown;
    }
    return run_on_io_([this, &out](Completion done) {
        start_read_(out, std::move(done));
    });
}

void WebSocket::start_read_(Frame& out, Completion done) {
    if (!inbox_.empty()) {
        out = std::move(inbox_.front());
        inbox_.pop_front();
        done(Error::None);
        return;
    }
    if (remote_closed_) {
        done(Error::RemoteClosed);
        return;
    }
    if (closed_.load(std::memory_order_acquire)) {
        done(Error::LocalShutdown);
        return;
    }
    auto on_read = [this, &out, done = std::move(done)](const boost::system::error_code& ec, std::size_t) {
        on_read_(ec, out, done);
    };
    if (wss_) {
        wss_->async_read(rx_buffer_, std::move(on_read));
    }
    else {
        ws_->async_read(rx_buffer_, std::move(on_read));
    }
}

void WebSocket::on_read_(const boost::system::error_code& ec, Frame& out, const Completion& done) {
    if (ec == websocket::error::closed) {
        WL_INFO("[WS] Connection closed by peer");
        remote_closed_ = true;
        out = Frame::close();
        done(Error::None);
        return;
    }
    if (ec) {
        WL_DEBUG("[WS] Read failed (" << ec.message() << ")");
        done(classify_io_error_(ec));
        return;
    }
    const bool text = wss_ ? wss_->got_text() : ws_->got_text();
    const auto data = rx_buffer_.cdata();
    const auto* first = static_cast<const std::uint8_t*>(data.data());
    Frame frame{text ? FrameType::Text : FrameType::Binary, Bytes(first, first + data.size())};
    rx_buffer_.consume(rx_buffer_.size());
    if (!inbox_.empty()) {
        // Control frames seen while waiting arrived before this message
        inbox_.push_back(std::move(frame));
        out = std::move(inbox_.front());
        inbox_.pop_front();
    }
    else {
        out = std::move(frame);
    }
    done(Error::None);
}

Error WebSocket::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return Error::None;
    }
    if (!ws_ && !wss_) {
        return Error::None;
    }
    if (!io_thread_.joinable()) {
        return shutdown_socket_();
    }
    return run_on_io_([this](Completion done) {
        done(shutdown_socket_());
    });
}

Error WebSocket::shutdown_socket_() {
    // Beast tears the socket down itself after a completed close handshake
    if (!socket_().is_open()) {
        WL_TRACE("[WS] WebSocket closed.");
        return Error::None;
    }
    // Pending async operations complete with operation_aborted
    boost::system::error_code ec;
    socket_().shutdown(tcp::socket::shutdown_both, ec);
    const bool failed = ec && ec != net::error::not_connected;
    if (failed) {
        WL_DEBUG("[WS] Socket shutdown reported " << ec.message());
    }
    socket_().close(ec);
    if (failed) {
        return Error::TransportFailure;
    }
    WL_TRACE("[WS] WebSocket closed.");
    return Error::None;
}

Error WebSocket::classify_io_error_(const boost::system::error_code& ec) const {
    if (closed_.load(std::memory_order_acquire)) {
        return Error::LocalShutdown;
    }
    if (ec == websocket::error::closed || ec == net::error::eof ||
        ec == ssl::error::stream_truncated || ec == net::error::connection_reset) {
        return Error::RemoteClosed;
    }
    if (ec == boost::beast::error::timeout || ec == net::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == websocket::condition::protocol_violation) {
        return Error::ProtocolError;
    }
    if (ec == net::error::operation_aborted) {
        return Error::Cancelled;
    }
    return Error::TransportFailure;
}


// ============================================================================
// Transport
// ============================================================================

Error Transport::open(const std::string& address, std::unique_ptr<WebSocket>& out) {
    ParsedUrl url;
    if (parse_url(address, url) != Error::None) {
        WL_ERROR("[WS] Invalid URL: " << address);
        return Error::InvalidUrl;
    }
    auto ws = std::make_unique<WebSocket>();
    const Error err = ws->open_(url, user_agent_);
    if (err != Error::None) {
        return err;
    }
    out = std::move(ws);
    return Error::None;
}

} // namespace wirelink::core::transport::beast

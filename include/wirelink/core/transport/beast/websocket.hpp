#pragma once

/*
===============================================================================
 wirelink::core::transport::beast
===============================================================================

Boost.Beast implementation of the transport boundary.

  • Transport  - stateless factory: parse_url, resolve, TCP connect,
                 TLS handshake with SNI (wss), WebSocket upgrade.
  • WebSocket  - one established stream, satisfying HandleConcept.

Threading model:

  • Every established WebSocket owns an io_context run by one private I/O
    thread. All stream operations (async_read, async_write, async_ping,
    async_pong, async_close, socket shutdown) are initiated on that thread.
  • write() and read() are blocking facades: they post the operation to the
    I/O thread and wait for its completion. One read() and one write() may
    be in progress at the same time from different threads; callers issue
    at most one write() at a time.
  • Pongs that Beast sends automatically while a read is pending go through
    the stream's own write ordering, so they never interleave with frames
    written by write().
  • close() may be called from any thread. It shuts the socket down on the
    I/O thread, which fails any pending read() or write() with
    LocalShutdown.
  • Pings received during read() are answered by Beast and surfaced to the
    caller as Ping frames on the following read() calls; pongs likewise.

Beast's own keep-alive pings are disabled: liveness is driven by the session
layer's scheduler.
===============================================================================
*/

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "wirelink/core/transport/concepts.hpp"
#include "wirelink/core/transport/error.hpp"
#include "wirelink/core/transport/frame.hpp"
#include "wirelink/core/transport/parse_url.hpp"


namespace wirelink::core::transport::beast {

class Transport;

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Sends exactly one frame (Binary, Text, Ping, Pong or Close).
    // Ping / pong payloads above 125 bytes are rejected with ProtocolError.
    [[nodiscard]]
    Error write(const Frame& frame);

    // Blocks until one frame is available
    [[nodiscard]]
    Error read(Frame& out);

    // Idempotent, callable from any thread
    Error close();

    [[nodiscard]]
    bool is_secure() const noexcept { return static_cast<bool>(wss_); }

    [[nodiscard]]
    bool is_open() const noexcept { return !closed_.load(std::memory_order_acquire); }

private:
    friend class Transport;

    using tcp = boost::asio::ip::tcp;
    using plain_stream = boost::beast::websocket::stream<tcp::socket>;
    using tls_stream = boost::beast::websocket::stream<boost::asio::ssl::stream<tcp::socket>>;
    using work_guard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    using Completion = std::function<void(Error)>;

    [[nodiscard]]
    Error open_(const ParsedUrl& url, const std::string& user_agent);

    // Runs start(done) on the I/O thread and blocks until done(err) is called
    [[nodiscard]]
    Error run_on_io_(std::function<void(Completion)> start);

    // I/O thread only
    void start_write_(const Frame& frame, Completion done);
    void start_read_(Frame& out, Completion done);
    void on_read_(const boost::system::error_code& ec, Frame& out, const Completion& done);
    Error shutdown_socket_();

    // Maps a read/write failure to the transport taxonomy
    [[nodiscard]]
    Error classify_io_error_(const boost::system::error_code& ec) const;

    void install_control_callback_();

    tcp::socket& socket_() noexcept;

private:
    boost::asio::io_context ioc_;
    std::optional<work_guard> work_;
    std::thread io_thread_;

    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<plain_stream> ws_;
    std::unique_ptr<tls_stream> wss_;

    // I/O thread only
    boost::beast::flat_buffer rx_buffer_;
    std::deque<Frame> inbox_;          // control frames observed while reading
    bool remote_closed_{false};

    std::atomic<bool> closed_{false};
};


class Transport {
public:
    using handle_type = WebSocket;

    Transport() = default;

    explicit Transport(std::string user_agent)
        : user_agent_(std::move(user_agent))
    {}

    // Opens a new WebSocket towards `address` (ws:// or wss://)
    [[nodiscard]]
    Error open(const std::string& address, std::unique_ptr<WebSocket>& out);

private:
    std::string user_agent_{"wirelink/1.0"};
};

static_assert(HandleConcept<WebSocket>);
static_assert(TransportConcept<Transport>);

} // namespace wirelink::core::transport::beast

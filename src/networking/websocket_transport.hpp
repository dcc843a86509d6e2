#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include "../core/configuration.hpp"
#include "transport.hpp"

namespace dex_stream::networking {

namespace http = beast::http;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

// Rotated per connection attempt
inline constexpr std::array<std::string_view, 3> kUserAgents{
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:142.0) Gecko/20100101 Firefox/142.0",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:142.0) Gecko/20100101 Firefox/142.0",
    "Mozilla/5.0 (X11; Linux x86_64; rv:142.0) Gecko/20100101 Firefox/142.0"};

// Configuration for the WebSocket transport
struct WebSocketConfig {
    std::string host;
    std::string port;
    std::string origin;
    bool use_ssl = true;

    // Timeouts in milliseconds
    uint32_t connect_timeout_ms = 10000;
    uint32_t handshake_timeout_ms = 10000;

    // Pair frames are a few hundred KB at most
    static constexpr size_t MAX_MESSAGE_SIZE = 8 * 1024 * 1024;

    static WebSocketConfig from(const core::ConnectionConfig& config) {
        WebSocketConfig ws;
        ws.host = config.host;
        ws.port = config.port;
        ws.origin = config.origin;
        ws.use_ssl = config.use_ssl;
        ws.connect_timeout_ms = config.connect_timeout_ms;
        ws.handshake_timeout_ms = config.handshake_timeout_ms;
        return ws;
    }
};

/**
 * Boost.Beast WebSocket transport, TLS or plain
 *
 * One stream per connection attempt; the previous stream is dropped when
 * connect() is called again. Handshake headers mimic a desktop browser.
 * Satisfies TransportLike.
 */
class WebSocketTransport {
  public:
    WebSocketTransport(asio::io_context& io_context, ssl::context& ssl_context, WebSocketConfig config)
        : io_context_(io_context), ssl_context_(ssl_context), config_(std::move(config)), resolver_(io_context) {}

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    asio::awaitable<boost::system::error_code> connect(const std::string& target) {
        close();
        ws_.reset();
        ws_plain_.reset();

        boost::system::error_code ec;

        // Resolve host
        auto results = co_await resolver_.async_resolve(
            config_.host, config_.port, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return ec;
        }

        const std::string_view user_agent = kUserAgents[attempts_++ % kUserAgents.size()];

        // Streams are installed before connecting so close() can abort an attempt in flight
        if (config_.use_ssl) {
            ws_ = std::make_unique<TlsStream>(io_context_, ssl_context_);
            ec = co_await connect_tls(*ws_, results, target, user_agent);
            if (ec) {
                ws_.reset();
            }
        } else {
            ws_plain_ = std::make_unique<PlainStream>(io_context_);
            ec = co_await connect_tcp(*ws_plain_, results);
            if (!ec) {
                ec = co_await websocket_handshake(*ws_plain_, target, user_agent);
            }
            if (ec) {
                ws_plain_.reset();
            }
        }

        co_return ec;
    }

    asio::awaitable<boost::system::error_code> read(beast::flat_buffer& buffer) {
        if (ws_) {
            co_return co_await read_from(*ws_, buffer);
        }
        if (ws_plain_) {
            co_return co_await read_from(*ws_plain_, buffer);
        }
        co_return boost::system::error_code(asio::error::not_connected);
    }

    asio::awaitable<boost::system::error_code> write(std::string_view message) {
        if (ws_) {
            co_return co_await write_to(*ws_, message);
        }
        if (ws_plain_) {
            co_return co_await write_to(*ws_plain_, message);
        }
        co_return boost::system::error_code(asio::error::not_connected);
    }

    asio::awaitable<boost::system::error_code> ping() {
        boost::system::error_code ec(asio::error::not_connected);
        websocket::ping_data payload = {};

        if (ws_) {
            co_await ws_->async_ping(payload, asio::redirect_error(asio::use_awaitable, ec));
        } else if (ws_plain_) {
            co_await ws_plain_->async_ping(payload, asio::redirect_error(asio::use_awaitable, ec));
        }
        co_return ec;
    }

    void set_pong_handler(std::function<void()> handler) {
        pong_handler_ = std::move(handler);
    }

    // Abortive close of the underlying socket; pending operations fail
    void close() {
        resolver_.cancel();
        if (ws_) {
            beast::get_lowest_layer(*ws_).close();
        }
        if (ws_plain_) {
            beast::get_lowest_layer(*ws_plain_).close();
        }
    }

    [[nodiscard]] bool is_open() const noexcept {
        return (ws_ && ws_->is_open()) || (ws_plain_ && ws_plain_->is_open());
    }

    [[nodiscard]] const WebSocketConfig& config() const noexcept {
        return config_;
    }

  private:
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using PlainStream = websocket::stream<beast::tcp_stream>;

    template <typename Stream>
    asio::awaitable<boost::system::error_code> connect_tcp(Stream& stream, const tcp::resolver::results_type& results) {
        boost::system::error_code ec;
        auto& socket = beast::get_lowest_layer(stream);
        socket.expires_after(std::chrono::milliseconds(config_.connect_timeout_ms));
        co_await socket.async_connect(results, asio::redirect_error(asio::use_awaitable, ec));
        co_return ec;
    }

    asio::awaitable<boost::system::error_code> connect_tls(TlsStream& stream,
                                                           const tcp::resolver::results_type& results,
                                                           const std::string& target,
                                                           std::string_view user_agent) {
        // SNI and certificate host check
        if (!SSL_set_tlsext_host_name(stream.next_layer().native_handle(), config_.host.c_str())) {
            co_return boost::system::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        }
        stream.next_layer().set_verify_callback(ssl::host_name_verification(config_.host));

        auto ec = co_await connect_tcp(stream, results);
        if (ec) {
            co_return ec;
        }

        // SSL handshake
        beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(config_.handshake_timeout_ms));
        co_await stream.next_layer().async_handshake(ssl::stream_base::client,
                                                     asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return ec;
        }

        co_return co_await websocket_handshake(stream, target, user_agent);
    }

    template <typename Stream>
    asio::awaitable<boost::system::error_code> websocket_handshake(Stream& stream,
                                                                   const std::string& target,
                                                                   std::string_view user_agent) {
        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(stream).expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = std::chrono::milliseconds(config_.handshake_timeout_ms);
        stream.set_option(timeouts);

        websocket::permessage_deflate deflate;
        deflate.client_enable = true;
        stream.set_option(deflate);

        stream.set_option(websocket::stream_base::decorator(
            [user_agent = std::string(user_agent), origin = config_.origin](websocket::request_type& req) {
                req.set(http::field::user_agent, user_agent);
                req.set(http::field::origin, origin);
                req.set(http::field::accept, "*/*");
                req.set(http::field::accept_language, "en-GB,en;q=0.5");
                req.set(http::field::cache_control, "no-cache");
                req.set(http::field::pragma, "no-cache");
            }));

        stream.read_message_max(WebSocketConfig::MAX_MESSAGE_SIZE);

        stream.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong && pong_handler_) {
                pong_handler_();
            }
        });

        boost::system::error_code ec;
        co_await stream.async_handshake(config_.host, target, asio::redirect_error(asio::use_awaitable, ec));
        co_return ec;
    }

    template <typename Stream>
    asio::awaitable<boost::system::error_code> read_from(Stream& stream, beast::flat_buffer& buffer) {
        boost::system::error_code ec;
        co_await stream.async_read(buffer, asio::redirect_error(asio::use_awaitable, ec));
        co_return ec;
    }

    template <typename Stream>
    asio::awaitable<boost::system::error_code> write_to(Stream& stream, std::string_view message) {
        boost::system::error_code ec;
        stream.text(true);
        co_await stream.async_write(asio::buffer(message.data(), message.size()),
                                    asio::redirect_error(asio::use_awaitable, ec));
        co_return ec;
    }

    asio::io_context& io_context_;
    ssl::context& ssl_context_;
    WebSocketConfig config_;

    tcp::resolver resolver_;

    // WebSocket streams, at most one is set
    std::unique_ptr<TlsStream> ws_;
    std::unique_ptr<PlainStream> ws_plain_;

    std::function<void()> pong_handler_;
    uint32_t attempts_ = 0;
};

static_assert(TransportLike<WebSocketTransport>);

}  // namespace dex_stream::networking

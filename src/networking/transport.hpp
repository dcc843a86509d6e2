#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/system/error_code.hpp>

namespace dex_stream::networking {

namespace asio = boost::asio;
namespace beast = boost::beast;

/**
 * @brief Message-oriented duplex connection driven by the connection manager
 *
 * Every operation reports failure through the returned error_code and never
 * throws. read() appends exactly one complete message to the buffer. close()
 * is synchronous and makes any pending operation complete with an error; it
 * is safe to call when already closed. The pong handler is invoked from the
 * transport's executor whenever a heartbeat acknowledgment arrives.
 */
template <typename T>
concept TransportLike = requires(T transport,
                                 const std::string& target,
                                 beast::flat_buffer& buffer,
                                 std::string_view message,
                                 std::function<void()> on_pong) {
    { transport.connect(target) } -> std::same_as<asio::awaitable<boost::system::error_code>>;
    { transport.read(buffer) } -> std::same_as<asio::awaitable<boost::system::error_code>>;
    { transport.write(message) } -> std::same_as<asio::awaitable<boost::system::error_code>>;
    { transport.ping() } -> std::same_as<asio::awaitable<boost::system::error_code>>;
    transport.set_pong_handler(std::move(on_pong));
    transport.close();
};

}  // namespace dex_stream::networking

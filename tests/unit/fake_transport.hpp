#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/error.hpp>

#include "frame_builder.hpp"
#include "networking/transport.hpp"

namespace dex_stream::test_support {

namespace asio = boost::asio;
namespace beast = boost::beast;

/**
 * Scripted in-process transport
 *
 * connect() consumes connect_results in order, then returns default_result.
 * Each successful connect opens a session fed from the matching entry of
 * sessions. Once a session's frames are read the peer closes, unless
 * hold_open is set, in which case read() blocks until close(). The first
 * stalled_connects attempts hang until close(), like an unanswered DNS query
 * or SYN.
 */
class FakeTransport {
  public:
    explicit FakeTransport(asio::io_context& io_context) : io_context_(io_context), read_timer_(io_context) {}

    asio::awaitable<boost::system::error_code> connect(const std::string& target) {
        targets.push_back(target);

        if (stalled_connects > 0) {
            --stalled_connects;
            boost::system::error_code ec;
            read_timer_.expires_at(asio::steady_timer::time_point::max());
            co_await read_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            co_return boost::system::error_code(asio::error::operation_aborted);
        }

        boost::system::error_code ec = default_result;
        if (!connect_results.empty()) {
            ec = connect_results.front();
            connect_results.pop_front();
        }
        if (!ec) {
            open_ = true;
            pending_.clear();
            if (session_count < sessions.size()) {
                pending_.assign(sessions[session_count].begin(), sessions[session_count].end());
            }
            ++session_count;
        }
        co_return ec;
    }

    asio::awaitable<boost::system::error_code> read(beast::flat_buffer& buffer) {
        if (!open_) {
            co_return boost::system::error_code(asio::error::not_connected);
        }
        if (!pending_.empty()) {
            const Bytes frame = std::move(pending_.front());
            pending_.pop_front();
            buffer.commit(asio::buffer_copy(buffer.prepare(frame.size()), asio::buffer(frame)));
            co_return boost::system::error_code{};
        }
        if (!hold_open) {
            open_ = false;
            co_return boost::system::error_code(beast::websocket::error::closed);
        }

        boost::system::error_code ec;
        read_timer_.expires_at(asio::steady_timer::time_point::max());
        co_await read_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        co_return boost::system::error_code(asio::error::operation_aborted);
    }

    asio::awaitable<boost::system::error_code> write(std::string_view message) {
        if (!open_) {
            co_return boost::system::error_code(asio::error::not_connected);
        }
        written.emplace_back(message);
        co_return boost::system::error_code{};
    }

    asio::awaitable<boost::system::error_code> ping() {
        ++pings;
        if (!open_) {
            co_return boost::system::error_code(asio::error::not_connected);
        }
        if (answer_pings) {
            asio::post(io_context_, [this] {
                if (open_ && pong_handler_) {
                    pong_handler_();
                }
            });
        }
        co_return boost::system::error_code{};
    }

    void set_pong_handler(std::function<void()> handler) {
        pong_handler_ = std::move(handler);
    }

    void close() {
        open_ = false;
        ++close_calls;
        read_timer_.cancel();
    }

    [[nodiscard]] bool is_open() const noexcept {
        return open_;
    }

    [[nodiscard]] bool has_pong_handler() const noexcept {
        return static_cast<bool>(pong_handler_);
    }

    // Script
    std::deque<boost::system::error_code> connect_results;
    boost::system::error_code default_result;
    std::size_t stalled_connects = 0;
    std::vector<std::vector<Bytes>> sessions;
    bool hold_open = false;
    bool answer_pings = true;

    // Observations
    std::vector<std::string> targets;
    std::vector<std::string> written;
    std::size_t session_count = 0;
    std::size_t pings = 0;
    std::size_t close_calls = 0;

  private:
    asio::io_context& io_context_;
    asio::steady_timer read_timer_;
    std::deque<Bytes> pending_;
    std::function<void()> pong_handler_;
    bool open_ = false;
};

static_assert(networking::TransportLike<FakeTransport>);

inline boost::system::error_code connection_refused() {
    return boost::system::error_code(asio::error::connection_refused);
}

}  // namespace dex_stream::test_support

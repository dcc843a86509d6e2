#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include "../core/configuration.hpp"
#include "../core/frame.hpp"
#include "../core/records.hpp"
#include "../parsing/message_decoder.hpp"
#include "rate_limiter.hpp"
#include "reconnect_backoff.hpp"
#include "transport.hpp"

namespace dex_stream::networking {

enum class ConnectionState : uint8_t { DISCONNECTED = 0, CONNECTING = 1, CONNECTED = 2, BACKOFF = 3 };

// How run() ended
enum class StreamStatus : uint8_t {
    STOPPED = 0,          // stop() was requested
    RETRY_EXHAUSTED = 1,  // max_retries spent without reaching CONNECTED
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::DISCONNECTED:
            return "Disconnected";
        case ConnectionState::CONNECTING:
            return "Connecting";
        case ConnectionState::CONNECTED:
            return "Connected";
        case ConnectionState::BACKOFF:
            return "Backoff";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view to_string(StreamStatus status) noexcept {
    return status == StreamStatus::STOPPED ? "Stopped" : "RetryExhausted";
}

struct ConnectionStats {
    std::atomic<uint64_t> frames_received{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> records_decoded{0};
    std::atomic<uint64_t> chunks_skipped{0};
    std::atomic<uint64_t> frames_rejected{0};
    std::atomic<uint64_t> messages_sent{0};
    std::atomic<uint64_t> connect_attempts{0};
    std::atomic<uint64_t> reconnects{0};
    std::atomic<uint64_t> connection_errors{0};
    std::atomic<uint64_t> heartbeat_timeouts{0};
};

// Receives every decoded frame's outcomes; the frame view dies after the call
using OutcomeHandler = std::function<void(std::vector<core::DecodeOutcome>&&, const core::Frame&)>;

/**
 * Keeps one upstream stream alive and feeds its frames to the decoder
 *
 * State machine, driven by a single coroutine on the io_context:
 *
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> (failure) BACKOFF -> CONNECTING ...
 *
 * - A failed connect, a read error, an abrupt close or a missed pong moves
 *   to BACKOFF. The wait grows with the attempt counter, which resets on
 *   every CONNECTED.
 * - At most max_retries consecutive connect attempts fail; the last one
 *   ends run() with RETRY_EXHAUSTED instead of retrying.
 * - An attempt that has not connected within connect_timeout_ms plus
 *   handshake_timeout_ms, name resolution included, is closed and fails.
 * - Connect attempts and outbound messages pass through a token bucket,
 *   independent of the backoff schedule.
 * - stop() may be called from any thread. It is observed between frame
 *   reads and at the top of every wait, never in the middle of a decode.
 *
 * State and the attempt counter are only mutated by the run() coroutine.
 */
template <TransportLike Transport>
class ConnectionManager {
  public:
    using Duration = std::chrono::milliseconds;

    ConnectionManager(asio::io_context& io_context,
                      Transport& transport,
                      const core::ConnectionConfig& config,
                      std::string target,
                      parsing::MessageDecoder decoder,
                      OutcomeHandler handler,
                      std::shared_ptr<spdlog::logger> logger = nullptr,
                      core::DebugConfig debug = {})
        : io_context_(io_context),
          transport_(transport),
          config_(config),
          target_(std::move(target)),
          decoder_(std::move(decoder)),
          handler_(std::move(handler)),
          logger_(logger ? std::move(logger) : spdlog::default_logger()),
          debug_(debug),
          backoff_(config),
          limiter_(config.rate_limit_rps, config.rate_limit_burst),
          wait_timer_(io_context),
          connect_timer_(io_context),
          ping_timer_(io_context),
          pong_timer_(io_context),
          heartbeat_done_(io_context) {}

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Run the state machine until stop() or retry exhaustion
     *
     * Never throws for network failures; those drive BACKOFF. Exceptions
     * thrown by the outcome handler propagate.
     */
    asio::awaitable<StreamStatus> run() {
        backoff_.reset();

        while (!stop_requested_.load(std::memory_order_acquire)) {
            set_state(ConnectionState::CONNECTING);

            if (!co_await throttle()) {
                break;
            }

            stats_.connect_attempts.fetch_add(1, std::memory_order_relaxed);
            auto ec = co_await connect_with_deadline();
            if (stop_requested_.load(std::memory_order_acquire)) {
                break;
            }

            if (ec) {
                stats_.connection_errors.fetch_add(1, std::memory_order_relaxed);
                logger_->warn("[Connection] Connect to {}:{} failed: {}", config_.host, config_.port, ec.message());

                if (backoff_.exhausted()) {
                    logger_->error("[Connection] Giving up after {} attempts", backoff_.attempt() + 1);
                    transport_.close();
                    set_state(ConnectionState::DISCONNECTED);
                    co_return StreamStatus::RETRY_EXHAUSTED;
                }
                if (!co_await wait_backoff()) {
                    break;
                }
                continue;
            }

            if (connected_once_) {
                stats_.reconnects.fetch_add(1, std::memory_order_relaxed);
            }
            connected_once_ = true;
            backoff_.reset();
            set_state(ConnectionState::CONNECTED);
            logger_->info("[Connection] Connected to {}:{}", config_.host, config_.port);

            co_await run_session();

            if (stop_requested_.load(std::memory_order_acquire)) {
                break;
            }
            logger_->warn("[Connection] Connection lost, reconnecting");
            if (!co_await wait_backoff()) {
                break;
            }
        }

        transport_.close();
        set_state(ConnectionState::DISCONNECTED);
        logger_->info("[Connection] Stopped");
        co_return StreamStatus::STOPPED;
    }

    // Request shutdown; run() returns STOPPED within one wait or one frame read
    void stop() {
        if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        asio::post(io_context_, [this] {
            wait_timer_.cancel();
            connect_timer_.cancel();
            ping_timer_.cancel();
            pong_timer_.cancel();
            transport_.close();
        });
    }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    [[nodiscard]] ConnectionState get_state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ConnectionStats& get_stats() const noexcept {
        return stats_;
    }

    [[nodiscard]] const ReconnectBackoff& backoff() const noexcept {
        return backoff_;
    }

  private:
    void set_state(ConnectionState state) noexcept {
        state_.store(state, std::memory_order_release);
    }

    // Cancellable sleep; false if stop() was requested before or during it
    asio::awaitable<bool> wait_for(std::chrono::steady_clock::duration delay) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return false;
        }
        if (delay > std::chrono::steady_clock::duration::zero()) {
            boost::system::error_code ec;
            wait_timer_.expires_after(delay);
            co_await wait_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        co_return !stop_requested_.load(std::memory_order_acquire);
    }

    asio::awaitable<bool> wait_backoff() {
        set_state(ConnectionState::BACKOFF);
        const Duration delay = backoff_.next_wait();
        logger_->warn("[Connection] Retry {}/{} in {} ms", backoff_.attempt(), backoff_.max_retries(), delay.count());
        co_return co_await wait_for(delay);
    }

    // Bound the whole attempt; closing the transport aborts whatever step is in flight
    asio::awaitable<boost::system::error_code> connect_with_deadline() {
        struct Deadline {
            bool settled = false;
            bool fired = false;
        };
        auto deadline = std::make_shared<Deadline>();

        connect_timer_.expires_after(Duration(config_.connect_timeout_ms) + Duration(config_.handshake_timeout_ms));
        connect_timer_.async_wait([this, deadline](const boost::system::error_code& ec) {
            if (!ec && !deadline->settled) {
                deadline->fired = true;
                transport_.close();
            }
        });

        auto ec = co_await transport_.connect(target_);
        deadline->settled = true;
        connect_timer_.cancel();

        if (deadline->fired) {
            co_return boost::system::error_code(asio::error::timed_out);
        }
        co_return ec;
    }

    asio::awaitable<bool> throttle() {
        co_return co_await wait_for(limiter_.reserve());
    }

    asio::awaitable<void> run_session() {
        pong_received_ = true;
        transport_.set_pong_handler([this] {
            pong_received_ = true;
            pong_timer_.cancel();
        });

        if (!co_await send_subscriptions()) {
            transport_.set_pong_handler(nullptr);
            transport_.close();
            co_return;
        }

        session_active_ = true;
        heartbeat_running_ = true;
        heartbeat_done_.expires_at(asio::steady_timer::time_point::max());
        asio::co_spawn(io_context_, heartbeat_loop(), [this](std::exception_ptr error) {
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    logger_->error("[Connection] Heartbeat failed: {}", e.what());
                }
                transport_.close();
            }
            heartbeat_running_ = false;
            heartbeat_done_.cancel();
        });

        // Session cleanup must run even if the outcome handler throws
        std::exception_ptr failure;
        try {
            co_await read_loop();
        } catch (...) {
            failure = std::current_exception();
        }

        session_active_ = false;
        ping_timer_.cancel();
        pong_timer_.cancel();
        transport_.close();

        // The heartbeat references this object; wait for it to unwind
        if (heartbeat_running_) {
            boost::system::error_code ec;
            co_await heartbeat_done_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        transport_.set_pong_handler(nullptr);

        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    asio::awaitable<bool> send_subscriptions() {
        for (const auto& message : config_.subscriptions) {
            if (!co_await throttle()) {
                co_return false;
            }
            auto ec = co_await transport_.write(message);
            if (ec) {
                stats_.connection_errors.fetch_add(1, std::memory_order_relaxed);
                logger_->warn("[Connection] Subscription send failed: {}", ec.message());
                co_return false;
            }
            stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
        }
        co_return true;
    }

    asio::awaitable<void> read_loop() {
        beast::flat_buffer buffer;

        while (!stop_requested_.load(std::memory_order_acquire)) {
            buffer.clear();
            auto ec = co_await transport_.read(buffer);
            if (ec) {
                if (!stop_requested_.load(std::memory_order_acquire)) {
                    stats_.connection_errors.fetch_add(1, std::memory_order_relaxed);
                    logger_->warn("[Connection] Read failed: {}", ec.message());
                }
                co_return;
            }

            const auto data = buffer.cdata();
            core::Frame frame(core::ByteView(static_cast<const uint8_t*>(data.data()), data.size()),
                              core::WallClock::now());
            handle_frame(frame);
        }
    }

    asio::awaitable<void> heartbeat_loop() {
        const Duration ping_interval(config_.ping_interval_ms);
        const Duration pong_timeout(config_.pong_timeout_ms);

        while (session_active_) {
            boost::system::error_code ec;
            ping_timer_.expires_after(ping_interval);
            co_await ping_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (ec || !session_active_) {
                co_return;
            }

            pong_received_ = false;
            ec = co_await transport_.ping();
            if (ec) {
                if (session_active_) {
                    logger_->warn("[Connection] Ping failed: {}", ec.message());
                    transport_.close();
                }
                co_return;
            }

            if (!pong_received_) {
                pong_timer_.expires_after(pong_timeout);
                co_await pong_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }
            // A shutdown cancels the pong wait; that is not a missed pong
            if (!session_active_ || stop_requested_.load(std::memory_order_acquire)) {
                co_return;
            }
            if (!pong_received_) {
                stats_.heartbeat_timeouts.fetch_add(1, std::memory_order_relaxed);
                logger_->warn("[Connection] No pong within {} ms, dropping connection", pong_timeout.count());
                transport_.close();
                co_return;
            }
        }
    }

    void handle_frame(const core::Frame& frame) {
        stats_.frames_received.fetch_add(1, std::memory_order_relaxed);
        stats_.bytes_received.fetch_add(frame.size(), std::memory_order_relaxed);

        auto outcomes = decoder_.decode_message(frame);

        const auto skipped = static_cast<uint64_t>(std::count_if(outcomes.begin(), outcomes.end(), core::is_skip));
        const uint64_t decoded = outcomes.size() - skipped;
        stats_.records_decoded.fetch_add(decoded, std::memory_order_relaxed);
        stats_.chunks_skipped.fetch_add(skipped, std::memory_order_relaxed);

        if (is_rejected(outcomes)) {
            stats_.frames_rejected.fetch_add(1, std::memory_order_relaxed);
            log_rejected(frame);
        } else if (debug_.verbose_logging) {
            logger_->info("[Connection] Frame of {} bytes: {} records, {} skipped", frame.size(), decoded, skipped);
        }

        handler_(std::move(outcomes), frame);
    }

    static bool is_rejected(const std::vector<core::DecodeOutcome>& outcomes) noexcept {
        if (outcomes.size() != 1) {
            return false;
        }
        const auto* skip = std::get_if<core::Skip>(&outcomes.front());
        return skip && skip->reason == core::DecodeError::UNRECOGNIZED_FRAME;
    }

    void log_rejected(const core::Frame& frame) const {
        const auto level = debug_.verbose_logging ? spdlog::level::warn : spdlog::level::debug;
        logger_->log(level, "[Connection] Rejected unrecognized frame of {} bytes", frame.size());

        if (debug_.dump_rejected_frames) {
            const auto head = frame.bytes.first(std::min<std::size_t>(frame.size(), 64));
            logger_->warn("[Connection] Rejected frame head: {}", spdlog::to_hex(head.begin(), head.end()));
        }
    }

    asio::io_context& io_context_;
    Transport& transport_;
    core::ConnectionConfig config_;
    std::string target_;
    parsing::MessageDecoder decoder_;
    OutcomeHandler handler_;
    std::shared_ptr<spdlog::logger> logger_;
    core::DebugConfig debug_;

    // Owned by the run() coroutine
    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
    ReconnectBackoff backoff_;
    TokenBucket limiter_;
    bool connected_once_ = false;

    // Session flags, only touched on the io_context thread
    bool session_active_ = false;
    bool heartbeat_running_ = false;
    bool pong_received_ = true;

    std::atomic<bool> stop_requested_{false};

    // Timers
    asio::steady_timer wait_timer_;
    asio::steady_timer connect_timer_;
    asio::steady_timer ping_timer_;
    asio::steady_timer pong_timer_;
    asio::steady_timer heartbeat_done_;

    ConnectionStats stats_;
};

}  // namespace dex_stream::networking

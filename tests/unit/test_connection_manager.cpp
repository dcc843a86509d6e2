#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "fake_transport.hpp"
#include "frame_builder.hpp"
#include "networking/connection_manager.hpp"

using namespace dex_stream;
using namespace dex_stream::networking;
using namespace dex_stream::test_support;
using namespace std::chrono_literals;

class ConnectionManagerTest : public ::testing::Test {
  protected:
    using Manager = ConnectionManager<FakeTransport>;

    void SetUp() override {
        config_.initial_delay_ms = 1;
        config_.backoff_base = 2.0;
        config_.max_delay_ms = 4;
        config_.max_retries = 5;
        config_.rate_limit_rps = 10000.0;
        config_.rate_limit_burst = 100;
        config_.ping_interval_ms = 1000;
        config_.pong_timeout_ms = 1000;

        logger_ = std::make_shared<spdlog::logger>("connection_test", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    Manager& make_manager(OutcomeHandler handler = nullptr) {
        if (!handler) {
            handler = [this](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame&) {
                for (auto& outcome : outcomes) {
                    received_.push_back(std::move(outcome));
                }
            };
        }
        manager_ = std::make_unique<Manager>(
            io_, transport_, config_, "/target", parsing::MessageDecoder({}, logger_), std::move(handler), logger_, debug_);
        return *manager_;
    }

    // Drive run() to completion; failure_ holds anything it threw
    std::optional<StreamStatus> run(std::chrono::milliseconds limit = 5s) {
        std::optional<StreamStatus> result;
        boost::asio::co_spawn(io_, manager_->run(), [&](std::exception_ptr error, StreamStatus status) {
            failure_ = error;
            result = status;
        });
        io_.run_for(limit);
        return result;
    }

    // Stop the manager after delay, from a timer on the same io_context
    void stop_after(std::chrono::milliseconds delay) {
        stop_timer_.expires_after(delay);
        stop_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (!ec) {
                manager_->stop();
            }
        });
    }

    boost::asio::io_context io_;
    FakeTransport transport_{io_};
    boost::asio::steady_timer stop_timer_{io_};
    core::ConnectionConfig config_;
    core::DebugConfig debug_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<Manager> manager_;
    std::vector<core::DecodeOutcome> received_;
    std::exception_ptr failure_;
};

TEST_F(ConnectionManagerTest, StartsDisconnected) {
    auto& manager = make_manager();
    EXPECT_EQ(manager.get_state(), ConnectionState::DISCONNECTED);
    EXPECT_FALSE(manager.stop_requested());
}

TEST_F(ConnectionManagerTest, ConnectsAfterFailedAttemptsWithinRetryBudget) {
    transport_.connect_results = {connection_refused(), connection_refused(), connection_refused()};
    transport_.sessions = {{pairs_frame({PairFixture{}})}};

    std::optional<ConnectionState> state_on_frame;
    std::optional<uint32_t> attempt_on_frame;
    make_manager([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame&) {
        state_on_frame = manager_->get_state();
        attempt_on_frame = manager_->backoff().attempt();
        received_ = std::move(outcomes);
        manager_->stop();
    });

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(failure_);
    EXPECT_EQ(*status, StreamStatus::STOPPED);

    EXPECT_EQ(state_on_frame, ConnectionState::CONNECTED);
    EXPECT_EQ(attempt_on_frame, 0u);
    EXPECT_EQ(transport_.targets.size(), 4);
    EXPECT_EQ(transport_.targets.back(), "/target");

    const auto& stats = manager_->get_stats();
    EXPECT_EQ(stats.connect_attempts.load(), 4);
    EXPECT_EQ(stats.connection_errors.load(), 3);
    EXPECT_EQ(stats.frames_received.load(), 1);
    EXPECT_EQ(stats.records_decoded.load(), 1);
    ASSERT_EQ(received_.size(), 1);
    EXPECT_TRUE(std::holds_alternative<core::TradingPairRecord>(received_[0]));
    EXPECT_EQ(manager_->get_state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, RetryExhaustedWhenUpstreamUnreachable) {
    config_.max_retries = 3;
    transport_.default_result = connection_refused();
    make_manager();

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::RETRY_EXHAUSTED);

    // max_retries counts attempts, the first one included
    EXPECT_EQ(manager_->get_stats().connect_attempts.load(), 3);
    EXPECT_EQ(manager_->get_stats().connection_errors.load(), 3);
    EXPECT_EQ(manager_->backoff().attempt(), 2);
    EXPECT_EQ(manager_->get_state(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(transport_.session_count, 0);
}

TEST_F(ConnectionManagerTest, SingleAttemptBudget) {
    config_.max_retries = 1;
    transport_.default_result = connection_refused();
    make_manager();

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::RETRY_EXHAUSTED);
    EXPECT_EQ(manager_->get_stats().connect_attempts.load(), 1);
}

TEST_F(ConnectionManagerTest, ConnectResetsRetryBudget) {
    config_.max_retries = 3;
    transport_.connect_results = {connection_refused(), connection_refused(), {}};
    transport_.default_result = connection_refused();
    make_manager();

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::RETRY_EXHAUSTED);

    // Two failures, a short-lived session, then a fresh budget of three
    // where the wait after the lost session already counts as one
    EXPECT_EQ(manager_->get_stats().connect_attempts.load(), 5);
    EXPECT_EQ(transport_.session_count, 1);
}

TEST_F(ConnectionManagerTest, ReconnectsAfterConnectionLoss) {
    config_.subscriptions = {"sub-a", "sub-b"};
    transport_.sessions = {{pairs_frame({PairFixture{}})}, {pairs_frame({PairFixture{}, PairFixture{}})}};

    std::size_t frames = 0;
    make_manager([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame&) {
        for (auto& outcome : outcomes) {
            received_.push_back(std::move(outcome));
        }
        if (++frames == 2) {
            manager_->stop();
        }
    });

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_EQ(received_.size(), 3);

    const auto& stats = manager_->get_stats();
    EXPECT_EQ(stats.reconnects.load(), 1);
    EXPECT_EQ(stats.messages_sent.load(), 4);
    ASSERT_EQ(transport_.written.size(), 4);
    EXPECT_EQ(transport_.written[0], "sub-a");
    EXPECT_EQ(transport_.written[1], "sub-b");
    EXPECT_EQ(transport_.written[2], "sub-a");
}

TEST_F(ConnectionManagerTest, RejectedFramesAreCountedAndForwarded) {
    debug_.dump_rejected_frames = true;
    debug_.verbose_logging = true;
    transport_.sessions = {{Bytes{'h', 'e', 'l', 'l', 'o'}, pairs_frame({PairFixture{}})}};

    std::size_t frames = 0;
    make_manager([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame& frame) {
        EXPECT_FALSE(frame.empty());
        for (auto& outcome : outcomes) {
            received_.push_back(std::move(outcome));
        }
        if (++frames == 2) {
            manager_->stop();
        }
    });

    auto status = run();
    ASSERT_TRUE(status.has_value());

    const auto& stats = manager_->get_stats();
    EXPECT_EQ(stats.frames_received.load(), 2);
    EXPECT_EQ(stats.frames_rejected.load(), 1);
    EXPECT_EQ(stats.chunks_skipped.load(), 1);
    EXPECT_EQ(stats.records_decoded.load(), 1);
    ASSERT_EQ(received_.size(), 2);
    ASSERT_TRUE(core::is_skip(received_[0]));
    EXPECT_EQ(std::get<core::Skip>(received_[0]).reason, core::DecodeError::UNRECOGNIZED_FRAME);
}

TEST_F(ConnectionManagerTest, StopBeforeRunNeverConnects) {
    make_manager();
    manager_->stop();

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_TRUE(transport_.targets.empty());
}

TEST_F(ConnectionManagerTest, StopInterruptsBackoffWait) {
    config_.initial_delay_ms = 60000;
    config_.max_delay_ms = 60000;
    transport_.default_result = connection_refused();
    make_manager();
    stop_after(20ms);

    const auto started = std::chrono::steady_clock::now();
    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(manager_->get_stats().connect_attempts.load(), 1);
}

TEST_F(ConnectionManagerTest, StopInterruptsIdleSession) {
    transport_.hold_open = true;
    make_manager();
    stop_after(20ms);

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_EQ(transport_.session_count, 1);
    EXPECT_FALSE(transport_.is_open());
}

TEST_F(ConnectionManagerTest, AnsweredPingsKeepSessionAlive) {
    config_.ping_interval_ms = 5;
    config_.pong_timeout_ms = 100;
    transport_.hold_open = true;
    transport_.answer_pings = true;
    make_manager();
    stop_after(100ms);

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_GE(transport_.pings, 3);
    EXPECT_EQ(manager_->get_stats().heartbeat_timeouts.load(), 0);
    EXPECT_EQ(transport_.session_count, 1);
}

TEST_F(ConnectionManagerTest, MissedPongDropsAndReconnects) {
    config_.ping_interval_ms = 5;
    config_.pong_timeout_ms = 10;
    transport_.hold_open = true;
    transport_.answer_pings = false;
    make_manager();
    stop_after(200ms);

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);

    const auto& stats = manager_->get_stats();
    EXPECT_GE(stats.heartbeat_timeouts.load(), 1);
    EXPECT_GE(stats.reconnects.load(), 1);
    EXPECT_GE(transport_.session_count, 2);
}

TEST_F(ConnectionManagerTest, StopDuringPongWaitIsNotMissedPong) {
    config_.ping_interval_ms = 5;
    config_.pong_timeout_ms = 5000;
    transport_.hold_open = true;
    transport_.answer_pings = false;
    make_manager();
    stop_after(50ms);

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_EQ(transport_.pings, 1);
    EXPECT_EQ(manager_->get_stats().heartbeat_timeouts.load(), 0);
    EXPECT_EQ(manager_->get_stats().reconnects.load(), 0);
    EXPECT_EQ(transport_.session_count, 1);
}

TEST_F(ConnectionManagerTest, PongHandlerClearedAfterSession) {
    transport_.hold_open = true;
    transport_.sessions = {{pairs_frame({PairFixture{}})}};

    bool installed_during_session = false;
    make_manager([&](std::vector<core::DecodeOutcome>&&, const core::Frame&) {
        installed_during_session = transport_.has_pong_handler();
        manager_->stop();
    });

    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_TRUE(installed_during_session);
    EXPECT_FALSE(transport_.has_pong_handler());
}

TEST_F(ConnectionManagerTest, StalledConnectTimesOutAndRetries) {
    config_.connect_timeout_ms = 10;
    config_.handshake_timeout_ms = 10;
    transport_.stalled_connects = 1;
    transport_.sessions = {{pairs_frame({PairFixture{}})}};
    make_manager([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame&) {
        received_ = std::move(outcomes);
        manager_->stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto status = run();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, StreamStatus::STOPPED);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    const auto& stats = manager_->get_stats();
    EXPECT_EQ(stats.connect_attempts.load(), 2);
    EXPECT_EQ(stats.connection_errors.load(), 1);
    EXPECT_EQ(transport_.session_count, 1);
    EXPECT_EQ(received_.size(), 1);
}

TEST_F(ConnectionManagerTest, HandlerExceptionPropagatesAfterCleanup) {
    transport_.hold_open = true;
    transport_.sessions = {{pairs_frame({PairFixture{}})}};
    make_manager([](std::vector<core::DecodeOutcome>&&, const core::Frame&) {
        throw std::runtime_error("consumer failed");
    });

    auto status = run();
    ASSERT_TRUE(status.has_value());
    ASSERT_TRUE(failure_);
    EXPECT_THROW(std::rethrow_exception(failure_), std::runtime_error);
    EXPECT_FALSE(transport_.is_open());
}

TEST(ConnectionStateTest, Names) {
    EXPECT_EQ(to_string(ConnectionState::DISCONNECTED), "Disconnected");
    EXPECT_EQ(to_string(ConnectionState::CONNECTING), "Connecting");
    EXPECT_EQ(to_string(ConnectionState::CONNECTED), "Connected");
    EXPECT_EQ(to_string(ConnectionState::BACKOFF), "Backoff");
    EXPECT_EQ(to_string(StreamStatus::RETRY_EXHAUSTED), "RetryExhausted");
}

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "../core/configuration.hpp"
#include "../core/records.hpp"
#include "../networking/connection_manager.hpp"
#include "../parsing/message_decoder.hpp"
#include "record_batch.hpp"
#include "record_filter.hpp"

namespace dex_stream::stream {

namespace asio = boost::asio;

// Everything one stream needs, detached from the Configuration object
struct StreamSettings {
    core::ConnectionConfig connection;
    std::string target;
    core::DecoderConfig decoder;
    core::StreamConfig stream;
    core::DebugConfig debug;

    static StreamSettings from(const core::Configuration& config) {
        StreamSettings settings;
        settings.connection = config.get_connection();
        settings.target = config.get_query().build_target();
        settings.decoder = config.get_decoder();
        settings.stream = config.get_stream();
        settings.debug = config.get_debug();
        return settings;
    }
};

enum class BatchStatus : uint8_t {
    COMPLETED = 0,        // Target count reached
    TIMED_OUT = 1,        // Deadline passed first
    STOPPED = 2,          // stop() was called
    RETRY_EXHAUSTED = 3,  // Upstream unreachable
};

[[nodiscard]] constexpr std::string_view to_string(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::COMPLETED:
            return "Completed";
        case BatchStatus::TIMED_OUT:
            return "TimedOut";
        case BatchStatus::STOPPED:
            return "Stopped";
        case BatchStatus::RETRY_EXHAUSTED:
            return "RetryExhausted";
    }
    return "Unknown";
}

// Records gathered before the call ended, whatever the reason
struct BatchResult {
    std::vector<core::Record> records;
    BatchStatus status{BatchStatus::TIMED_OUT};
};

// Return false to end the stream
using RecordConsumer = std::function<bool(RecordBatch&)>;

struct OrchestratorStats {
    uint64_t batches_emitted{0};
    uint64_t records_emitted{0};
    uint64_t records_filtered{0};
    uint64_t chunks_skipped{0};
};

/**
 * Public entry point: batch or continuous delivery of filtered records
 *
 * Each collect()/stream() call builds a fresh ConnectionManager and drives
 * the io_context until the call ends, so calls must not overlap and the
 * io_context must not be run elsewhere at the same time. stop() may be
 * called from any thread, or from inside the consumer.
 *
 * Example usage:
 * @code
 * StreamOrchestrator<networking::WebSocketTransport> orchestrator(io, transport, StreamSettings::from(config));
 * auto result = orchestrator.collect(50, std::chrono::seconds(30));
 * @endcode
 */
template <typename Transport>
class StreamOrchestrator {
  public:
    using Manager = networking::ConnectionManager<Transport>;

    StreamOrchestrator(asio::io_context& io_context,
                       Transport& transport,
                       StreamSettings settings,
                       std::shared_ptr<spdlog::logger> logger = nullptr)
        : io_context_(io_context),
          transport_(transport),
          settings_(std::move(settings)),
          filter_(settings_.stream),
          logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

    StreamOrchestrator(const StreamOrchestrator&) = delete;
    StreamOrchestrator& operator=(const StreamOrchestrator&) = delete;

    BatchResult collect() {
        return collect(settings_.stream.batch_target, std::chrono::milliseconds(settings_.stream.batch_timeout_ms));
    }

    /**
     * @brief Accumulate filtered records until target or timeout
     *
     * Returns whatever was gathered, with the reason the call ended. Never
     * returns more than target records.
     */
    BatchResult collect(std::size_t target, std::chrono::milliseconds timeout) {
        BatchResult result;
        std::optional<BatchStatus> finished;

        asio::steady_timer deadline(io_context_);
        deadline.expires_after(timeout);

        auto& manager = start([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame& frame) {
            if (finished) {
                return;
            }
            auto batch = accept(std::move(outcomes), frame);
            for (auto& record : batch.records) {
                if (result.records.size() >= target) {
                    break;
                }
                result.records.push_back(std::move(record));
                ++stats_.records_emitted;
            }
            if (result.records.size() >= target) {
                finished = BatchStatus::COMPLETED;
                manager_->stop();
            }
        });

        deadline.async_wait([&](const boost::system::error_code& ec) {
            if (!ec && !finished) {
                logger_->info("[Stream] Batch timed out with {}/{} records", result.records.size(), target);
                finished = BatchStatus::TIMED_OUT;
                manager_->stop();
            }
        });

        const auto status = drive(manager, [&deadline] { deadline.cancel(); });

        if (finished) {
            result.status = *finished;
        } else {
            result.status =
                status == networking::StreamStatus::RETRY_EXHAUSTED ? BatchStatus::RETRY_EXHAUSTED : BatchStatus::STOPPED;
        }
        return result;
    }

    /**
     * @brief Deliver every non-empty filtered batch until stopped
     *
     * Batches larger than max_records_per_batch are split. Returns STOPPED
     * after stop() or a consumer returning false, RETRY_EXHAUSTED when the
     * upstream could not be reached.
     */
    networking::StreamStatus stream(RecordConsumer consumer) {
        auto& manager = start([&](std::vector<core::DecodeOutcome>&& outcomes, const core::Frame& frame) {
            if (manager_->stop_requested()) {
                return;
            }
            auto batch = accept(std::move(outcomes), frame);
            if (batch.empty()) {
                return;
            }
            for (auto& part : split_batch(std::move(batch), settings_.stream.max_records_per_batch)) {
                ++stats_.batches_emitted;
                stats_.records_emitted += part.records.size();
                if (!consumer(part)) {
                    manager_->stop();
                    return;
                }
            }
        });

        return drive(manager, [] {});
    }

    // End the running collect()/stream() call, or the next one if none is running
    void stop() {
        stop_requested_.store(true, std::memory_order_release);
        asio::post(io_context_, [this] {
            if (manager_) {
                manager_->stop();
            }
        });
    }

    [[nodiscard]] const StreamSettings& settings() const noexcept {
        return settings_;
    }

    [[nodiscard]] const OrchestratorStats& get_stats() const noexcept {
        return stats_;
    }

    // Manager of the current or most recent call, null before the first
    [[nodiscard]] const Manager* connection() const noexcept {
        return manager_.get();
    }

  private:
    Manager& start(networking::OutcomeHandler handler) {
        manager_ = std::make_unique<Manager>(io_context_,
                                             transport_,
                                             settings_.connection,
                                             settings_.target,
                                             parsing::MessageDecoder(settings_.decoder, logger_),
                                             std::move(handler),
                                             logger_,
                                             settings_.debug);
        if (stop_requested_.exchange(false, std::memory_order_acq_rel)) {
            manager_->stop();
        }
        return *manager_;
    }

    RecordBatch accept(std::vector<core::DecodeOutcome>&& outcomes, const core::Frame& frame) {
        auto batch = make_batch(std::move(outcomes), filter_, frame.received_at);
        stats_.records_filtered += batch.filtered;
        stats_.chunks_skipped += batch.skipped;
        return batch;
    }

    // Run the manager to completion on the io_context, rethrowing handler failures
    template <typename OnFinish>
    networking::StreamStatus drive(Manager& manager, OnFinish on_finish) {
        std::exception_ptr failure;
        networking::StreamStatus status = networking::StreamStatus::STOPPED;

        asio::co_spawn(io_context_,
                       manager.run(),
                       [&](std::exception_ptr error, networking::StreamStatus run_status) {
                           failure = error;
                           status = run_status;
                           on_finish();
                           // Queue the manager's cleanup ahead of the loop exit
                           manager.stop();
                           asio::post(io_context_, [this] { io_context_.stop(); });
                       });

        io_context_.restart();
        io_context_.run();
        stop_requested_.store(false, std::memory_order_release);

        if (failure) {
            std::rethrow_exception(failure);
        }
        logger_->info("[Stream] Ended: {}", networking::to_string(status));
        return status;
    }

    asio::io_context& io_context_;
    Transport& transport_;
    StreamSettings settings_;
    RecordFilter filter_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unique_ptr<Manager> manager_;
    std::atomic<bool> stop_requested_{false};
    OrchestratorStats stats_;
};

}  // namespace dex_stream::stream

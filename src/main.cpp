#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "core/configuration.hpp"
#include "core/logging.hpp"
#include "networking/websocket_transport.hpp"
#include "stream/stream_orchestrator.hpp"

using namespace dex_stream;

namespace {

std::string describe(const core::Record& record) {
    return std::visit(
        [](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, core::TradingPairRecord>) {
                return fmt::format("{}/{} on {} {} @ ${} liq={} vol={}",
                                   value.base.symbol,
                                   value.quote.symbol,
                                   value.chain,
                                   value.dex,
                                   value.price_usd,
                                   value.liquidity_usd.value_or(0.0),
                                   value.volume_usd.value_or(0.0));
            } else if constexpr (std::is_same_v<T, core::OHLCRecord>) {
                return fmt::format("{} candle t={} o={} h={} l={} c={} v={}",
                                   value.symbol,
                                   value.timestamp,
                                   value.open,
                                   value.high,
                                   value.low,
                                   value.close,
                                   value.volume);
            } else {
                return fmt::format("{} profile ({}) {} websites, {} socials",
                                   value.symbol,
                                   value.name,
                                   value.websites.size(),
                                   value.socials.size());
            }
        },
        record);
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace asio = boost::asio;
    namespace ssl = asio::ssl;

    const std::string config_path = argc > 1 ? argv[1] : "config/dex_stream.toml";
    const bool batch_mode = argc > 2 && std::string_view(argv[2]) == "--batch";

    core::Configuration config;
    std::shared_ptr<spdlog::logger> logger;
    try {
        config.load_from_file(config_path);
        logger = core::make_logger(config.get_system());
    } catch (const std::exception& e) {
        spdlog::error("Startup failed: {}", e.what());
        return EXIT_FAILURE;
    }

    asio::io_context io_context;

    ssl::context ssl_context(ssl::context::tls_client);
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(ssl::verify_peer);

    networking::WebSocketTransport transport(
        io_context, ssl_context, networking::WebSocketConfig::from(config.get_connection()));
    stream::StreamOrchestrator<networking::WebSocketTransport> orchestrator(
        io_context, transport, stream::StreamSettings::from(config), logger);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            logger->info("[Main] Signal {} received, shutting down", signal);
            orchestrator.stop();
        }
    });

    const auto& settings = orchestrator.settings();
    logger->info("[Main] Streaming {}{}", settings.connection.host, settings.target);

    if (batch_mode) {
        auto result = orchestrator.collect();
        logger->info("[Main] Batch {}: {} records", stream::to_string(result.status), result.records.size());
        for (const auto& record : result.records) {
            logger->info("  {}", describe(record));
        }
        return result.status == stream::BatchStatus::RETRY_EXHAUSTED ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    const auto status = orchestrator.stream([&](stream::RecordBatch& batch) {
        logger->info("[Main] Batch: {} records ({} skipped, {} filtered)",
                     batch.records.size(),
                     batch.skipped,
                     batch.filtered);
        for (const auto& record : batch.records) {
            logger->debug("  {}", describe(record));
        }
        return true;
    });

    const auto& stats = orchestrator.get_stats();
    logger->info("[Main] Final stats - Batches: {}, Records: {}, Filtered: {}, Skipped: {}",
                 stats.batches_emitted,
                 stats.records_emitted,
                 stats.records_filtered,
                 stats.chunks_skipped);

    return status == networking::StreamStatus::RETRY_EXHAUSTED ? EXIT_FAILURE : EXIT_SUCCESS;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include "enums.hpp"

namespace dex_stream::core {

/**
 * @brief Logging configuration
 */
struct SystemConfig {
    std::string log_level{"info"};
    std::string log_file;  // Empty = console only

    void validate() const;
};

/**
 * @brief Upstream connection, heartbeat, reconnect and rate-limit settings
 */
struct ConnectionConfig {
    std::string host{"io.dexscreener.com"};
    std::string port{"443"};
    bool use_ssl{true};
    std::string origin{"https://dexscreener.com"};

    // Timeouts (milliseconds)
    uint32_t connect_timeout_ms{10000};
    uint32_t handshake_timeout_ms{10000};

    // Heartbeat
    uint32_t ping_interval_ms{20000};
    uint32_t pong_timeout_ms{30000};

    // Reconnection: delay = initial_delay_ms * backoff_base^attempt, capped
    uint32_t initial_delay_ms{1000};
    double backoff_base{2.0};
    uint32_t max_delay_ms{60000};
    double jitter_ratio{0.0};  // 0.25 = +/-25% applied to each wait
    uint32_t max_retries{5};

    // Outbound gate (connection attempts and sent messages)
    double rate_limit_rps{4.0};
    uint32_t rate_limit_burst{1};

    // Sent verbatim after every successful connect
    std::vector<std::string> subscriptions;

    void validate() const;
};

// Inclusive numeric range; either side may be open
struct Bound {
    std::optional<double> min;
    std::optional<double> max;

    [[nodiscard]] bool empty() const noexcept {
        return !min && !max;
    }
};

/**
 * @brief Server-side screener query, encoded into the WebSocket target
 */
struct QueryConfig {
    Timeframe timeframe{Timeframe::H24};
    RankBy rank_by{RankBy::TRENDING_SCORE_H6};
    SortOrder order{SortOrder::DESC};

    std::vector<Chain> chains{Chain::SOLANA};
    std::vector<std::string> dexes;

    Bound liquidity;
    Bound volume_h24;
    Bound volume_h6;
    Bound volume_h1;
    Bound txns_h24;
    Bound pair_age_hours;
    Bound price_change_h24;
    Bound fdv;
    Bound market_cap;

    bool enhanced_token_info{false};
    std::optional<int64_t> active_boosts_min;

    // Launchpad specific
    std::optional<int64_t> max_age_hours;
    std::optional<int64_t> profile;
    std::optional<double> max_launchpad_progress;

    /**
     * @brief Ordered query parameters, rank first then filters
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> to_query_params() const;

    /**
     * @brief Request target, e.g. /dex/screener/v5/pairs/h24/1?rankBy[key]=...
     */
    [[nodiscard]] std::string build_target() const;

    void validate() const;

    // Presets
    static QueryConfig trending(Chain chain = Chain::SOLANA, Timeframe timeframe = Timeframe::H24);
    static QueryConfig top_volume(Chain chain = Chain::SOLANA, double min_liquidity = 25000, double min_txns = 50);
    static QueryConfig gainers(Chain chain = Chain::SOLANA, double min_liquidity = 25000, double min_volume = 10000);
    static QueryConfig new_pairs(Chain chain = Chain::SOLANA, double max_age_hours = 24);
};

/**
 * @brief Decoder sanity ceilings
 */
struct DecoderConfig {
    std::size_t legacy_string_ceiling{100};
    std::size_t enhanced_string_ceiling{1024};
    std::size_t max_ohlc_values{32};
    std::size_t max_profile_links{16};

    void validate() const;
};

/**
 * @brief Client-side selection applied to decoded records
 */
struct StreamConfig {
    std::size_t batch_target{50};
    uint32_t batch_timeout_ms{30000};
    std::size_t max_records_per_batch{0};  // 0 = unlimited

    std::vector<std::string> chains;
    std::vector<std::string> dexes;
    std::optional<double> min_liquidity_usd;
    std::optional<double> min_volume_usd;
    std::optional<double> min_fdv;
    std::optional<double> max_age_hours;

    void validate() const;
};

/**
 * @brief Debug settings, handed to the connection manager explicitly
 */
struct DebugConfig {
    bool verbose_logging{false};
    bool dump_rejected_frames{false};
};

/**
 * @brief Main configuration class
 *
 * Loads all settings from a TOML document. Missing keys keep their defaults;
 * every section is validated after loading.
 *
 * Example usage:
 * @code
 * Configuration config;
 * config.load_from_file("/etc/dex_stream.toml");
 *
 * auto target = config.get_query().build_target();
 * auto& connection = config.get_connection();
 * @endcode
 */
class Configuration {
  public:
    Configuration() = default;
    ~Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;
    Configuration(Configuration&&) = delete;
    Configuration& operator=(Configuration&&) = delete;

    /**
     * @brief Load configuration from TOML file
     * @param filepath Path to TOML configuration file
     * @throws std::runtime_error on parse errors or validation failures
     */
    void load_from_file(const std::filesystem::path& filepath);

    /**
     * @brief Load configuration from TOML string
     * @param toml_content TOML configuration as string
     * @throws std::runtime_error on parse errors or validation failures
     */
    void load_from_string(std::string_view toml_content);

    [[nodiscard]] const SystemConfig& get_system() const noexcept {
        return system_;
    }

    [[nodiscard]] const ConnectionConfig& get_connection() const noexcept {
        return connection_;
    }

    [[nodiscard]] const QueryConfig& get_query() const noexcept {
        return query_;
    }

    [[nodiscard]] const DecoderConfig& get_decoder() const noexcept {
        return decoder_;
    }

    [[nodiscard]] const StreamConfig& get_stream() const noexcept {
        return stream_;
    }

    [[nodiscard]] const DebugConfig& get_debug() const noexcept {
        return debug_;
    }

    [[nodiscard]] bool is_loaded() const noexcept {
        return loaded_;
    }

    [[nodiscard]] const std::filesystem::path& get_filepath() const noexcept {
        return filepath_;
    }

    /**
     * @brief Validate all configuration parameters
     * @throws std::runtime_error on validation failures
     */
    void validate() const;

    void clear();

  private:
    void parse_toml(const toml::table& table);
    void parse_system(const toml::table& table);
    void parse_connection(const toml::table& table);
    void parse_query(const toml::table& table);
    void parse_decoder(const toml::table& table);
    void parse_stream(const toml::table& table);
    void parse_debug(const toml::table& table);

    SystemConfig system_;
    ConnectionConfig connection_;
    QueryConfig query_;
    DecoderConfig decoder_;
    StreamConfig stream_;
    DebugConfig debug_;

    bool loaded_{false};
    std::filesystem::path filepath_;
};

}  // namespace dex_stream::core

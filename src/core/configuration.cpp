#include "configuration.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace dex_stream::core {

namespace {

constexpr std::string_view kTargetPrefix = "/dex/screener/v5/pairs/";

// Integer-valued doubles print without a fractional part ("25000", not "25000.0")
std::string format_number(double value) {
    return fmt::format("{}", value);
}

void append_bound(std::vector<std::pair<std::string, std::string>>& params, std::string_view key, const Bound& bound) {
    if (bound.min) {
        params.emplace_back(fmt::format("filters[{}][min]", key), format_number(*bound.min));
    }
    if (bound.max) {
        params.emplace_back(fmt::format("filters[{}][max]", key), format_number(*bound.max));
    }
}

void validate_bound(const Bound& bound, const std::string& name) {
    if (bound.min && bound.max && *bound.min > *bound.max) {
        throw std::runtime_error(name + " min must be <= max");
    }
}

void parse_bound(const toml::table& table, std::string_view key, Bound& bound) {
    if (auto sub = table[key].as_table()) {
        if (auto val = (*sub)["min"].value<double>()) {
            bound.min = *val;
        }
        if (auto val = (*sub)["max"].value<double>()) {
            bound.max = *val;
        }
    }
}

std::vector<std::string> parse_string_array(const toml::array& arr) {
    std::vector<std::string> out;
    for (auto&& elem : arr) {
        if (auto value = elem.value<std::string>()) {
            out.push_back(*value);
        }
    }
    return out;
}

}  // namespace

// Validation functions

void SystemConfig::validate() const {
    static const std::array<std::string_view, 6> valid_levels = {"trace", "debug", "info", "warn", "error", "off"};

    auto it = std::find(valid_levels.begin(), valid_levels.end(), log_level);
    if (it == valid_levels.end()) {
        throw std::runtime_error("Invalid log level: " + log_level);
    }
}

void ConnectionConfig::validate() const {
    if (host.empty()) {
        throw std::runtime_error("Host cannot be empty");
    }
    if (port.empty()) {
        throw std::runtime_error("Port cannot be empty");
    }

    // Timeouts
    if (connect_timeout_ms == 0) {
        throw std::runtime_error("Connect timeout must be > 0");
    }
    if (handshake_timeout_ms == 0) {
        throw std::runtime_error("Handshake timeout must be > 0");
    }
    if (ping_interval_ms == 0) {
        throw std::runtime_error("Ping interval must be > 0");
    }
    if (pong_timeout_ms == 0) {
        throw std::runtime_error("Pong timeout must be > 0");
    }

    // Reconnection
    if (initial_delay_ms == 0) {
        throw std::runtime_error("Initial reconnect delay must be > 0");
    }
    if (backoff_base < 1.0) {
        throw std::runtime_error("Backoff base must be >= 1.0");
    }
    if (max_delay_ms < initial_delay_ms) {
        throw std::runtime_error("Max reconnect delay must be >= initial delay");
    }
    if (jitter_ratio < 0.0 || jitter_ratio >= 1.0) {
        throw std::runtime_error("Jitter ratio must be in [0, 1)");
    }
    if (max_retries == 0) {
        throw std::runtime_error("Max retries must be > 0");
    }

    // Rate limit
    if (!(rate_limit_rps > 0.0)) {
        throw std::runtime_error("Rate limit must be > 0 requests per second");
    }
    if (rate_limit_burst == 0) {
        throw std::runtime_error("Rate limit burst must be > 0");
    }
}

std::vector<std::pair<std::string, std::string>> QueryConfig::to_query_params() const {
    std::vector<std::pair<std::string, std::string>> params;

    params.emplace_back("rankBy[key]", std::string(to_string(rank_by)));
    params.emplace_back("rankBy[order]", std::string(to_string(order)));

    for (std::size_t i = 0; i < chains.size(); ++i) {
        params.emplace_back(fmt::format("filters[chainIds][{}]", i), std::string(to_string(chains[i])));
    }
    for (std::size_t i = 0; i < dexes.size(); ++i) {
        params.emplace_back(fmt::format("filters[dexIds][{}]", i), dexes[i]);
    }

    append_bound(params, "liquidity", liquidity);
    append_bound(params, "volume][h24", volume_h24);
    append_bound(params, "volume][h6", volume_h6);
    append_bound(params, "volume][h1", volume_h1);
    append_bound(params, "txns][h24", txns_h24);
    append_bound(params, "pairAge", pair_age_hours);
    append_bound(params, "priceChange][h24", price_change_h24);
    append_bound(params, "fdv", fdv);
    append_bound(params, "marketCap", market_cap);

    if (enhanced_token_info) {
        params.emplace_back("filters[enhancedTokenInfo]", "true");
    }
    if (active_boosts_min) {
        params.emplace_back("filters[activeBoosts][min]", std::to_string(*active_boosts_min));
    }

    if (max_age_hours) {
        params.emplace_back("maxAge", std::to_string(*max_age_hours));
    }
    if (profile) {
        params.emplace_back("profile", std::to_string(*profile));
    }
    if (max_launchpad_progress) {
        params.emplace_back("maxLaunchpadProgress", format_number(*max_launchpad_progress));
    }

    return params;
}

std::string QueryConfig::build_target() const {
    std::ostringstream target;
    target << kTargetPrefix << to_string(timeframe) << "/1";

    char separator = '?';
    for (const auto& [key, value] : to_query_params()) {
        target << separator << key << '=' << value;
        separator = '&';
    }
    return target.str();
}

void QueryConfig::validate() const {
    if (chains.empty()) {
        throw std::runtime_error("At least one chain is required");
    }
    for (const auto& dex : dexes) {
        if (dex.empty()) {
            throw std::runtime_error("DEX identifiers cannot be empty");
        }
    }

    validate_bound(liquidity, "Liquidity");
    validate_bound(volume_h24, "Volume h24");
    validate_bound(volume_h6, "Volume h6");
    validate_bound(volume_h1, "Volume h1");
    validate_bound(txns_h24, "Transactions h24");
    validate_bound(pair_age_hours, "Pair age");
    validate_bound(price_change_h24, "Price change h24");
    validate_bound(fdv, "FDV");
    validate_bound(market_cap, "Market cap");

    if (profile && *profile != 0 && *profile != 1) {
        throw std::runtime_error("Profile must be 0 or 1");
    }
    if (max_launchpad_progress && (*max_launchpad_progress < 0.0 || *max_launchpad_progress > 100.0)) {
        throw std::runtime_error("Max launchpad progress must be within [0, 100]");
    }
    if (max_age_hours && *max_age_hours <= 0) {
        throw std::runtime_error("Max age must be > 0");
    }
}

QueryConfig QueryConfig::trending(Chain chain, Timeframe timeframe) {
    QueryConfig query;
    query.timeframe = timeframe;
    query.rank_by = RankBy::TRENDING_SCORE_H6;
    query.chains = {chain};
    return query;
}

QueryConfig QueryConfig::top_volume(Chain chain, double min_liquidity, double min_txns) {
    QueryConfig query;
    query.timeframe = Timeframe::H1;
    query.rank_by = RankBy::VOLUME;
    query.chains = {chain};
    query.liquidity.min = min_liquidity;
    query.txns_h24.min = min_txns;
    return query;
}

QueryConfig QueryConfig::gainers(Chain chain, double min_liquidity, double min_volume) {
    QueryConfig query;
    query.timeframe = Timeframe::H1;
    query.rank_by = RankBy::PRICE_CHANGE_H24;
    query.chains = {chain};
    query.liquidity.min = min_liquidity;
    query.volume_h24.min = min_volume;
    query.txns_h24.min = 50;
    return query;
}

QueryConfig QueryConfig::new_pairs(Chain chain, double max_age_hours) {
    QueryConfig query;
    query.timeframe = Timeframe::H1;
    query.rank_by = RankBy::TRENDING_SCORE_H6;
    query.chains = {chain};
    query.pair_age_hours.max = max_age_hours;
    return query;
}

void DecoderConfig::validate() const {
    // Legacy strings carry a single-byte length prefix
    if (legacy_string_ceiling == 0 || legacy_string_ceiling > 255) {
        throw std::runtime_error("Legacy string ceiling must be within [1, 255]");
    }
    // Enhanced two-byte prefixes carry 15 bits of length
    if (enhanced_string_ceiling == 0 || enhanced_string_ceiling > 0x7FFF) {
        throw std::runtime_error("Enhanced string ceiling must be within [1, 32767]");
    }
    if (max_ohlc_values < 6 || max_ohlc_values > 255) {
        throw std::runtime_error("Max OHLC values must be within [6, 255]");
    }
    if (max_profile_links > 255) {
        throw std::runtime_error("Max profile links must be <= 255");
    }
}

void StreamConfig::validate() const {
    if (batch_target == 0) {
        throw std::runtime_error("Batch target must be > 0");
    }
    if (batch_timeout_ms == 0) {
        throw std::runtime_error("Batch timeout must be > 0");
    }

    auto validate_non_negative = [](const std::optional<double>& value, const std::string& name) {
        if (value && *value < 0.0) {
            throw std::runtime_error(name + " must be >= 0");
        }
    };
    validate_non_negative(min_liquidity_usd, "Minimum liquidity");
    validate_non_negative(min_volume_usd, "Minimum volume");
    validate_non_negative(min_fdv, "Minimum FDV");

    if (max_age_hours && *max_age_hours <= 0.0) {
        throw std::runtime_error("Max age must be > 0");
    }

    for (const auto& chain : chains) {
        if (!chain_from_string(chain)) {
            throw std::runtime_error("Unknown chain filter: " + chain);
        }
    }
}

// Configuration class implementation

void Configuration::load_from_file(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Configuration file not found: " + filepath.string());
    }

    try {
        auto config = toml::parse_file(filepath.string());
        parse_toml(config);
        filepath_ = filepath;
        loaded_ = true;

        validate();

        spdlog::info("Configuration loaded from: {}", filepath.string());
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse TOML file: " << e;
        throw std::runtime_error(oss.str());
    }
}

void Configuration::load_from_string(std::string_view toml_content) {
    try {
        auto config = toml::parse(toml_content);
        parse_toml(config);
        loaded_ = true;

        validate();

        spdlog::debug("Configuration loaded from string");
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse TOML string: " << e;
        throw std::runtime_error(oss.str());
    }
}

void Configuration::validate() const {
    system_.validate();

    auto validate_section = [](const auto& section, const std::string& name) {
        try {
            section.validate();
        } catch (const std::exception& e) {
            throw std::runtime_error("[" + name + "] validation failed: " + e.what());
        }
    };

    validate_section(connection_, "connection");
    validate_section(query_, "query");
    validate_section(decoder_, "decoder");
    validate_section(stream_, "stream");
}

void Configuration::clear() {
    system_ = SystemConfig{};
    connection_ = ConnectionConfig{};
    query_ = QueryConfig{};
    decoder_ = DecoderConfig{};
    stream_ = StreamConfig{};
    debug_ = DebugConfig{};
    loaded_ = false;
    filepath_.clear();
}

void Configuration::parse_toml(const toml::table& table) {
    if (auto system = table["system"].as_table()) {
        parse_system(*system);
    }

    if (auto connection = table["connection"].as_table()) {
        parse_connection(*connection);
    }

    if (auto query = table["query"].as_table()) {
        parse_query(*query);
    }

    if (auto decoder = table["decoder"].as_table()) {
        parse_decoder(*decoder);
    }

    if (auto stream = table["stream"].as_table()) {
        parse_stream(*stream);
    }

    if (auto debug = table["debug"].as_table()) {
        parse_debug(*debug);
    }
}

void Configuration::parse_system(const toml::table& table) {
    if (auto val = table["log_level"].value<std::string>()) {
        system_.log_level = *val;
    }
    if (auto val = table["log_file"].value<std::string>()) {
        system_.log_file = *val;
    }
}

void Configuration::parse_connection(const toml::table& table) {
    if (auto val = table["host"].value<std::string>()) {
        connection_.host = *val;
    }
    if (auto val = table["port"].value<std::string>()) {
        connection_.port = *val;
    } else if (auto num = table["port"].value<int64_t>()) {
        connection_.port = std::to_string(*num);
    }
    if (auto val = table["use_ssl"].value<bool>()) {
        connection_.use_ssl = *val;
    }
    if (auto val = table["origin"].value<std::string>()) {
        connection_.origin = *val;
    }

    // Timeouts
    if (auto val = table["connect_timeout_ms"].value<int64_t>()) {
        connection_.connect_timeout_ms = static_cast<uint32_t>(*val);
    }
    if (auto val = table["handshake_timeout_ms"].value<int64_t>()) {
        connection_.handshake_timeout_ms = static_cast<uint32_t>(*val);
    }

    // Heartbeat
    if (auto val = table["ping_interval_ms"].value<int64_t>()) {
        connection_.ping_interval_ms = static_cast<uint32_t>(*val);
    }
    if (auto val = table["pong_timeout_ms"].value<int64_t>()) {
        connection_.pong_timeout_ms = static_cast<uint32_t>(*val);
    }

    // Reconnection
    if (auto val = table["initial_delay_ms"].value<int64_t>()) {
        connection_.initial_delay_ms = static_cast<uint32_t>(*val);
    }
    if (auto val = table["backoff_base"].value<double>()) {
        connection_.backoff_base = *val;
    }
    if (auto val = table["max_delay_ms"].value<int64_t>()) {
        connection_.max_delay_ms = static_cast<uint32_t>(*val);
    }
    if (auto val = table["jitter_ratio"].value<double>()) {
        connection_.jitter_ratio = *val;
    }
    if (auto val = table["max_retries"].value<int64_t>()) {
        connection_.max_retries = static_cast<uint32_t>(*val);
    }

    // Rate limit
    if (auto val = table["rate_limit_rps"].value<double>()) {
        connection_.rate_limit_rps = *val;
    }
    if (auto val = table["rate_limit_burst"].value<int64_t>()) {
        connection_.rate_limit_burst = static_cast<uint32_t>(*val);
    }

    if (auto arr = table["subscriptions"].as_array()) {
        connection_.subscriptions = parse_string_array(*arr);
    }
}

void Configuration::parse_query(const toml::table& table) {
    if (auto val = table["timeframe"].value<std::string>()) {
        auto timeframe = timeframe_from_string(*val);
        if (!timeframe) {
            throw std::runtime_error("Unknown timeframe: " + *val);
        }
        query_.timeframe = *timeframe;
    }
    if (auto val = table["rank_by"].value<std::string>()) {
        auto rank_by = rank_by_from_string(*val);
        if (!rank_by) {
            throw std::runtime_error("Unknown ranking: " + *val);
        }
        query_.rank_by = *rank_by;
    }
    if (auto val = table["order"].value<std::string>()) {
        auto order = sort_order_from_string(*val);
        if (!order) {
            throw std::runtime_error("Unknown sort order: " + *val);
        }
        query_.order = *order;
    }

    if (auto arr = table["chains"].as_array()) {
        query_.chains.clear();
        for (const auto& name : parse_string_array(*arr)) {
            auto chain = chain_from_string(name);
            if (!chain) {
                throw std::runtime_error("Unknown chain: " + name);
            }
            query_.chains.push_back(*chain);
        }
    }
    if (auto arr = table["dexes"].as_array()) {
        query_.dexes = parse_string_array(*arr);
    }

    parse_bound(table, "liquidity", query_.liquidity);
    parse_bound(table, "volume_h24", query_.volume_h24);
    parse_bound(table, "volume_h6", query_.volume_h6);
    parse_bound(table, "volume_h1", query_.volume_h1);
    parse_bound(table, "txns_h24", query_.txns_h24);
    parse_bound(table, "pair_age_hours", query_.pair_age_hours);
    parse_bound(table, "price_change_h24", query_.price_change_h24);
    parse_bound(table, "fdv", query_.fdv);
    parse_bound(table, "market_cap", query_.market_cap);

    if (auto val = table["enhanced_token_info"].value<bool>()) {
        query_.enhanced_token_info = *val;
    }
    if (auto val = table["active_boosts_min"].value<int64_t>()) {
        query_.active_boosts_min = *val;
    }
    if (auto val = table["max_age_hours"].value<int64_t>()) {
        query_.max_age_hours = *val;
    }
    if (auto val = table["profile"].value<int64_t>()) {
        query_.profile = *val;
    }
    if (auto val = table["max_launchpad_progress"].value<double>()) {
        query_.max_launchpad_progress = *val;
    }
}

void Configuration::parse_decoder(const toml::table& table) {
    if (auto val = table["legacy_string_ceiling"].value<int64_t>()) {
        decoder_.legacy_string_ceiling = static_cast<std::size_t>(*val);
    }
    if (auto val = table["enhanced_string_ceiling"].value<int64_t>()) {
        decoder_.enhanced_string_ceiling = static_cast<std::size_t>(*val);
    }
    if (auto val = table["max_ohlc_values"].value<int64_t>()) {
        decoder_.max_ohlc_values = static_cast<std::size_t>(*val);
    }
    if (auto val = table["max_profile_links"].value<int64_t>()) {
        decoder_.max_profile_links = static_cast<std::size_t>(*val);
    }
}

void Configuration::parse_stream(const toml::table& table) {
    if (auto val = table["batch_target"].value<int64_t>()) {
        stream_.batch_target = static_cast<std::size_t>(*val);
    }
    if (auto val = table["batch_timeout_ms"].value<int64_t>()) {
        stream_.batch_timeout_ms = static_cast<uint32_t>(*val);
    }
    if (auto val = table["max_records_per_batch"].value<int64_t>()) {
        stream_.max_records_per_batch = static_cast<std::size_t>(*val);
    }

    if (auto arr = table["chains"].as_array()) {
        stream_.chains = parse_string_array(*arr);
    }
    if (auto arr = table["dexes"].as_array()) {
        stream_.dexes = parse_string_array(*arr);
    }
    if (auto val = table["min_liquidity_usd"].value<double>()) {
        stream_.min_liquidity_usd = *val;
    }
    if (auto val = table["min_volume_usd"].value<double>()) {
        stream_.min_volume_usd = *val;
    }
    if (auto val = table["min_fdv"].value<double>()) {
        stream_.min_fdv = *val;
    }
    if (auto val = table["max_age_hours"].value<double>()) {
        stream_.max_age_hours = *val;
    }
}

void Configuration::parse_debug(const toml::table& table) {
    if (auto val = table["verbose_logging"].value<bool>()) {
        debug_.verbose_logging = *val;
    }
    if (auto val = table["dump_rejected_frames"].value<bool>()) {
        debug_.dump_rejected_frames = *val;
    }
}

}  // namespace dex_stream::core

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace dex_stream::core {

// Blockchain networks the upstream screener can be filtered on
enum class Chain : uint8_t {
    SOLANA = 0,
    ETHEREUM = 1,
    BASE = 2,
    BSC = 3,
    POLYGON = 4,
    ARBITRUM = 5,
    OPTIMISM = 6,
    AVALANCHE = 7
};

// Ranking window requested from the screener
enum class Timeframe : uint8_t { M5 = 0, H1 = 1, H6 = 2, H24 = 3 };

// Ranking dimension
enum class RankBy : uint8_t {
    TRENDING_SCORE_H6 = 0,
    VOLUME = 1,
    TRANSACTIONS = 2,
    PRICE_CHANGE_H24 = 3,
    PRICE_CHANGE_H6 = 4,
    PRICE_CHANGE_H1 = 5,
    LIQUIDITY = 6,
    FDV = 7,
    MARKET_CAP = 8
};

enum class SortOrder : uint8_t { DESC = 0, ASC = 1 };

namespace detail {

template <typename Enum, std::size_t N>
using NameTable = std::array<std::pair<Enum, std::string_view>, N>;

inline constexpr NameTable<Chain, 8> chain_names{{{Chain::SOLANA, "solana"},
                                                  {Chain::ETHEREUM, "ethereum"},
                                                  {Chain::BASE, "base"},
                                                  {Chain::BSC, "bsc"},
                                                  {Chain::POLYGON, "polygon"},
                                                  {Chain::ARBITRUM, "arbitrum"},
                                                  {Chain::OPTIMISM, "optimism"},
                                                  {Chain::AVALANCHE, "avalanche"}}};

inline constexpr NameTable<Timeframe, 4> timeframe_names{
    {{Timeframe::M5, "m5"}, {Timeframe::H1, "h1"}, {Timeframe::H6, "h6"}, {Timeframe::H24, "h24"}}};

inline constexpr NameTable<RankBy, 9> rank_by_names{{{RankBy::TRENDING_SCORE_H6, "trendingScoreH6"},
                                                     {RankBy::VOLUME, "volume"},
                                                     {RankBy::TRANSACTIONS, "txns"},
                                                     {RankBy::PRICE_CHANGE_H24, "priceChangeH24"},
                                                     {RankBy::PRICE_CHANGE_H6, "priceChangeH6"},
                                                     {RankBy::PRICE_CHANGE_H1, "priceChangeH1"},
                                                     {RankBy::LIQUIDITY, "liquidity"},
                                                     {RankBy::FDV, "fdv"},
                                                     {RankBy::MARKET_CAP, "marketCap"}}};

inline constexpr NameTable<SortOrder, 2> sort_order_names{{{SortOrder::DESC, "desc"}, {SortOrder::ASC, "asc"}}};

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr std::string_view name_of(const NameTable<Enum, N>& table, Enum value) noexcept {
    for (const auto& [e, name] : table) {
        if (e == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr std::optional<Enum> value_of(const NameTable<Enum, N>& table, std::string_view name) noexcept {
    for (const auto& [e, n] : table) {
        if (n == name) {
            return e;
        }
    }
    return std::nullopt;
}

}  // namespace detail

[[nodiscard]] constexpr std::string_view to_string(Chain chain) noexcept {
    return detail::name_of(detail::chain_names, chain);
}

[[nodiscard]] constexpr std::string_view to_string(Timeframe timeframe) noexcept {
    return detail::name_of(detail::timeframe_names, timeframe);
}

[[nodiscard]] constexpr std::string_view to_string(RankBy rank_by) noexcept {
    return detail::name_of(detail::rank_by_names, rank_by);
}

[[nodiscard]] constexpr std::string_view to_string(SortOrder order) noexcept {
    return detail::name_of(detail::sort_order_names, order);
}

[[nodiscard]] constexpr std::optional<Chain> chain_from_string(std::string_view name) noexcept {
    return detail::value_of(detail::chain_names, name);
}

[[nodiscard]] constexpr std::optional<Timeframe> timeframe_from_string(std::string_view name) noexcept {
    return detail::value_of(detail::timeframe_names, name);
}

[[nodiscard]] constexpr std::optional<RankBy> rank_by_from_string(std::string_view name) noexcept {
    return detail::value_of(detail::rank_by_names, name);
}

[[nodiscard]] constexpr std::optional<SortOrder> sort_order_from_string(std::string_view name) noexcept {
    return detail::value_of(detail::sort_order_names, name);
}

}  // namespace dex_stream::core

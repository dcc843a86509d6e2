#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/configuration.hpp"
#include "../core/frame.hpp"
#include "../core/records.hpp"

namespace dex_stream::stream {

/**
 * @brief Client-side selection over decoded records
 *
 * Pure predicate: never mutates a record, only decides whether it is
 * forwarded. Criteria apply to trading pairs; OHLC candles and token
 * profiles always pass. A pair whose metric is unknown does not satisfy a
 * minimum on that metric, and a pair with no creation time does not satisfy
 * a max age. Chain and DEX comparisons ignore ASCII case.
 */
class RecordFilter {
  public:
    RecordFilter() = default;
    explicit RecordFilter(const core::StreamConfig& config);

    [[nodiscard]] bool matches(const core::Record& record, core::WallClock::time_point now) const;

    [[nodiscard]] bool matches(const core::TradingPairRecord& pair, core::WallClock::time_point now) const;

    // True when no criterion is configured
    [[nodiscard]] bool empty() const noexcept;

  private:
    std::vector<std::string> chains_;
    std::vector<std::string> dexes_;
    std::optional<double> min_liquidity_usd_;
    std::optional<double> min_volume_usd_;
    std::optional<double> min_fdv_;
    std::optional<double> max_age_hours_;
};

}  // namespace dex_stream::stream

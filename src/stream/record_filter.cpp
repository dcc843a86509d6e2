#include "record_filter.hpp"

#include <algorithm>
#include <chrono>
#include <variant>

#include <boost/algorithm/string/predicate.hpp>

namespace dex_stream::stream {

namespace {

bool contains_ignore_case(const std::vector<std::string>& values, const std::string& value) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& candidate) {
        return boost::algorithm::iequals(candidate, value);
    });
}

bool meets_minimum(const core::Metric& metric, const std::optional<double>& minimum) noexcept {
    return !minimum || (metric && *metric >= *minimum);
}

}  // namespace

RecordFilter::RecordFilter(const core::StreamConfig& config)
    : chains_(config.chains),
      dexes_(config.dexes),
      min_liquidity_usd_(config.min_liquidity_usd),
      min_volume_usd_(config.min_volume_usd),
      min_fdv_(config.min_fdv),
      max_age_hours_(config.max_age_hours) {}

bool RecordFilter::empty() const noexcept {
    return chains_.empty() && dexes_.empty() && !min_liquidity_usd_ && !min_volume_usd_ && !min_fdv_ &&
           !max_age_hours_;
}

bool RecordFilter::matches(const core::Record& record, core::WallClock::time_point now) const {
    if (const auto* pair = std::get_if<core::TradingPairRecord>(&record)) {
        return matches(*pair, now);
    }
    return true;
}

bool RecordFilter::matches(const core::TradingPairRecord& pair, core::WallClock::time_point now) const {
    if (!chains_.empty() && !contains_ignore_case(chains_, pair.chain)) {
        return false;
    }
    if (!dexes_.empty() && !contains_ignore_case(dexes_, pair.dex)) {
        return false;
    }

    if (!meets_minimum(pair.liquidity_usd, min_liquidity_usd_) || !meets_minimum(pair.volume_usd, min_volume_usd_) ||
        !meets_minimum(pair.fdv, min_fdv_)) {
        return false;
    }

    if (max_age_hours_) {
        if (!pair.created_at) {
            return false;
        }
        const auto created = core::WallClock::time_point(std::chrono::seconds(*pair.created_at));
        const double age_hours = std::chrono::duration<double, std::ratio<3600>>(now - created).count();
        if (age_hours > *max_age_hours_) {
            return false;
        }
    }
    return true;
}

}  // namespace dex_stream::stream

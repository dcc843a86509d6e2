#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dex_stream::core {

// Absent when the upstream value was NaN/Inf or out of its plausible range.
// Zero is a legitimate value and is never used as "unknown".
using Metric = std::optional<double>;

// Why a chunk or frame was dropped
enum class DecodeError : uint8_t {
    TRUNCATED_FIELD = 0,      // Fewer bytes remain than a field declares
    INVALID_LENGTH = 1,       // Declared length above its sanity ceiling
    UNRECOGNIZED_FRAME = 2,   // Header signature, version or type tag not recognized
    INVARIANT_VIOLATION = 3,  // Decoded values fail domain checks
};

[[nodiscard]] constexpr std::string_view to_string(DecodeError error) noexcept {
    switch (error) {
        case DecodeError::TRUNCATED_FIELD:
            return "TruncatedField";
        case DecodeError::INVALID_LENGTH:
            return "InvalidLength";
        case DecodeError::UNRECOGNIZED_FRAME:
            return "UnrecognizedFrame";
        case DecodeError::INVARIANT_VIOLATION:
            return "InvariantViolation";
    }
    return "Unknown";
}

struct TokenInfo {
    std::string name;
    std::string symbol;
    std::string address;

    bool operator==(const TokenInfo&) const = default;
};

struct TradingPairRecord {
    std::string chain;
    std::string dex;
    std::string pair_address;
    TokenInfo base;
    TokenInfo quote;

    double price{0.0};
    double price_usd{0.0};
    Metric price_change_h24;
    Metric liquidity_usd;
    Metric volume_usd;
    Metric fdv;
    std::optional<int64_t> created_at;  // Seconds since epoch

    // 8th value of the metric block. Meaning inferred, not documented: carried
    // through for diagnostics, never used for decisions.
    Metric layout_hint;

    bool operator==(const TradingPairRecord&) const = default;
};

struct OHLCRecord {
    std::string symbol;
    int64_t timestamp{0};  // Candle open, seconds since epoch
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};

    bool operator==(const OHLCRecord&) const = default;
};

struct TokenProfileRecord {
    std::string symbol;
    std::string name;
    std::string description;
    std::vector<std::string> websites;
    std::map<std::string, std::string> socials;  // e.g. "twitter" -> url

    bool operator==(const TokenProfileRecord&) const = default;
};

// A chunk or frame that did not produce a record
struct Skip {
    DecodeError reason{DecodeError::TRUNCATED_FIELD};
    uint32_t chunk_index{0};   // Position in the frame's chunk sequence
    std::size_t offset{0};     // Chunk start, relative to the frame payload

    bool operator==(const Skip&) const = default;
};

using Record = std::variant<TradingPairRecord, OHLCRecord, TokenProfileRecord>;
using DecodeOutcome = std::variant<TradingPairRecord, OHLCRecord, TokenProfileRecord, Skip>;

[[nodiscard]] inline bool is_skip(const DecodeOutcome& outcome) noexcept {
    return std::holds_alternative<Skip>(outcome);
}

// Moves the record out of a successful outcome
[[nodiscard]] inline std::optional<Record> take_record(DecodeOutcome&& outcome) {
    return std::visit(
        [](auto&& value) -> std::optional<Record> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Skip>) {
                return std::nullopt;
            } else {
                return Record{std::move(value)};
            }
        },
        std::move(outcome));
}

}  // namespace dex_stream::core

#include "record_decoder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace dex_stream::parsing {

namespace {

// Cursor and stage for one chunk
struct ChunkWalk {
    core::ByteView chunk;
    std::size_t offset{0};
    DecodeStage stage{DecodeStage::READ_HEADER};
    DecodeStage failed_at{DecodeStage::READ_HEADER};
    core::DecodeError error{core::DecodeError::TRUNCATED_FIELD};

    explicit ChunkWalk(core::ByteView bytes) noexcept : chunk(bytes) {}

    [[nodiscard]] bool done() const noexcept {
        return stage == DecodeStage::EMIT || stage == DecodeStage::DISCARD;
    }

    // Move to next on success; on failure remember where and discard
    void step(bool ok, DecodeStage next) noexcept {
        if (ok) {
            stage = next;
        } else {
            failed_at = stage;
            stage = DecodeStage::DISCARD;
        }
    }

    void reject(core::DecodeError reason) noexcept {
        error = reason;
        step(false, DecodeStage::DISCARD);
    }
};

core::DecodeOutcome finish(const ChunkWalk& walk, ChunkPosition position, DecodeStage* stage_out) {
    if (stage_out) {
        *stage_out = walk.failed_at;
    }
    return core::Skip{walk.error, position.index, position.offset};
}

std::array<std::string*, kPairStringCount> pair_string_fields(core::TradingPairRecord& record) noexcept {
    return {&record.chain,
            &record.dex,
            &record.pair_address,
            &record.base.name,
            &record.base.symbol,
            &record.base.address,
            &record.quote.name,
            &record.quote.symbol,
            &record.quote.address};
}

bool validate_pair(core::TradingPairRecord& record,
                   const std::array<double, kPairMetricCount>& metrics,
                   core::DecodeError* error_out) {
    for (auto* field : pair_string_fields(record)) {
        strip_control_characters(*field);
    }
    if (record.pair_address.empty()) {
        set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
        return false;
    }

    // Prices are mandatory; everything else may be unknown
    const auto price = sanitize_double(metrics[0]);
    const auto price_usd = sanitize_double(metrics[1]);
    if (!price || !price_usd || *price < 0.0 || *price_usd < 0.0) {
        set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
        return false;
    }
    record.price = *price;
    record.price_usd = *price_usd;
    record.price_change_h24 = sanitize_double(metrics[2]);
    record.liquidity_usd = sanitize_double(metrics[3]);
    record.volume_usd = sanitize_double(metrics[4]);
    record.fdv = sanitize_double(metrics[5]);

    for (const auto* metric : {&record.liquidity_usd, &record.volume_usd, &record.fdv}) {
        if (*metric && **metric < 0.0) {
            set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
            return false;
        }
    }

    const auto created = sanitize_double(metrics[6]);
    if (created && *created >= 0.0 && *created < static_cast<double>(kMaxPlausibleTimestamp)) {
        record.created_at = static_cast<int64_t>(*created);
    }

    record.layout_hint = sanitize_double(metrics[7]);
    return true;
}

bool validate_candle(core::OHLCRecord& record,
                     const std::array<double, kOhlcRequiredValues>& values,
                     core::DecodeError* error_out) {
    const bool all_finite = std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
    if (!all_finite) {
        set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
        return false;
    }

    const double timestamp = values[0];
    record.open = values[1];
    record.high = values[2];
    record.low = values[3];
    record.close = values[4];
    record.volume = values[5];

    // Reported, never corrected
    const bool bounded = record.high >= std::max(record.open, record.close) &&
                         record.low <= std::min(record.open, record.close);
    const bool plausible = timestamp >= 0.0 && timestamp < static_cast<double>(kMaxPlausibleTimestamp) &&
                           record.volume >= 0.0;
    if (!bounded || !plausible) {
        set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
        return false;
    }

    record.timestamp = static_cast<int64_t>(timestamp);
    strip_control_characters(record.symbol);
    truncate_utf8(record.symbol, kProfileSymbolCap);
    return true;
}

void sanitize_text(std::string& text, std::size_t cap) {
    strip_control_characters(text);
    truncate_utf8(text, cap);
}

bool validate_profile(core::TokenProfileRecord& record,
                      std::vector<std::string>& websites,
                      std::vector<std::pair<std::string, std::string>>& socials,
                      core::DecodeError* error_out) {
    sanitize_text(record.symbol, kProfileSymbolCap);
    if (record.symbol.empty()) {
        set_error(error_out, core::DecodeError::INVARIANT_VIOLATION);
        return false;
    }
    sanitize_text(record.name, kProfileNameCap);
    sanitize_text(record.description, kProfileDescriptionCap);

    for (auto& url : websites) {
        sanitize_text(url, kProfileUrlCap);
        if (!url.empty()) {
            record.websites.push_back(std::move(url));
        }
    }

    // First occurrence of a platform wins
    for (auto& [platform, url] : socials) {
        sanitize_text(platform, kProfileSocialKeyCap);
        sanitize_text(url, kProfileUrlCap);
        if (!platform.empty() && !url.empty()) {
            record.socials.emplace(std::move(platform), std::move(url));
        }
    }
    return true;
}

}  // namespace

StringLimits RecordDecoder::string_limits(ProtocolVersion version) const noexcept {
    if (version == ProtocolVersion::LEGACY) {
        return {PrefixWidth::SINGLE_BYTE, config_.legacy_string_ceiling};
    }
    return {PrefixWidth::FLAGGED, config_.enhanced_string_ceiling};
}

core::DecodeOutcome RecordDecoder::decode(MessageType type,
                                          ProtocolVersion version,
                                          core::ByteView chunk,
                                          ChunkPosition position,
                                          DecodeStage* stage_out) const {
    switch (type) {
        case MessageType::PAIRS:
            return decode_pair(chunk, version, position, stage_out);
        case MessageType::OHLC:
            return decode_ohlc(chunk, position, stage_out);
        case MessageType::PROFILES:
            return decode_profile(chunk, position, stage_out);
    }
    if (stage_out) {
        *stage_out = DecodeStage::READ_HEADER;
    }
    return core::Skip{core::DecodeError::UNRECOGNIZED_FRAME, position.index, position.offset};
}

core::DecodeOutcome RecordDecoder::decode_pair(core::ByteView chunk,
                                               ProtocolVersion version,
                                               ChunkPosition position,
                                               DecodeStage* stage_out) const {
    ChunkWalk walk(chunk.first(std::min(chunk.size(), kPairChunkSize)));
    const StringLimits limits = string_limits(version);

    core::TradingPairRecord record;
    std::array<double, kPairMetricCount> metrics{};

    while (!walk.done()) {
        switch (walk.stage) {
            case DecodeStage::READ_HEADER:
                // No in-band header: a pair chunk is identified by its size
                if (walk.chunk.size() < kPairChunkSize) {
                    walk.reject(core::DecodeError::TRUNCATED_FIELD);
                } else {
                    walk.step(true, DecodeStage::READ_STRINGS);
                }
                break;

            case DecodeStage::READ_STRINGS: {
                const auto fields = pair_string_fields(record);
                const bool ok = std::all_of(fields.begin(), fields.end(), [&](std::string* field) {
                    return decode_length_prefixed_string(walk.chunk, walk.offset, limits, *field, &walk.error);
                });
                walk.step(ok, DecodeStage::ALIGN_TO_BOUNDARY);
                break;
            }

            case DecodeStage::ALIGN_TO_BOUNDARY:
                walk.offset = align_up(walk.offset, kMetricAlignment);
                walk.step(true, DecodeStage::READ_METRICS);
                break;

            case DecodeStage::READ_METRICS:
                walk.step(decode_aligned_f64_block(walk.chunk, walk.offset, metrics, &walk.error),
                          DecodeStage::VALIDATE);
                break;

            case DecodeStage::VALIDATE:
                walk.step(validate_pair(record, metrics, &walk.error), DecodeStage::EMIT);
                break;

            case DecodeStage::EMIT:
            case DecodeStage::DISCARD:
                break;
        }
    }

    if (walk.stage == DecodeStage::DISCARD) {
        return finish(walk, position, stage_out);
    }
    if (stage_out) {
        *stage_out = DecodeStage::EMIT;
    }
    return record;
}

core::DecodeOutcome RecordDecoder::decode_ohlc(core::ByteView body,
                                               ChunkPosition position,
                                               DecodeStage* stage_out) const {
    ChunkWalk walk(body);
    const StringLimits limits = string_limits(ProtocolVersion::ENHANCED);

    core::OHLCRecord record;
    uint8_t value_count = 0;
    std::array<double, kOhlcRequiredValues> values{};

    while (!walk.done()) {
        switch (walk.stage) {
            case DecodeStage::READ_HEADER:
                if (!read_u8(walk.chunk, walk.offset, value_count, &walk.error)) {
                    walk.step(false, DecodeStage::DISCARD);
                } else if (value_count < kOhlcRequiredValues || value_count > config_.max_ohlc_values) {
                    walk.reject(core::DecodeError::INVALID_LENGTH);
                } else {
                    walk.step(true, DecodeStage::READ_STRINGS);
                }
                break;

            case DecodeStage::READ_STRINGS:
                walk.step(decode_length_prefixed_string(walk.chunk, walk.offset, limits, record.symbol, &walk.error),
                          DecodeStage::ALIGN_TO_BOUNDARY);
                break;

            case DecodeStage::ALIGN_TO_BOUNDARY:
                walk.offset = align_up(walk.offset, kMetricAlignment);
                walk.step(true, DecodeStage::READ_METRICS);
                break;

            case DecodeStage::READ_METRICS: {
                // The whole declared block must be present, extras included
                const std::size_t declared = static_cast<std::size_t>(value_count) * sizeof(double);
                if (walk.offset > walk.chunk.size() || walk.chunk.size() - walk.offset < declared) {
                    walk.reject(core::DecodeError::TRUNCATED_FIELD);
                    break;
                }
                const bool ok = decode_aligned_f64_block(walk.chunk, walk.offset, values, &walk.error);
                if (ok) {
                    walk.offset += (value_count - kOhlcRequiredValues) * sizeof(double);
                }
                walk.step(ok, DecodeStage::VALIDATE);
                break;
            }

            case DecodeStage::VALIDATE:
                walk.step(validate_candle(record, values, &walk.error), DecodeStage::EMIT);
                break;

            case DecodeStage::EMIT:
            case DecodeStage::DISCARD:
                break;
        }
    }

    if (walk.stage == DecodeStage::DISCARD) {
        return finish(walk, position, stage_out);
    }
    if (stage_out) {
        *stage_out = DecodeStage::EMIT;
    }
    return record;
}

core::DecodeOutcome RecordDecoder::decode_profile(core::ByteView body,
                                                  ChunkPosition position,
                                                  DecodeStage* stage_out) const {
    ChunkWalk walk(body);
    const StringLimits limits = string_limits(ProtocolVersion::ENHANCED);

    core::TokenProfileRecord record;
    uint8_t website_count = 0;
    uint8_t social_count = 0;
    std::vector<std::string> websites;
    std::vector<std::pair<std::string, std::string>> socials;

    auto read_string = [&](std::string& out) {
        return decode_length_prefixed_string(walk.chunk, walk.offset, limits, out, &walk.error);
    };

    while (!walk.done()) {
        switch (walk.stage) {
            case DecodeStage::READ_HEADER:
                if (!read_u8(walk.chunk, walk.offset, website_count, &walk.error) ||
                    !read_u8(walk.chunk, walk.offset, social_count, &walk.error)) {
                    walk.step(false, DecodeStage::DISCARD);
                } else if (website_count > config_.max_profile_links || social_count > config_.max_profile_links) {
                    walk.reject(core::DecodeError::INVALID_LENGTH);
                } else {
                    walk.step(true, DecodeStage::READ_STRINGS);
                }
                break;

            case DecodeStage::READ_STRINGS: {
                bool ok = read_string(record.symbol) && read_string(record.name) && read_string(record.description);

                websites.resize(website_count);
                for (std::size_t i = 0; ok && i < websites.size(); ++i) {
                    ok = read_string(websites[i]);
                }

                socials.resize(social_count);
                for (std::size_t i = 0; ok && i < socials.size(); ++i) {
                    ok = read_string(socials[i].first) && read_string(socials[i].second);
                }
                walk.step(ok, DecodeStage::ALIGN_TO_BOUNDARY);
                break;
            }

            // Profiles carry no numeric block
            case DecodeStage::ALIGN_TO_BOUNDARY:
                walk.step(true, DecodeStage::READ_METRICS);
                break;

            case DecodeStage::READ_METRICS:
                walk.step(true, DecodeStage::VALIDATE);
                break;

            case DecodeStage::VALIDATE:
                walk.step(validate_profile(record, websites, socials, &walk.error), DecodeStage::EMIT);
                break;

            case DecodeStage::EMIT:
            case DecodeStage::DISCARD:
                break;
        }
    }

    if (walk.stage == DecodeStage::DISCARD) {
        return finish(walk, position, stage_out);
    }
    if (stage_out) {
        *stage_out = DecodeStage::EMIT;
    }
    return record;
}

}  // namespace dex_stream::parsing

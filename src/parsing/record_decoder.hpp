#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../core/configuration.hpp"
#include "../core/frame.hpp"
#include "../core/records.hpp"
#include "field_decoders.hpp"
#include "wire_format.hpp"

namespace dex_stream::parsing {

// Per-chunk decode stages. Every chunk walks them in order and ends in EMIT
// or DISCARD; a stage with nothing to do for a record type passes straight
// through.
enum class DecodeStage : uint8_t {
    READ_HEADER = 0,
    READ_STRINGS = 1,
    ALIGN_TO_BOUNDARY = 2,
    READ_METRICS = 3,
    VALIDATE = 4,
    EMIT = 5,
    DISCARD = 6
};

[[nodiscard]] constexpr std::string_view to_string(DecodeStage stage) noexcept {
    switch (stage) {
        case DecodeStage::READ_HEADER:
            return "ReadHeader";
        case DecodeStage::READ_STRINGS:
            return "ReadStrings";
        case DecodeStage::ALIGN_TO_BOUNDARY:
            return "AlignToBoundary";
        case DecodeStage::READ_METRICS:
            return "ReadMetrics";
        case DecodeStage::VALIDATE:
            return "Validate";
        case DecodeStage::EMIT:
            return "Emit";
        case DecodeStage::DISCARD:
            return "Discard";
    }
    return "Unknown";
}

// Profile sanitation caps, in bytes
inline constexpr std::size_t kProfileSymbolCap = 32;
inline constexpr std::size_t kProfileNameCap = 128;
inline constexpr std::size_t kProfileDescriptionCap = 1024;
inline constexpr std::size_t kProfileUrlCap = 256;
inline constexpr std::size_t kProfileSocialKeyCap = 32;

// Where a chunk sits in its frame, copied into Skip outcomes
struct ChunkPosition {
    uint32_t index{0};
    std::size_t offset{0};  // Relative to the frame payload
};

/**
 * @brief Decodes one RawChunk into a record or a Skip
 *
 * Stateless apart from its limits; safe to share between threads. Chunk
 * failures never throw: every failure becomes a Skip carrying the reason,
 * and no partially populated record is ever returned.
 *
 * When stage_out is provided it receives the stage decoding ended in:
 * EMIT on success, otherwise the stage that rejected the chunk.
 */
class RecordDecoder {
  public:
    explicit RecordDecoder(const core::DecoderConfig& config = {}) noexcept : config_(config) {}

    // Dispatch on the message type selected by the message decoder
    [[nodiscard]] core::DecodeOutcome decode(MessageType type,
                                             ProtocolVersion version,
                                             core::ByteView chunk,
                                             ChunkPosition position = {},
                                             DecodeStage* stage_out = nullptr) const;

    // Fixed-size pair chunk; bytes past kPairChunkSize are ignored
    [[nodiscard]] core::DecodeOutcome decode_pair(core::ByteView chunk,
                                                  ProtocolVersion version,
                                                  ChunkPosition position = {},
                                                  DecodeStage* stage_out = nullptr) const;

    // Self-delimited OHLC body (length prefix already removed)
    [[nodiscard]] core::DecodeOutcome decode_ohlc(core::ByteView body,
                                                  ChunkPosition position = {},
                                                  DecodeStage* stage_out = nullptr) const;

    // Self-delimited profile body (length prefix already removed)
    [[nodiscard]] core::DecodeOutcome decode_profile(core::ByteView body,
                                                     ChunkPosition position = {},
                                                     DecodeStage* stage_out = nullptr) const;

    [[nodiscard]] StringLimits string_limits(ProtocolVersion version) const noexcept;

    [[nodiscard]] const core::DecoderConfig& config() const noexcept {
        return config_;
    }

  private:
    core::DecoderConfig config_;
};

}  // namespace dex_stream::parsing

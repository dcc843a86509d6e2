#pragma once

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../core/frame.hpp"
#include "../core/records.hpp"
#include "wire_format.hpp"

namespace dex_stream::parsing {

// Field decoders operate on a single RawChunk. Offsets are relative to the
// chunk's first byte, so alignment is always chunk-relative.
//
// Error reporting follows one convention: return false (or std::nullopt) and
// write the reason to error_out when provided. No decoder reads past the end
// of the chunk it is handed.

enum class PrefixWidth : uint8_t {
    SINGLE_BYTE = 0,  // Legacy: one length byte
    FLAGGED = 1,      // Enhanced: high bit of the first byte selects a 2-byte prefix
};

struct StringLimits {
    PrefixWidth width{PrefixWidth::SINGLE_BYTE};
    std::size_t ceiling{100};
};

inline void set_error(core::DecodeError* error_out, core::DecodeError error) noexcept {
    if (error_out) {
        *error_out = error;
    }
}

/**
 * @brief Map NaN and +/-Infinity to absent, pass finite values through
 *
 * Idempotent: sanitize_double(sanitize_double(x)) == sanitize_double(x)
 */
[[nodiscard]] inline core::Metric sanitize_double(double value) noexcept {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] inline core::Metric sanitize_double(core::Metric value) noexcept {
    return value ? sanitize_double(*value) : std::nullopt;
}

[[nodiscard]] inline bool read_u8(core::ByteView chunk,
                                  std::size_t& offset,
                                  uint8_t& value_out,
                                  core::DecodeError* error_out = nullptr) noexcept {
    if (offset >= chunk.size()) {
        set_error(error_out, core::DecodeError::TRUNCATED_FIELD);
        return false;
    }
    value_out = chunk[offset++];
    return true;
}

[[nodiscard]] inline bool read_u16_le(core::ByteView chunk,
                                      std::size_t& offset,
                                      uint16_t& value_out,
                                      core::DecodeError* error_out = nullptr) noexcept {
    if (offset > chunk.size() || chunk.size() - offset < 2) {
        set_error(error_out, core::DecodeError::TRUNCATED_FIELD);
        return false;
    }
    value_out = static_cast<uint16_t>(chunk[offset] | (chunk[offset + 1] << 8));
    offset += 2;
    return true;
}

// Caller guarantees 8 readable bytes at offset
[[nodiscard]] inline double load_f64_le(core::ByteView chunk, std::size_t offset) noexcept {
    uint64_t bits = 0;
    for (std::size_t i = 0; i < sizeof(uint64_t); ++i) {
        bits |= static_cast<uint64_t>(chunk[offset + i]) << (8 * i);
    }
    return std::bit_cast<double>(bits);
}

/**
 * @brief Decode one length-prefixed UTF-8 string
 *
 * On success offset moves past the string. A declared length above the
 * ceiling reports INVALID_LENGTH, clears out and advances offset past the
 * prefix only, so a misaligned read never turns into a huge copy. A declared
 * length beyond the end of the chunk reports TRUNCATED_FIELD and leaves
 * offset unchanged. Invalid UTF-8 bytes are dropped from the result.
 */
[[nodiscard]] bool decode_length_prefixed_string(core::ByteView chunk,
                                                 std::size_t& offset,
                                                 const StringLimits& limits,
                                                 std::string& out,
                                                 core::DecodeError* error_out = nullptr) noexcept;

/**
 * @brief Read count little-endian doubles starting at the next 8-byte boundary
 *
 * Padding before the boundary is skipped without being interpreted. On
 * success offset points just past the block; on TRUNCATED_FIELD it is left
 * unchanged and out is untouched.
 */
[[nodiscard]] bool decode_aligned_f64_block(core::ByteView chunk,
                                            std::size_t& offset,
                                            std::span<double> out,
                                            core::DecodeError* error_out = nullptr) noexcept;

// Append the well-formed UTF-8 sequences of bytes to out, dropping any byte
// that does not start or continue a valid sequence
void append_valid_utf8(std::string_view bytes, std::string& out);

// Remove C0 controls, DEL and C1 controls (U+0080..U+009F)
void strip_control_characters(std::string& text);

// Shorten to at most max_bytes without splitting a UTF-8 sequence
void truncate_utf8(std::string& text, std::size_t max_bytes);

}  // namespace dex_stream::parsing

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "../core/frame.hpp"

namespace dex_stream::parsing {

// Header layout variant, selects chunking and string prefix width
enum class ProtocolVersion : uint8_t {
    LEGACY = 0,    // "1.3.0": 1-byte string prefixes, pairs only
    ENHANCED = 1,  // "1.4.0": 1/2-byte string prefixes, adds OHLC and profiles
};

enum class MessageType : uint8_t {
    PAIRS = 0,     // Fixed 512-byte chunks
    OHLC = 1,      // Self-delimited chunks
    PROFILES = 2,  // Self-delimited chunks
};

// Frame layout:
//   0x00 '\n' <version ascii> '\n' <type tag ascii> <u32 LE advisory count> <payload>
inline constexpr uint8_t kFrameSignature = 0x00;
inline constexpr uint8_t kFrameSeparator = '\n';
inline constexpr std::size_t kMaxVersionLength = 16;
inline constexpr std::size_t kAdvisoryCountSize = 4;

inline constexpr std::string_view kLegacyVersion = "1.3.0";
inline constexpr std::string_view kEnhancedVersion = "1.4.0";

// No tag is a prefix of another, so tags are matched by prefix
inline constexpr std::array<std::pair<std::string_view, MessageType>, 3> kTypeTags{
    {{"pairs", MessageType::PAIRS}, {"ohlc", MessageType::OHLC}, {"profiles", MessageType::PROFILES}}};

// Pair chunks
inline constexpr std::size_t kPairChunkSize = 512;
inline constexpr std::size_t kPairStringCount = 9;
inline constexpr std::size_t kPairMetricCount = 8;

// Numeric blocks start on this boundary, relative to chunk start
inline constexpr std::size_t kMetricAlignment = 8;

// Self-delimited chunks: u16 LE body length, then body
inline constexpr std::size_t kChunkLengthPrefixSize = 2;

// Timestamp, open, high, low, close, volume lead every OHLC numeric block
inline constexpr std::size_t kOhlcRequiredValues = 6;

// Enhanced 2-byte string prefix flag
inline constexpr uint8_t kWidePrefixFlag = 0x80;

// Pair creation timestamps at or beyond 2100-01-01 are implausible
inline constexpr int64_t kMaxPlausibleTimestamp = 4102444800;

struct FrameHeader {
    ProtocolVersion version{ProtocolVersion::LEGACY};
    MessageType type{MessageType::PAIRS};
    uint32_t advertised_count{0};  // Advisory, never used for chunking
    std::size_t payload_offset{0};
};

[[nodiscard]] constexpr std::string_view to_string(ProtocolVersion version) noexcept {
    return version == ProtocolVersion::LEGACY ? kLegacyVersion : kEnhancedVersion;
}

[[nodiscard]] constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::PAIRS:
            return "pairs";
        case MessageType::OHLC:
            return "ohlc";
        case MessageType::PROFILES:
            return "profiles";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_supported(ProtocolVersion version, MessageType type) noexcept {
    return type == MessageType::PAIRS || version == ProtocolVersion::ENHANCED;
}

[[nodiscard]] constexpr bool is_self_delimited(MessageType type) noexcept {
    return type != MessageType::PAIRS;
}

[[nodiscard]] constexpr std::size_t align_up(std::size_t offset, std::size_t alignment) noexcept {
    return (offset + alignment - 1) / alignment * alignment;
}

/**
 * @brief Parse and validate the frame header
 *
 * @return Header on success, std::nullopt for a missing signature, unknown
 *         version, unknown tag, tag not valid for the version, or a frame
 *         shorter than its header
 */
[[nodiscard]] inline std::optional<FrameHeader> parse_frame_header(core::ByteView bytes) noexcept {
    if (bytes.size() < 2 || bytes[0] != kFrameSignature || bytes[1] != kFrameSeparator) {
        return std::nullopt;
    }

    // Version runs up to the next separator
    std::size_t pos = 2;
    const std::size_t version_start = pos;
    while (pos < bytes.size() && bytes[pos] != kFrameSeparator) {
        if (pos - version_start >= kMaxVersionLength) {
            return std::nullopt;
        }
        ++pos;
    }
    if (pos >= bytes.size()) {
        return std::nullopt;
    }

    std::string_view version_text(reinterpret_cast<const char*>(bytes.data() + version_start), pos - version_start);
    FrameHeader header;
    if (version_text == kLegacyVersion) {
        header.version = ProtocolVersion::LEGACY;
    } else if (version_text == kEnhancedVersion) {
        header.version = ProtocolVersion::ENHANCED;
    } else {
        return std::nullopt;
    }
    ++pos;  // separator

    std::string_view rest(reinterpret_cast<const char*>(bytes.data() + pos), bytes.size() - pos);
    bool tag_found = false;
    for (const auto& [tag, type] : kTypeTags) {
        if (rest.substr(0, tag.size()) == tag) {
            header.type = type;
            pos += tag.size();
            tag_found = true;
            break;
        }
    }
    if (!tag_found || !is_supported(header.version, header.type)) {
        return std::nullopt;
    }

    if (bytes.size() - pos < kAdvisoryCountSize) {
        return std::nullopt;
    }
    header.advertised_count = static_cast<uint32_t>(bytes[pos]) | (static_cast<uint32_t>(bytes[pos + 1]) << 8) |
                              (static_cast<uint32_t>(bytes[pos + 2]) << 16) |
                              (static_cast<uint32_t>(bytes[pos + 3]) << 24);
    header.payload_offset = pos + kAdvisoryCountSize;
    return header;
}

}  // namespace dex_stream::parsing

#include "field_decoders.hpp"

namespace dex_stream::parsing {

namespace {

constexpr bool is_continuation(uint8_t byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

constexpr bool in_range(uint8_t byte, uint8_t lo, uint8_t hi) noexcept {
    return byte >= lo && byte <= hi;
}

// Length of the well-formed sequence starting at bytes[pos], 0 if malformed.
// Rejects overlong encodings, surrogates and code points above U+10FFFF.
std::size_t valid_sequence_length(std::string_view bytes, std::size_t pos) noexcept {
    const auto lead = static_cast<uint8_t>(bytes[pos]);
    const std::size_t remaining = bytes.size() - pos;
    auto at = [&](std::size_t i) { return static_cast<uint8_t>(bytes[pos + i]); };

    if (lead < 0x80) {
        return 1;
    }
    if (in_range(lead, 0xC2, 0xDF)) {
        return remaining >= 2 && is_continuation(at(1)) ? 2 : 0;
    }
    if (in_range(lead, 0xE0, 0xEF)) {
        if (remaining < 3) {
            return 0;
        }
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead == 0xE0) {
            lo = 0xA0;
        } else if (lead == 0xED) {
            hi = 0x9F;
        }
        return in_range(at(1), lo, hi) && is_continuation(at(2)) ? 3 : 0;
    }
    if (in_range(lead, 0xF0, 0xF4)) {
        if (remaining < 4) {
            return 0;
        }
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead == 0xF0) {
            lo = 0x90;
        } else if (lead == 0xF4) {
            hi = 0x8F;
        }
        return in_range(at(1), lo, hi) && is_continuation(at(2)) && is_continuation(at(3)) ? 4 : 0;
    }
    return 0;
}

}  // namespace

void append_valid_utf8(std::string_view bytes, std::string& out) {
    out.reserve(out.size() + bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t len = valid_sequence_length(bytes, pos);
        if (len == 0) {
            ++pos;  // Drop the offending byte, resync on the next one
            continue;
        }
        out.append(bytes.substr(pos, len));
        pos += len;
    }
}

void strip_control_characters(std::string& text) {
    std::size_t write = 0;
    for (std::size_t read = 0; read < text.size(); ++read) {
        const auto byte = static_cast<uint8_t>(text[read]);
        if (byte < 0x20 || byte == 0x7F) {
            continue;
        }
        // C1 controls are encoded as C2 80..C2 9F
        if (byte == 0xC2 && read + 1 < text.size() && in_range(static_cast<uint8_t>(text[read + 1]), 0x80, 0x9F)) {
            ++read;
            continue;
        }
        text[write++] = text[read];
    }
    text.resize(write);
}

void truncate_utf8(std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && is_continuation(static_cast<uint8_t>(text[cut]))) {
        --cut;
    }
    text.resize(cut);
}

bool decode_length_prefixed_string(core::ByteView chunk,
                                   std::size_t& offset,
                                   const StringLimits& limits,
                                   std::string& out,
                                   core::DecodeError* error_out) noexcept {
    std::size_t cursor = offset;

    uint8_t first = 0;
    if (!read_u8(chunk, cursor, first, error_out)) {
        return false;
    }

    std::size_t length = first;
    if (limits.width == PrefixWidth::FLAGGED && (first & kWidePrefixFlag)) {
        uint8_t second = 0;
        if (!read_u8(chunk, cursor, second, error_out)) {
            return false;
        }
        length = (static_cast<std::size_t>(first & 0x7F) << 8) | second;
    }

    if (length > limits.ceiling) {
        out.clear();
        offset = cursor;
        set_error(error_out, core::DecodeError::INVALID_LENGTH);
        return false;
    }

    if (chunk.size() - cursor < length) {
        set_error(error_out, core::DecodeError::TRUNCATED_FIELD);
        return false;
    }

    out.clear();
    append_valid_utf8(std::string_view(reinterpret_cast<const char*>(chunk.data() + cursor), length), out);
    offset = cursor + length;
    return true;
}

bool decode_aligned_f64_block(core::ByteView chunk,
                              std::size_t& offset,
                              std::span<double> out,
                              core::DecodeError* error_out) noexcept {
    const std::size_t start = align_up(offset, kMetricAlignment);
    const std::size_t needed = out.size() * sizeof(double);

    if (start > chunk.size() || chunk.size() - start < needed) {
        set_error(error_out, core::DecodeError::TRUNCATED_FIELD);
        return false;
    }

    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = load_f64_le(chunk, start + i * sizeof(double));
    }
    offset = start + needed;
    return true;
}

}  // namespace dex_stream::parsing

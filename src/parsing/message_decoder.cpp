#include "message_decoder.hpp"

#include <algorithm>
#include <utility>

namespace dex_stream::parsing {

MessageDecoder::MessageDecoder(const core::DecoderConfig& config, std::shared_ptr<spdlog::logger> logger) noexcept
    : record_decoder_(config), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::vector<core::DecodeOutcome> MessageDecoder::decode_message(const core::Frame& frame) const {
    return decode_message(frame.bytes);
}

std::vector<core::DecodeOutcome> MessageDecoder::decode_message(core::ByteView bytes) const {
    std::vector<core::DecodeOutcome> outcomes;

    const auto header = parse_frame_header(bytes);
    if (!header) {
        logger_->debug("[Decoder] Rejected frame of {} bytes: unrecognized header", bytes.size());
        outcomes.emplace_back(core::Skip{core::DecodeError::UNRECOGNIZED_FRAME, 0, 0});
        return outcomes;
    }

    const core::ByteView payload = bytes.subspan(header->payload_offset);
    if (is_self_delimited(header->type)) {
        decode_delimited_chunks(*header, payload, outcomes);
    } else {
        decode_fixed_chunks(*header, payload, outcomes);
    }

    if (outcomes.size() != header->advertised_count) {
        logger_->debug("[Decoder] {} {} frame advertised {} records, found {} chunks",
                       to_string(header->version),
                       to_string(header->type),
                       header->advertised_count,
                       outcomes.size());
    }
    return outcomes;
}

void MessageDecoder::decode_fixed_chunks(const FrameHeader& header,
                                         core::ByteView payload,
                                         std::vector<core::DecodeOutcome>& outcomes) const {
    outcomes.reserve((payload.size() + kPairChunkSize - 1) / kPairChunkSize);

    uint32_t index = 0;
    for (std::size_t offset = 0; offset < payload.size(); offset += kPairChunkSize, ++index) {
        const std::size_t length = std::min(kPairChunkSize, payload.size() - offset);
        const ChunkPosition position{index, offset};

        if (length < kPairChunkSize) {
            // Never zero-padded
            core::Skip skip{core::DecodeError::TRUNCATED_FIELD, index, offset};
            log_skip(header, skip);
            outcomes.emplace_back(skip);
            break;
        }

        auto outcome = record_decoder_.decode(header.type, header.version, payload.subspan(offset, length), position);
        if (const auto* skip = std::get_if<core::Skip>(&outcome)) {
            log_skip(header, *skip);
        }
        outcomes.push_back(std::move(outcome));
    }
}

void MessageDecoder::decode_delimited_chunks(const FrameHeader& header,
                                             core::ByteView payload,
                                             std::vector<core::DecodeOutcome>& outcomes) const {
    uint32_t index = 0;
    std::size_t offset = 0;

    while (offset < payload.size()) {
        const std::size_t chunk_start = offset;
        uint16_t body_length = 0;
        core::DecodeError error = core::DecodeError::TRUNCATED_FIELD;

        if (!read_u16_le(payload, offset, body_length, &error)) {
            core::Skip skip{error, index, chunk_start};
            log_skip(header, skip);
            outcomes.emplace_back(skip);
            return;
        }

        if (body_length == 0) {
            // Advance past the prefix and keep walking
            core::Skip skip{core::DecodeError::INVALID_LENGTH, index++, chunk_start};
            log_skip(header, skip);
            outcomes.emplace_back(skip);
            continue;
        }

        if (payload.size() - offset < body_length) {
            core::Skip skip{core::DecodeError::TRUNCATED_FIELD, index, chunk_start};
            log_skip(header, skip);
            outcomes.emplace_back(skip);
            return;
        }

        auto outcome = record_decoder_.decode(
            header.type, header.version, payload.subspan(offset, body_length), ChunkPosition{index, chunk_start});
        if (const auto* skip = std::get_if<core::Skip>(&outcome)) {
            log_skip(header, *skip);
        }
        outcomes.push_back(std::move(outcome));

        offset += body_length;
        ++index;
    }
}

void MessageDecoder::log_skip(const FrameHeader& header, const core::Skip& skip) const {
    logger_->debug("[Decoder] Skipped {} chunk #{} at offset {}: {}",
                   to_string(header.type),
                   skip.chunk_index,
                   skip.offset,
                   core::to_string(skip.reason));
}

}  // namespace dex_stream::parsing

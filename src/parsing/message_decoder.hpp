#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "../core/configuration.hpp"
#include "../core/frame.hpp"
#include "../core/records.hpp"
#include "record_decoder.hpp"
#include "wire_format.hpp"

namespace dex_stream::parsing {

/**
 * @brief Validates a frame, splits its payload into chunks and decodes each
 *
 * Pure function of the input bytes apart from debug logging. The returned
 * outcome sequence preserves chunk order. A frame with an unrecognized
 * header decodes to exactly one Skip(UNRECOGNIZED_FRAME); otherwise every
 * chunk, including a trailing partial one, produces exactly one outcome.
 *
 * Example usage:
 * @code
 * MessageDecoder decoder(config.get_decoder());
 * for (auto& outcome : decoder.decode_message(frame)) {
 *     if (auto record = core::take_record(std::move(outcome))) {
 *         ...
 *     }
 * }
 * @endcode
 */
class MessageDecoder {
  public:
    explicit MessageDecoder(const core::DecoderConfig& config = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr) noexcept;

    [[nodiscard]] std::vector<core::DecodeOutcome> decode_message(const core::Frame& frame) const;

    [[nodiscard]] std::vector<core::DecodeOutcome> decode_message(core::ByteView bytes) const;

    [[nodiscard]] const RecordDecoder& record_decoder() const noexcept {
        return record_decoder_;
    }

  private:
    // Stride slicing; a trailing partial chunk becomes Skip(TRUNCATED_FIELD)
    void decode_fixed_chunks(const FrameHeader& header,
                             core::ByteView payload,
                             std::vector<core::DecodeOutcome>& outcomes) const;

    // In-band u16 lengths; an overrunning length ends the walk
    void decode_delimited_chunks(const FrameHeader& header,
                                 core::ByteView payload,
                                 std::vector<core::DecodeOutcome>& outcomes) const;

    void log_skip(const FrameHeader& header, const core::Skip& skip) const;

    RecordDecoder record_decoder_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace dex_stream::parsing

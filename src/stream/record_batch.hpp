#pragma once

#include <cstddef>
#include <vector>

#include "../core/frame.hpp"
#include "../core/records.hpp"
#include "record_filter.hpp"

namespace dex_stream::stream {

// Records forwarded from one frame, in chunk order
struct RecordBatch {
    std::vector<core::Record> records;
    std::size_t skipped{0};   // Chunks that did not decode
    std::size_t filtered{0};  // Decoded records the filter rejected
    core::WallClock::time_point received_at{};

    [[nodiscard]] bool empty() const noexcept {
        return records.empty();
    }
};

/**
 * @brief Keep the decoded records of one frame that pass the filter
 *
 * The filter's clock is the frame's receipt time.
 */
[[nodiscard]] RecordBatch make_batch(std::vector<core::DecodeOutcome>&& outcomes,
                                     const RecordFilter& filter,
                                     core::WallClock::time_point received_at);

// Split into consecutive batches of at most max_records; 0 keeps one batch
[[nodiscard]] std::vector<RecordBatch> split_batch(RecordBatch&& batch, std::size_t max_records);

}  // namespace dex_stream::stream

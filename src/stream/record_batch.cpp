#include "record_batch.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace dex_stream::stream {

RecordBatch make_batch(std::vector<core::DecodeOutcome>&& outcomes,
                       const RecordFilter& filter,
                       core::WallClock::time_point received_at) {
    RecordBatch batch;
    batch.received_at = received_at;
    batch.records.reserve(outcomes.size());

    for (auto& outcome : outcomes) {
        auto record = core::take_record(std::move(outcome));
        if (!record) {
            ++batch.skipped;
            continue;
        }
        if (!filter.matches(*record, received_at)) {
            ++batch.filtered;
            continue;
        }
        batch.records.push_back(std::move(*record));
    }
    return batch;
}

std::vector<RecordBatch> split_batch(RecordBatch&& batch, std::size_t max_records) {
    std::vector<RecordBatch> parts;
    if (max_records == 0 || batch.records.size() <= max_records) {
        parts.push_back(std::move(batch));
        return parts;
    }

    for (std::size_t start = 0; start < batch.records.size(); start += max_records) {
        RecordBatch part;
        part.received_at = batch.received_at;
        const std::size_t end = std::min(start + max_records, batch.records.size());
        part.records.assign(std::make_move_iterator(batch.records.begin() + start),
                            std::make_move_iterator(batch.records.begin() + end));
        parts.push_back(std::move(part));
    }

    // Frame-level counts stay with the first part
    parts.front().skipped = batch.skipped;
    parts.front().filtered = batch.filtered;
    return parts;
}

}  // namespace dex_stream::stream

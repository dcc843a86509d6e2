#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

namespace dex_stream::core {

using ByteView = std::span<const uint8_t>;
using WallClock = std::chrono::system_clock;

/**
 * @brief One inbound WebSocket message
 *
 * Non-owning view over the transport's read buffer. A Frame is only valid for
 * the duration of the decode call it is handed to; the buffer is reused for
 * the next read.
 */
struct Frame {
    ByteView bytes;
    WallClock::time_point received_at{};

    Frame() = default;
    Frame(ByteView data, WallClock::time_point received) noexcept : bytes(data), received_at(received) {}

    [[nodiscard]] std::size_t size() const noexcept {
        return bytes.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return bytes.empty();
    }
};

}  // namespace dex_stream::core

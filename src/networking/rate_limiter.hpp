#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace dex_stream::networking {

/**
 * @brief Token bucket gating outbound requests
 *
 * Refills at rate tokens per second up to burst. reserve() always takes a
 * token and returns how long the caller must wait before using it; the
 * balance may go negative, so concurrent reservations queue up behind each
 * other instead of all firing when the bucket refills.
 *
 * Independent of reconnect backoff.
 */
class TokenBucket {
  public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double rate_per_second, uint32_t burst, Clock::time_point now = Clock::now()) noexcept
        : rate_(rate_per_second), burst_(static_cast<double>(burst)), tokens_(static_cast<double>(burst)), last_(now) {}

    [[nodiscard]] Clock::duration reserve(Clock::time_point now = Clock::now()) noexcept {
        refill(now);
        tokens_ -= 1.0;
        if (tokens_ >= 0.0) {
            return Clock::duration::zero();
        }
        return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(-tokens_ / rate_));
    }

    // Tokens available at now; negative while reservations are outstanding
    [[nodiscard]] double available(Clock::time_point now = Clock::now()) noexcept {
        refill(now);
        return tokens_;
    }

    [[nodiscard]] double rate() const noexcept {
        return rate_;
    }

    [[nodiscard]] double burst() const noexcept {
        return burst_;
    }

  private:
    void refill(Clock::time_point now) noexcept {
        if (now <= last_) {
            return;
        }
        const double elapsed = std::chrono::duration<double>(now - last_).count();
        tokens_ = std::min(burst_, tokens_ + elapsed * rate_);
        last_ = now;
    }

    double rate_;
    double burst_;
    double tokens_;
    Clock::time_point last_;
};

}  // namespace dex_stream::networking

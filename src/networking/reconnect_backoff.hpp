#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

#include "../core/configuration.hpp"

namespace dex_stream::networking {

/**
 * @brief Exponential reconnect schedule with a retry cap
 *
 * delay_for(n) = min(initial_delay * base^n, max_delay). It is a pure
 * function of the attempt counter and non-decreasing in n since base >= 1.
 * The counter advances once per backoff wait and resets on CONNECTED.
 * max_retries counts connect attempts, the first one included.
 * Jitter, when configured, only perturbs the value returned by next_wait().
 */
class ReconnectBackoff {
  public:
    using Duration = std::chrono::milliseconds;

    explicit ReconnectBackoff(const core::ConnectionConfig& config, uint32_t seed = std::random_device{}())
        : initial_delay_ms_(config.initial_delay_ms),
          max_delay_ms_(config.max_delay_ms),
          base_(config.backoff_base),
          jitter_ratio_(config.jitter_ratio),
          max_retries_(config.max_retries),
          rng_(seed) {}

    [[nodiscard]] Duration delay_for(uint32_t attempt) const noexcept {
        const double scaled = static_cast<double>(initial_delay_ms_) * std::pow(base_, static_cast<double>(attempt));
        if (!std::isfinite(scaled) || scaled >= static_cast<double>(max_delay_ms_)) {
            return Duration(max_delay_ms_);
        }
        return Duration(static_cast<Duration::rep>(scaled));
    }

    // Delay for the current attempt, jittered, then advance the counter
    [[nodiscard]] Duration next_wait() {
        const Duration delay = delay_for(attempt_);
        ++attempt_;

        if (jitter_ratio_ <= 0.0) {
            return delay;
        }
        std::uniform_real_distribution<double> jitter(-jitter_ratio_, jitter_ratio_);
        const double jittered = static_cast<double>(delay.count()) * (1.0 + jitter(rng_));
        return Duration(static_cast<Duration::rep>(std::max(0.0, jittered)));
    }

    // Un-jittered delay the next wait will be based on
    [[nodiscard]] Duration current_delay() const noexcept {
        return delay_for(attempt_);
    }

    void reset() noexcept {
        attempt_ = 0;
    }

    // True when the attempt that just failed was the last of max_retries
    [[nodiscard]] bool exhausted() const noexcept {
        return attempt_ + 1 >= max_retries_;
    }

    [[nodiscard]] uint32_t attempt() const noexcept {
        return attempt_;
    }

    [[nodiscard]] uint32_t max_retries() const noexcept {
        return max_retries_;
    }

  private:
    uint32_t initial_delay_ms_;
    uint32_t max_delay_ms_;
    double base_;
    double jitter_ratio_;
    uint32_t max_retries_;

    uint32_t attempt_{0};
    std::mt19937 rng_;
};

}  // namespace dex_stream::networking

#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategy for retry loops.
 *
 * @copyright Copyright (c) 2026 rangekv Project
 *
 * A backoff strategy maps a 0-based retry iteration to a delay. The retry
 * loop asks for `delay()` and waits on something it can interrupt, as the
 * Router does.
 *
 * Design Philosophy:
 * - Header-only: Zero overhead, easy to inline
 * - Plain value type: copied into RetryOptions, no shared state
 */
#include <algorithm>
#include <chrono>

namespace rangekv::utils
{

// ============================================================================
// Backoff Strategies
// ============================================================================

/**
 * @brief Capped exponential backoff.
 * @details delay(n) = min(initial * multiplier^n, max_delay).
 *
 * With the router defaults (1s, x2, 30s cap):
 * - n=0: 1s
 * - n=1: 2s
 * - n=4: 16s
 * - n>=5: 30s
 *
 * The sequence is non-decreasing and never exceeds max_delay, however long
 * the retry run. A multiplier below 1.0 is treated as 1.0.
 *
 * @example
 * ExponentialBackoff backoff{1000ms, 30000ms, 2.0};
 * int iteration = 0;
 * while (!try_send()) {
 *     wait_or_stop(backoff.delay(iteration++));
 * }
 */
struct ExponentialBackoff
{
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier{2.0};

    /**
     * @brief Computes the delay for a retry iteration (0-based).
     */
    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        const double factor = std::max(multiplier, 1.0);
        const double cap = static_cast<double>(max_delay.count());
        double value = static_cast<double>(initial.count());
        for (int i = 0; i < iteration && value < cap; ++i)
        {
            value *= factor;
        }
        value = std::min(value, cap);
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
    }
};

} // namespace rangekv::utils

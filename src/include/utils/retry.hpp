#pragma once
/**
 * @file retry.hpp
 * @brief Retry loop with capped exponential backoff.
 *
 * The callable is invoked once per attempt and decides whether the loop is
 * done (`RetryStatus::Break`) or should back off and try again
 * (`RetryStatus::Continue`). `max_attempts == 0` retries indefinitely.
 *
 * The wait between attempts is delegated to a sleeper so callers that must
 * stay interruptible (the Router on shutdown) can wait on a condition
 * variable instead of sleeping. A sleeper returns false to abort the loop.
 */
#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace rangekv::utils
{

enum class RetryStatus
{
    Break,   ///< Attempt finished the loop (success or terminal failure).
    Continue ///< Attempt failed in a retryable way; back off and try again.
};

enum class RetryOutcome
{
    Done,              ///< The callable returned Break.
    AttemptsExhausted, ///< max_attempts reached without Break.
    Interrupted        ///< The sleeper aborted the wait.
};

inline const char *to_string(RetryOutcome outcome) noexcept
{
    switch (outcome)
    {
    case RetryOutcome::Done:
        return "Done";
    case RetryOutcome::AttemptsExhausted:
        return "AttemptsExhausted";
    case RetryOutcome::Interrupted:
        return "Interrupted";
    default:
        return "Unknown";
    }
}

struct RetryOptions
{
    std::string tag;            ///< Describes the operation in log lines.
    ExponentialBackoff backoff; ///< Delay schedule between attempts.
    int max_attempts{0};        ///< 0 = retry indefinitely.
};

/**
 * @brief Runs @p fn until it returns Break, attempts run out, or @p sleeper
 *        returns false.
 * @param fn      `RetryStatus(int attempt)`; attempt is 0-based.
 * @param sleeper `bool(std::chrono::milliseconds)`; false interrupts the loop.
 */
template <typename Fn, typename Sleeper>
RetryOutcome retry_with_backoff(const RetryOptions &opts, Fn &&fn, Sleeper &&sleeper)
{
    for (int attempt = 0;; ++attempt)
    {
        if (fn(attempt) == RetryStatus::Break)
        {
            return RetryOutcome::Done;
        }
        if (opts.max_attempts > 0 && attempt + 1 >= opts.max_attempts)
        {
            LOGGER_WARN("{}: giving up after {} attempts", opts.tag, attempt + 1);
            return RetryOutcome::AttemptsExhausted;
        }
        const auto wait = opts.backoff.delay(attempt);
        LOGGER_DEBUG("{}: attempt {} failed; backing off {}ms", opts.tag, attempt + 1,
                     wait.count());
        if (!sleeper(wait))
        {
            return RetryOutcome::Interrupted;
        }
    }
}

} // namespace rangekv::utils

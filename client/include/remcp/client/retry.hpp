#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <utility>

#include "remcp/error_codes.hpp"
#include "remcp/timing.hpp"

namespace remcp::client
{

    // Busy servers and dropped connections are worth another attempt. File
    // and protocol errors are not.
    bool is_retryable(const TransferError &error) noexcept;

    struct RetryPolicy
    {
        std::size_t max_attempts{5};
        std::chrono::milliseconds backoff{std::chrono::seconds{1}};
        std::function<bool(const TransferError &)> retryable{is_retryable};
    };

    // Calls fn(attempt) with attempt starting at 1 until it returns. Sleeps
    // policy.backoff between attempts and calls on_retry(attempt, error) before
    // each sleep. The last error is rethrown once attempts run out.
    template <typename Fn, typename OnRetry>
    auto attempt_with_retry(const RetryPolicy &policy, const SleepFunction &sleep, Fn &&fn, OnRetry &&on_retry)
        -> decltype(fn(std::size_t{1}))
    {
        const std::size_t limit = policy.max_attempts == 0 ? 1 : policy.max_attempts;
        for (std::size_t attempt = 1;; ++attempt)
        {
            try
            {
                return fn(attempt);
            }
            catch (const TransferError &error)
            {
                const bool retry = policy.retryable ? policy.retryable(error) : is_retryable(error);
                if (!retry || attempt >= limit)
                {
                    throw;
                }
                on_retry(attempt, error);
                if (sleep)
                {
                    sleep(policy.backoff);
                }
            }
        }
    }

} // namespace remcp::client

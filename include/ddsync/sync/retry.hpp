#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/core/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace ddsync::sync {

enum class FailureClass {
    Retryable,
    Fatal
};

/**
 * @brief Bounded retry with exponential backoff for single network operations
 *
 * Network errors and transient service statuses (5xx, 408, 429) are retried.
 * Auth, NotFound, Integrity and every other error fail immediately. Once the
 * attempt budget is spent the last error is returned, annotated, and the
 * caller treats it as final for the owning node.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(uint32_t attempt, const Error& error, std::chrono::milliseconds delay)>;

    explicit RetryPolicy(RetrySettings settings, Sleeper sleeper = real_sleeper());

    static FailureClass classify(const Error& error);

    static Sleeper real_sleeper();

    /// Delay after the given failed attempt (1-based), doubling up to the cap
    std::chrono::milliseconds backoff_for(uint32_t attempt) const;

    uint32_t max_attempts() const { return settings_.max_attempts; }

    /**
     * @brief Runs op until it succeeds, fails fatally or runs out of attempts
     *
     * @param attempts  Receives the number of attempts made
     * @param cancelled Checked before every attempt; when set the operation
     *                  is abandoned with a Cancelled error
     */
    template<typename Operation>
    auto run(const std::string& what, Operation&& op, uint32_t* attempts = nullptr,
             const std::atomic<bool>* cancelled = nullptr, const RetryObserver& on_retry = {}) const
        -> decltype(op()) {
        using ResultType = decltype(op());

        const uint32_t limit = settings_.max_attempts == 0 ? 1 : settings_.max_attempts;
        for (uint32_t attempt = 1;; ++attempt) {
            if (cancelled && cancelled->load()) {
                return ResultType(ErrValue<Error>(Error::cancelled(what + " cancelled")));
            }

            ResultType result = op();
            if (attempts) {
                *attempts = attempt;
            }
            if (result.is_ok() || classify(result.error()) == FailureClass::Fatal) {
                return result;
            }

            if (attempt >= limit) {
                Error error = result.error();
                error.message = what + " gave up after " + std::to_string(attempt) +
                                " attempt(s): " + error.message;
                return ResultType(ErrValue<Error>(std::move(error)));
            }

            const auto delay = backoff_for(attempt);
            if (on_retry) {
                on_retry(attempt, result.error(), delay);
            }
            sleeper_(delay);
        }
    }

private:
    RetrySettings settings_;
    Sleeper sleeper_;
};

} // namespace ddsync::sync

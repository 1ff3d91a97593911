#include "ddsync/sync/retry.hpp"

#include <algorithm>
#include <thread>

namespace ddsync::sync {

RetryPolicy::RetryPolicy(RetrySettings settings, Sleeper sleeper)
    : settings_(settings), sleeper_(std::move(sleeper)) {}

FailureClass RetryPolicy::classify(const Error& error) {
    switch (error.kind) {
        case ErrorKind::Network:
            return FailureClass::Retryable;
        case ErrorKind::Service:
            if (error.status >= 500 || error.status == 408 || error.status == 429) {
                return FailureClass::Retryable;
            }
            return FailureClass::Fatal;
        case ErrorKind::Filesystem:
        case ErrorKind::Auth:
        case ErrorKind::Integrity:
        case ErrorKind::Validation:
        case ErrorKind::NotFound:
        case ErrorKind::Cancelled:
            return FailureClass::Fatal;
    }
    return FailureClass::Fatal;
}

RetryPolicy::Sleeper RetryPolicy::real_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t attempt) const {
    auto delay = settings_.initial_backoff;
    for (uint32_t i = 1; i < attempt && delay < settings_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings_.max_backoff);
}

} // namespace ddsync::sync

// =============================================================================
// SmartScreen - Bounded Retry
// =============================================================================
// Retries an operation returning Result<T> while it fails with one specific
// ErrorKind, sleeping delay * attempt between tries (linear backoff). Any
// other error is returned immediately.
// =============================================================================
#pragma once
#include <chrono>
#include <functional>
#include <thread>
#include "result.hpp"
#include "screen_log.hpp"

namespace smartscreen {

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds delay{200};
    // Replaced in tests to avoid real sleeps
    std::function<void(std::chrono::milliseconds)> sleep =
        [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
};

template<typename Op>
auto retry_with_backoff(const RetryPolicy& policy, ErrorKind retry_on, const char* what, Op&& op)
    -> decltype(op()) {
    int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1;; attempt++) {
        auto result = op();
        if (result.is_ok() || result.error().kind != retry_on) {
            if (result.is_ok() && attempt > 1) {
                SLOG_INFO("retry", "%s succeeded on attempt %d/%d", what, attempt, attempts);
            }
            return result;
        }
        if (attempt >= attempts) {
            SLOG_WARN("retry", "%s still failing after %d attempt(s): %s", what, attempts,
                      result.error().message.c_str());
            return result;
        }
        auto wait = policy.delay * attempt;
        SLOG_INFO("retry", "%s: %s, retry %d/%d in %lld ms", what,
                  result.error().message.c_str(), attempt, attempts - 1,
                  static_cast<long long>(wait.count()));
        if (policy.sleep) policy.sleep(wait);
    }
}

} // namespace smartscreen

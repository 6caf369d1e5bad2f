#pragma once
#include "Log.hpp"
#include "ObjectStore.hpp"
#include <chrono>
#include <string>
#include <thread>

struct RetryPolicy {
    int attempts{3};
    std::chrono::milliseconds initial_delay{500};
    int multiplier{2};
};

// Re-invokes fn while it reports TransientError, sleeping with exponential
// backoff between attempts. Any other result is returned as is.
template <typename Fn>
ObjectResult retryTransient(const RetryPolicy& policy, const std::string& what, Fn&& fn) {
    auto delay = policy.initial_delay;
    ObjectResult result = fn();
    for (int attempt = 1; attempt < policy.attempts && result.code == ResultCode::TransientError; ++attempt) {
        logDebug(what + " failed (" + result.error + "), retry " + std::to_string(attempt) + " in " +
                 std::to_string(delay.count()) + "ms");
        std::this_thread::sleep_for(delay);
        delay *= policy.multiplier;
        result = fn();
    }
    return result;
}

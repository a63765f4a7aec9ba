#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <tasv/db/connection.hh>
#include <thread>

namespace tasv::db {

struct RetryPolicy {
    size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{50};
    std::chrono::milliseconds max_delay{1000};
};

// Runs @p func and reruns it while it throws ConcurrencyConflict, sleeping between attempts with
// the delay doubling up to policy.max_delay. After the last attempt the exception propagates.
// Meant for secondary writes only: a retried claim or publish could act on a stale intent.
template <class Func> // NOLINTNEXTLINE(cppcoreguidelines-missing-std-forward)
decltype(auto) repeat_if_conflicted(const RetryPolicy& policy, Func&& func) {
    auto delay = policy.initial_delay;
    for (size_t attempt = 1;; ++attempt) {
        try {
            return func();
        } catch (const ConcurrencyConflict&) {
            if (attempt >= policy.max_attempts) {
                throw;
            }
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, policy.max_delay);
    }
}

} // namespace tasv::db

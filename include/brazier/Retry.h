// include/brazier/Retry.h
#pragma once

#include "brazier/Clock.h"

#include <algorithm>
#include <cmath>

namespace brazier {

struct RetryPolicy
{
    int    attempts        = 10;
    double intervalSeconds = 1.0;

    // "Wait up to `timeout` seconds, checking every `interval` seconds."
    [[nodiscard]] static RetryPolicy ForTimeout(double timeoutSeconds, double intervalSeconds = 1.0) noexcept
    {
        RetryPolicy p;
        p.intervalSeconds = std::max(0.001, intervalSeconds);
        p.attempts = std::max(1, static_cast<int>(std::ceil(timeoutSeconds / p.intervalSeconds)));
        return p;
    }
};

// Checks `done` up to `policy.attempts` times, sleeping `intervalSeconds`
// after each failed check. Returns true as soon as `done` does.
template <class Predicate>
[[nodiscard]] bool RetryUntil(IClock& clock, const RetryPolicy& policy, Predicate&& done)
{
    for (int attempt = 0; attempt < policy.attempts; ++attempt)
    {
        if (done())
            return true;
        clock.sleep(policy.intervalSeconds);
    }
    return false;
}

} // namespace brazier

#include "gateway/resilience/RetryPolicy.h"

#include <algorithm>

namespace gateway {
namespace resilience {

int64_t BackoffMs(const route::RetryPolicy& policy, int retryIndex) {
    if (policy.initialBackoffMs <= 0) {
        return 0;
    }
    int64_t delay = policy.initialBackoffMs;
    for (int i = 0; i < retryIndex; ++i) {
        if (delay >= policy.maxBackoffMs) {
            break;
        }
        delay *= 2;
    }
    return std::min(delay, policy.maxBackoffMs);
}

int64_t OverallDeadlineMs(const route::RetryPolicy& retry, const route::TimeoutPolicy& timeout) {
    const int retries = std::max(0, retry.maxRetries);
    int64_t total = static_cast<int64_t>(retries + 1) * timeout.requestTimeoutMs;
    for (int n = 0; n < retries; ++n) {
        total += BackoffMs(retry, n);
    }
    return total;
}

bool IsRetryableStatus(const route::RetryPolicy& policy, int status) {
    return policy.retryableStatuses.count(status) > 0;
}

} // namespace resilience
} // namespace gateway

#pragma once

#include "gateway/route/Route.h"

#include <cstdint>

namespace gateway {
namespace resilience {

// Delay before the n-th retry (n starts at 0): min(initial * 2^n, max).
int64_t BackoffMs(const route::RetryPolicy& policy, int retryIndex);

// (maxRetries + 1) attempt timeouts plus every backoff in between.
int64_t OverallDeadlineMs(const route::RetryPolicy& retry, const route::TimeoutPolicy& timeout);

bool IsRetryableStatus(const route::RetryPolicy& policy, int status);

} // namespace resilience
} // namespace gateway

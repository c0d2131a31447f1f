#include "gateway/common/Logger.h"
#include "gateway/resilience/RetryPolicy.h"
#include "gateway/route/Route.h"

#include <cassert>

using namespace gateway::resilience;
using gateway::route::RetryPolicy;
using gateway::route::TimeoutPolicy;

void testBackoff() {
    RetryPolicy p;
    p.initialBackoffMs = 100;
    p.maxBackoffMs = 1000;
    assert(BackoffMs(p, 0) == 100);
    assert(BackoffMs(p, 1) == 200);
    assert(BackoffMs(p, 2) == 400);
    assert(BackoffMs(p, 3) == 800);
    assert(BackoffMs(p, 4) == 1000);
    assert(BackoffMs(p, 60) == 1000);

    p.initialBackoffMs = 0;
    assert(BackoffMs(p, 3) == 0);
    LOG_INFO << "Backoff PASS";
}

void testOverallDeadline() {
    RetryPolicy p;
    p.maxRetries = 3;
    p.initialBackoffMs = 100;
    p.maxBackoffMs = 10000;
    TimeoutPolicy t;
    t.requestTimeoutMs = 1000;
    // 4 attempts plus 100 + 200 + 400 of backoff
    assert(OverallDeadlineMs(p, t) == 4700);

    p.maxRetries = 0;
    assert(OverallDeadlineMs(p, t) == 1000);
    LOG_INFO << "Deadline PASS";
}

void testRetryableStatuses() {
    RetryPolicy p;
    assert(IsRetryableStatus(p, 502));
    assert(IsRetryableStatus(p, 503));
    assert(IsRetryableStatus(p, 504));
    assert(!IsRetryableStatus(p, 500));
    assert(!IsRetryableStatus(p, 404));
    p.retryableStatuses = {429};
    assert(IsRetryableStatus(p, 429));
    assert(!IsRetryableStatus(p, 503));
    LOG_INFO << "Retryable statuses PASS";
}

int main() {
    testBackoff();
    testOverallDeadline();
    testRetryableStatuses();
    return 0;
}

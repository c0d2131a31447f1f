#include "gateway/balancer/Endpoint.h"

namespace gateway {
namespace balancer {

Endpoint::Endpoint(const std::string& serviceId,
                   const std::string& host,
                   uint16_t port,
                   const gateway::network::InetAddress& address,
                   bool healthy)
    : id_(MakeId(host, port)),
      serviceId_(serviceId),
      host_(host),
      port_(port),
      address_(address),
      healthy_(healthy),
      consecutiveSuccesses_(0),
      consecutiveFailures_(0),
      activeConnections_(0) {
}

bool Endpoint::SetHealthy(bool healthy) {
    consecutiveSuccesses_.store(0);
    consecutiveFailures_.store(0);
    return healthy_.exchange(healthy, std::memory_order_acq_rel);
}

HealthTransition Endpoint::RecordCheckResult(bool ok, int unhealthyThreshold, int healthyThreshold) {
    if (ok) {
        consecutiveFailures_.store(0);
        int successes = consecutiveSuccesses_.fetch_add(1) + 1;
        if (successes >= healthyThreshold) {
            bool expected = false;
            if (healthy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
                return HealthTransition::kBecameHealthy;
            }
        }
    } else {
        consecutiveSuccesses_.store(0);
        int failures = consecutiveFailures_.fetch_add(1) + 1;
        if (failures >= unhealthyThreshold) {
            bool expected = true;
            if (healthy_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
                return HealthTransition::kBecameUnhealthy;
            }
        }
    }
    return HealthTransition::kNone;
}

void Endpoint::IncrementActive() {
    activeConnections_.fetch_add(1, std::memory_order_acq_rel);
}

void Endpoint::DecrementActive() {
    int64_t current = activeConnections_.load(std::memory_order_acquire);
    while (current > 0 &&
           !activeConnections_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
    }
}

} // namespace balancer
} // namespace gateway

#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/InetAddress.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace gateway {
namespace balancer {

enum class HealthTransition {
    kNone,
    kBecameHealthy,
    kBecameUnhealthy,
};

// Per-service health probing parameters.
struct HealthCheckSpec {
    std::string mode = "http";  // http | tcp | off
    std::string path = "/healthz";
    double intervalSec = 10.0;
    double timeoutSec = 5.0;
    int unhealthyThreshold = 3;
    int healthyThreshold = 2;
};

// One backend address of a service. Identity is fixed; health and counters
// are atomics updated concurrently by checks and request attempts.
class Endpoint : gateway::common::noncopyable {
public:
    Endpoint(const std::string& serviceId,
             const std::string& host,
             uint16_t port,
             const gateway::network::InetAddress& address,
             bool healthy);

    const std::string& id() const { return id_; }
    const std::string& serviceId() const { return serviceId_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const gateway::network::InetAddress& address() const { return address_; }

    bool healthy() const { return healthy_.load(std::memory_order_acquire); }
    // Returns the previous value.
    bool SetHealthy(bool healthy);

    // Applies one check result against the thresholds.
    HealthTransition RecordCheckResult(bool ok, int unhealthyThreshold, int healthyThreshold);
    int ConsecutiveSuccesses() const { return consecutiveSuccesses_.load(); }
    int ConsecutiveFailures() const { return consecutiveFailures_.load(); }

    int64_t ActiveConnections() const { return activeConnections_.load(std::memory_order_acquire); }
    void IncrementActive();
    // Never drops below zero.
    void DecrementActive();

    static std::string MakeId(const std::string& host, uint16_t port) {
        return host + ":" + std::to_string(port);
    }

private:
    const std::string id_;
    const std::string serviceId_;
    const std::string host_;
    const uint16_t port_;
    const gateway::network::InetAddress address_;

    std::atomic<bool> healthy_;
    std::atomic<int> consecutiveSuccesses_;
    std::atomic<int> consecutiveFailures_;
    std::atomic<int64_t> activeConnections_;
};

using EndpointPtr = std::shared_ptr<Endpoint>;

} // namespace balancer
} // namespace gateway

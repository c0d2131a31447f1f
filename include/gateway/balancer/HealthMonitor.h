#pragma once

#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/balancer/HealthChecker.h"
#include "gateway/common/noncopyable.h"

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace gateway {
namespace network {
class EventLoop;
class Timer;
}

namespace balancer {

// Periodically checks every endpoint of every service with that service's
// HealthCheckSpec and feeds the results into the registry's thresholds.
// Runs entirely on one loop; an endpoint whose previous check is still in
// flight is skipped for that round.
class HealthMonitor : gateway::common::noncopyable {
public:
    HealthMonitor(gateway::network::EventLoop* loop, EndpointRegistry* registry, double tickSec = 1.0);
    ~HealthMonitor();

    void Start();
    void Stop();

    // Checks every eligible endpoint now, ignoring per-service intervals.
    void CheckAll();

    size_t InFlight() const { return inFlight_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    void Tick();
    void CheckService(const ServiceInfo& service);
    HealthCheckerPtr CheckerFor(const std::string& serviceId, const HealthCheckSpec& spec);
    static std::string CheckerKey(const HealthCheckSpec& spec);

    gateway::network::EventLoop* loop_;
    EndpointRegistry* registry_;
    double tickSec_;
    std::unique_ptr<gateway::network::Timer> timer_;

    std::map<std::string, std::pair<std::string, HealthCheckerPtr>> checkers_;
    std::map<std::string, Clock::time_point> nextDue_;
    std::set<std::string> inFlight_;
    // Expires with the monitor; check callbacks check it before touching this.
    std::shared_ptr<bool> alive_;
};

} // namespace balancer
} // namespace gateway

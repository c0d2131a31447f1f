#include "gateway/balancer/HealthMonitor.h"
#include "gateway/balancer/HttpHealthChecker.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Timer.h"

#include <sstream>

namespace gateway {
namespace balancer {

HealthMonitor::HealthMonitor(gateway::network::EventLoop* loop, EndpointRegistry* registry, double tickSec)
    : loop_(loop),
      registry_(registry),
      tickSec_(tickSec > 0.0 ? tickSec : 1.0),
      alive_(std::make_shared<bool>(true)) {
}

HealthMonitor::~HealthMonitor() {
    *alive_ = false;
}

void HealthMonitor::Start() {
    loop_->RunInLoop([this]() {
        if (!timer_) {
            timer_.reset(new gateway::network::Timer(loop_));
        }
        timer_->StartPeriodic(tickSec_, [this]() { Tick(); });
        LOG_INFO << "HealthMonitor started, tick " << tickSec_ << "s";
    });
}

void HealthMonitor::Stop() {
    loop_->RunInLoop([this]() {
        if (timer_) {
            timer_->Cancel();
        }
    });
}

std::string HealthMonitor::CheckerKey(const HealthCheckSpec& spec) {
    std::ostringstream oss;
    oss << spec.mode << "|" << spec.path << "|" << spec.timeoutSec;
    return oss.str();
}

HealthCheckerPtr HealthMonitor::CheckerFor(const std::string& serviceId, const HealthCheckSpec& spec) {
    const std::string key = CheckerKey(spec);
    auto it = checkers_.find(serviceId);
    if (it != checkers_.end() && it->second.first == key) {
        return it->second.second;
    }
    HealthCheckerPtr checker;
    if (spec.mode == "tcp") {
        checker = std::make_shared<TcpHealthChecker>(loop_, spec.timeoutSec);
    } else {
        checker = std::make_shared<HttpHealthChecker>(loop_, spec.timeoutSec, spec.path);
    }
    checkers_[serviceId] = std::make_pair(key, checker);
    return checker;
}

void HealthMonitor::Tick() {
    const Clock::time_point now = Clock::now();
    std::set<std::string> live;
    for (const auto& service : registry_->ListServices()) {
        live.insert(service.serviceId);
        if (service.healthCheck.mode == "off") {
            continue;
        }
        auto due = nextDue_.find(service.serviceId);
        if (due != nextDue_.end() && now < due->second) {
            continue;
        }
        const auto interval = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(service.healthCheck.intervalSec));
        nextDue_[service.serviceId] = now + interval;
        CheckService(service);
    }
    // forget services that were removed
    for (auto it = checkers_.begin(); it != checkers_.end();) {
        it = live.count(it->first) ? std::next(it) : checkers_.erase(it);
    }
    for (auto it = nextDue_.begin(); it != nextDue_.end();) {
        it = live.count(it->first) ? std::next(it) : nextDue_.erase(it);
    }
}

void HealthMonitor::CheckAll() {
    loop_->RunInLoop([this]() {
        for (const auto& service : registry_->ListServices()) {
            if (service.healthCheck.mode != "off") {
                CheckService(service);
            }
        }
    });
}

void HealthMonitor::CheckService(const ServiceInfo& service) {
    if (service.endpoints.empty()) {
        return;
    }
    HealthCheckerPtr checker = CheckerFor(service.serviceId, service.healthCheck);
    const int unhealthyThreshold = service.healthCheck.unhealthyThreshold;
    const int healthyThreshold = service.healthCheck.healthyThreshold;

    for (const auto& ep : service.endpoints) {
        const std::string id = ep->id();
        if (!inFlight_.insert(id).second) {
            LOG_DEBUG << "Health check for " << id << " still in flight, skipping";
            continue;
        }
        std::weak_ptr<bool> alive(alive_);
        checker->Check(ep->address(), [this, alive, id, unhealthyThreshold, healthyThreshold](
                                          bool ok, const gateway::network::InetAddress&) {
            auto token = alive.lock();
            if (!token || !*token) {
                return;
            }
            inFlight_.erase(id);
            registry_->RecordCheckResult(id, ok, unhealthyThreshold, healthyThreshold);
        });
    }
}

} // namespace balancer
} // namespace gateway

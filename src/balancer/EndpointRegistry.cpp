#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/common/Logger.h"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace gateway {
namespace balancer {

EndpointPtr EndpointRegistry::CreateEndpoint(const std::string& serviceId,
                                             const std::string& host,
                                             uint16_t port,
                                             bool ready) const {
    gateway::network::InetAddress addr;
    if (!gateway::network::InetAddress::Resolve(host, port, &addr)) {
        LOG_WARN << "EndpointRegistry: cannot resolve " << host << ":" << port << " for " << serviceId;
        return nullptr;
    }
    return std::make_shared<Endpoint>(serviceId, host, port, addr, ready);
}

void EndpointRegistry::EraseFromServiceLocked(ServiceEntry* entry, const std::string& endpointId) {
    auto& eps = entry->endpoints;
    eps.erase(std::remove_if(eps.begin(), eps.end(),
                             [&endpointId](const EndpointPtr& ep) { return ep->id() == endpointId; }),
              eps.end());
}

void EndpointRegistry::NotifyRemoved(const std::vector<std::string>& ids) const {
    for (const auto& id : ids) {
        LOG_INFO << "Endpoint " << id << " removed";
        if (removalListener_) {
            removalListener_(id);
        }
    }
}

void EndpointRegistry::UpsertService(const std::string& serviceId, const HealthCheckSpec& spec) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    services_[serviceId].healthCheck = spec;
}

bool EndpointRegistry::RemoveService(const std::string& serviceId) {
    std::vector<std::string> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = services_.find(serviceId);
        if (it == services_.end()) {
            return false;
        }
        for (const auto& ep : it->second.endpoints) {
            byId_.erase(ep->id());
            removed.push_back(ep->id());
        }
        services_.erase(it);
    }
    LOG_INFO << "Service " << serviceId << " removed";
    NotifyRemoved(removed);
    return true;
}

EndpointPtr EndpointRegistry::UpsertEndpoint(const std::string& serviceId,
                                             const std::string& host,
                                             uint16_t port,
                                             bool ready) {
    const std::string id = Endpoint::MakeId(host, port);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto existing = byId_.find(id);
    if (existing != byId_.end()) {
        if (existing->second->serviceId() == serviceId) {
            return existing->second;
        }
        // moving to another service: one owner only
        EndpointPtr old = existing->second;
        auto oldService = services_.find(old->serviceId());
        if (oldService != services_.end()) {
            EraseFromServiceLocked(&oldService->second, id);
        }
        EndpointPtr moved = std::make_shared<Endpoint>(serviceId, host, port, old->address(), old->healthy());
        services_[serviceId].endpoints.push_back(moved);
        existing->second = moved;
        LOG_INFO << "Endpoint " << id << " moved from " << old->serviceId() << " to " << serviceId;
        return moved;
    }

    EndpointPtr ep = CreateEndpoint(serviceId, host, port, ready);
    if (!ep) {
        return nullptr;
    }
    services_[serviceId].endpoints.push_back(ep);
    byId_[id] = ep;
    LOG_INFO << "Endpoint " << id << " registered for " << serviceId << (ready ? "" : " (not ready)");
    return ep;
}

bool EndpointRegistry::RemoveEndpoint(const std::string& serviceId, const std::string& host, uint16_t port) {
    const std::string id = Endpoint::MakeId(host, port);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto byId = byId_.find(id);
        if (byId == byId_.end() || byId->second->serviceId() != serviceId) {
            return false;
        }
        auto service = services_.find(serviceId);
        if (service != services_.end()) {
            EraseFromServiceLocked(&service->second, id);
        }
        byId_.erase(byId);
    }
    NotifyRemoved({id});
    return true;
}

void EndpointRegistry::ReplaceEndpoints(const std::string& serviceId, const std::vector<EndpointSpec>& endpoints) {
    std::vector<std::string> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        ServiceEntry& entry = services_[serviceId];
        std::vector<EndpointPtr> next;
        std::unordered_set<std::string> keep;
        for (const auto& spec : endpoints) {
            const std::string id = Endpoint::MakeId(spec.host, spec.port);
            if (!keep.insert(id).second) {
                continue;
            }
            EndpointPtr ep;
            auto existing = byId_.find(id);
            if (existing != byId_.end() && existing->second->serviceId() == serviceId) {
                ep = existing->second;
            } else if (existing != byId_.end()) {
                EndpointPtr old = existing->second;
                auto oldService = services_.find(old->serviceId());
                if (oldService != services_.end()) {
                    EraseFromServiceLocked(&oldService->second, id);
                }
                ep = std::make_shared<Endpoint>(serviceId, spec.host, spec.port, old->address(), old->healthy());
            } else {
                ep = CreateEndpoint(serviceId, spec.host, spec.port, spec.ready);
                if (!ep) {
                    continue;
                }
            }
            byId_[id] = ep;
            next.push_back(ep);
        }
        for (const auto& ep : entry.endpoints) {
            if (keep.count(ep->id()) == 0) {
                byId_.erase(ep->id());
                removed.push_back(ep->id());
            }
        }
        entry.endpoints.swap(next);
    }
    LOG_DEBUG << "Service " << serviceId << " now has " << endpoints.size() << " endpoint(s)";
    NotifyRemoved(removed);
}

std::vector<EndpointPtr> EndpointRegistry::Lookup(const std::string& serviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(serviceId);
    if (it == services_.end()) {
        return {};
    }
    return it->second.endpoints;
}

EndpointPtr EndpointRegistry::Find(const std::string& endpointId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = byId_.find(endpointId);
    return it == byId_.end() ? nullptr : it->second;
}

bool EndpointRegistry::HasService(const std::string& serviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return services_.count(serviceId) != 0;
}

std::vector<ServiceInfo> EndpointRegistry::ListServices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ServiceInfo> out;
    out.reserve(services_.size());
    for (const auto& kv : services_) {
        out.push_back(ServiceInfo{kv.first, kv.second.healthCheck, kv.second.endpoints});
    }
    return out;
}

size_t EndpointRegistry::ServiceCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return services_.size();
}

HealthCheckSpec EndpointRegistry::HealthCheckFor(const std::string& serviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(serviceId);
    return it == services_.end() ? HealthCheckSpec() : it->second.healthCheck;
}

bool EndpointRegistry::MarkHealth(const std::string& endpointId, bool healthy) {
    EndpointPtr ep = Find(endpointId);
    if (!ep) {
        return false;
    }
    if (ep->SetHealthy(healthy) != healthy) {
        LOG_INFO << "Endpoint " << endpointId << " health changed to " << (healthy ? "UP" : "DOWN");
    }
    return true;
}

HealthTransition EndpointRegistry::RecordCheckResult(const std::string& endpointId,
                                               bool ok,
                                               int unhealthyThreshold,
                                               int healthyThreshold) {
    EndpointPtr ep = Find(endpointId);
    if (!ep) {
        return HealthTransition::kNone;
    }
    HealthTransition t = ep->RecordCheckResult(ok, unhealthyThreshold, healthyThreshold);
    if (t == HealthTransition::kBecameHealthy) {
        LOG_INFO << "Endpoint " << endpointId << " health changed to UP";
    } else if (t == HealthTransition::kBecameUnhealthy) {
        LOG_WARN << "Endpoint " << endpointId << " health changed to DOWN";
    }
    return t;
}

} // namespace balancer
} // namespace gateway

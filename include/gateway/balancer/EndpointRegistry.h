#pragma once

#include "gateway/balancer/Endpoint.h"
#include "gateway/common/noncopyable.h"

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway {
namespace balancer {

struct EndpointSpec {
    std::string host;
    uint16_t port = 0;
    bool ready = true;
};

struct ServiceInfo {
    std::string serviceId;
    HealthCheckSpec healthCheck;
    std::vector<EndpointPtr> endpoints;
};

// Services ("namespace/name") and their endpoints, fed by configuration and
// the discovery API. The structure sits behind a reader/writer lock;
// per-endpoint state is atomic inside Endpoint. Lookups hand out shared
// pointers, so a concurrent removal never invalidates a copy already taken.
class EndpointRegistry : gateway::common::noncopyable {
public:
    using RemovalListener = std::function<void(const std::string& endpointId)>;

    void SetRemovalListener(RemovalListener cb) { removalListener_ = std::move(cb); }

    void UpsertService(const std::string& serviceId, const HealthCheckSpec& spec);
    bool RemoveService(const std::string& serviceId);

    // Creates the service if needed. An endpoint registered under another
    // service moves here. Existing endpoints keep their state; ready only
    // seeds the health of a new endpoint.
    EndpointPtr UpsertEndpoint(const std::string& serviceId, const std::string& host, uint16_t port, bool ready);
    bool RemoveEndpoint(const std::string& serviceId, const std::string& host, uint16_t port);
    // Makes the service's endpoint list exactly `endpoints`, in that order.
    void ReplaceEndpoints(const std::string& serviceId, const std::vector<EndpointSpec>& endpoints);

    std::vector<EndpointPtr> Lookup(const std::string& serviceId) const;
    EndpointPtr Find(const std::string& endpointId) const;
    bool HasService(const std::string& serviceId) const;
    std::vector<ServiceInfo> ListServices() const;
    size_t ServiceCount() const;
    HealthCheckSpec HealthCheckFor(const std::string& serviceId) const;

    bool MarkHealth(const std::string& endpointId, bool healthy);
    HealthTransition RecordCheckResult(const std::string& endpointId, bool ok, int unhealthyThreshold, int healthyThreshold);

private:
    struct ServiceEntry {
        HealthCheckSpec healthCheck;
        std::vector<EndpointPtr> endpoints;
    };

    EndpointPtr CreateEndpoint(const std::string& serviceId, const std::string& host, uint16_t port, bool ready) const;
    // Caller holds the write lock.
    void EraseFromServiceLocked(ServiceEntry* entry, const std::string& endpointId);
    void NotifyRemoved(const std::vector<std::string>& ids) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, ServiceEntry> services_;
    std::unordered_map<std::string, EndpointPtr> byId_;
    RemovalListener removalListener_;
};

} // namespace balancer
} // namespace gateway

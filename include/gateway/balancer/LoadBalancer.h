#pragma once

#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/protocol/HttpHeaders.h"
#include "gateway/route/Route.h"

#include <string>
#include <vector>

namespace gateway {
namespace resilience {
class CircuitBreakerRegistry;
}

namespace balancer {

struct SelectionInput {
    std::string clientIp;
    std::string path;
    const gateway::protocol::HttpHeaders* headers = nullptr;
};

struct CandidateSet {
    enum Status {
        kOk,
        kNoHealthyEndpoint,  // nothing healthy behind any destination
        kCircuitOpen,        // healthy endpoints exist, every breaker is open
    };
    Status status = kNoHealthyEndpoint;
    std::vector<EndpointPtr> endpoints;
    size_t healthyCount = 0;
};

class LoadBalancer {
public:
    // Union of the route's destinations in declaration order, each endpoint
    // once, keeping only healthy endpoints whose breaker would admit a request.
    static CandidateSet Candidates(const gateway::route::Route& route,
                                   const EndpointRegistry& registry,
                                   const gateway::resilience::CircuitBreakerRegistry& breakers);

    // nullptr only when candidates is empty.
    static EndpointPtr Select(const gateway::route::Route& route,
                              const std::vector<EndpointPtr>& candidates,
                              const SelectionInput& input);

    static std::string HashKey(const gateway::route::Route& route, const SelectionInput& input);

    // 64-bit FNV-1a.
    static uint64_t Fnv1a(const std::string& s);
};

} // namespace balancer
} // namespace gateway

#include "gateway/balancer/LoadBalancer.h"
#include "gateway/balancer/ConsistentHashRing.h"
#include "gateway/resilience/CircuitBreakerRegistry.h"

#include <mutex>
#include <unordered_set>

namespace gateway {
namespace balancer {

using gateway::route::LbStrategy;
using gateway::route::Route;

uint64_t LoadBalancer::Fnv1a(const std::string& s) {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : s) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

CandidateSet LoadBalancer::Candidates(const Route& route,
                                      const EndpointRegistry& registry,
                                      const gateway::resilience::CircuitBreakerRegistry& breakers) {
    CandidateSet out;
    std::unordered_set<std::string> seen;
    for (const auto& dest : route.destinations) {
        for (auto& ep : registry.Lookup(dest.serviceId)) {
            if (!seen.insert(ep->id()).second || !ep->healthy()) {
                continue;
            }
            ++out.healthyCount;
            if (breakers.IsAvailable(ep->id())) {
                out.endpoints.push_back(std::move(ep));
            }
        }
    }
    if (!out.endpoints.empty()) {
        out.status = CandidateSet::kOk;
    } else if (out.healthyCount > 0) {
        out.status = CandidateSet::kCircuitOpen;
    } else {
        out.status = CandidateSet::kNoHealthyEndpoint;
    }
    return out;
}

std::string LoadBalancer::HashKey(const Route& route, const SelectionInput& input) {
    switch (route.hashKey.kind) {
        case gateway::route::HashKeySource::kPath:
            return input.path;
        case gateway::route::HashKeySource::kHeader:
            if (input.headers) {
                auto it = input.headers->find(route.hashKey.header);
                if (it != input.headers->end()) {
                    return it->second;
                }
            }
            return input.clientIp;
        case gateway::route::HashKeySource::kClientAddress:
            break;
    }
    return input.clientIp;
}

EndpointPtr LoadBalancer::Select(const Route& route,
                                 const std::vector<EndpointPtr>& candidates,
                                 const SelectionInput& input) {
    if (candidates.empty()) {
        return nullptr;
    }
    const size_t n = candidates.size();

    switch (route.strategy) {
        case LbStrategy::kRoundRobin: {
            uint64_t ticket = route.rrCounter.fetch_add(1, std::memory_order_relaxed);
            return candidates[ticket % n];
        }
        case LbStrategy::kLeastConnections: {
            size_t best = 0;
            int64_t bestActive = candidates[0]->ActiveConnections();
            for (size_t i = 1; i < n; ++i) {
                int64_t active = candidates[i]->ActiveConnections();
                if (active < bestActive) {
                    best = i;
                    bestActive = active;
                }
            }
            return candidates[best];
        }
        case LbStrategy::kSourceIp:
            return candidates[Fnv1a(input.clientIp) % n];
        case LbStrategy::kConsistentHash: {
            std::shared_ptr<const ConsistentHashRing> ring;
            {
                std::lock_guard<std::mutex> lock(route.ringMutex);
                if (!route.ring || route.ring->signature() != ConsistentHashRing::SignatureOf(candidates)) {
                    route.ring = std::make_shared<const ConsistentHashRing>(candidates);
                }
                ring = route.ring;
            }
            int idx = ring->Locate(HashKey(route, input));
            return idx < 0 ? nullptr : candidates[static_cast<size_t>(idx)];
        }
    }
    return candidates[0];
}

} // namespace balancer
} // namespace gateway

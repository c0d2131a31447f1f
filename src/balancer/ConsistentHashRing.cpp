#include "gateway/balancer/ConsistentHashRing.h"

namespace gateway {
namespace balancer {

// FNV-1a, 64-bit, followed by a murmur finaliser: plain FNV clusters the
// nearly identical replica keys.
uint64_t ConsistentHashRing::Hash(const std::string& key) {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : key) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    hash ^= hash >> 33;
    hash *= 0xff51afd7ed558ccdULL;
    hash ^= hash >> 33;
    hash *= 0xc4ceb9fe1a85ec53ULL;
    hash ^= hash >> 33;
    return hash;
}

std::string ConsistentHashRing::SignatureOf(const std::vector<EndpointPtr>& endpoints) {
    std::string sig;
    for (const auto& ep : endpoints) {
        sig += ep->id();
        sig += ',';
    }
    return sig;
}

ConsistentHashRing::ConsistentHashRing(const std::vector<EndpointPtr>& endpoints)
    : signature_(SignatureOf(endpoints)) {
    for (size_t i = 0; i < endpoints.size(); ++i) {
        const std::string& id = endpoints[i]->id();
        for (int replica = 0; replica < kVirtualNodes; ++replica) {
            // first writer keeps a colliding point so the layout is order-stable
            ring_.emplace(Hash(id + ":" + std::to_string(replica)), static_cast<int>(i));
        }
    }
}

int ConsistentHashRing::Locate(const std::string& key) const {
    if (ring_.empty()) {
        return -1;
    }
    auto it = ring_.lower_bound(Hash(key));
    if (it == ring_.end()) {
        return ring_.begin()->second;
    }
    return it->second;
}

} // namespace balancer
} // namespace gateway

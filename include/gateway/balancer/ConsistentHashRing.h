#pragma once

#include "gateway/balancer/Endpoint.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gateway {
namespace balancer {

// Immutable hash ring over one candidate set. Each endpoint contributes
// kVirtualNodes points at hash("<id>:<replica>"); a key maps to the first
// point clockwise from its own hash, wrapping to the start.
class ConsistentHashRing {
public:
    static const int kVirtualNodes = 100;

    explicit ConsistentHashRing(const std::vector<EndpointPtr>& endpoints);

    // Index into the candidate vector the ring was built from, or -1 if empty.
    int Locate(const std::string& key) const;

    // Identifies the candidate set, in order; a cached ring is reused only
    // while this stays the same.
    const std::string& signature() const { return signature_; }
    size_t points() const { return ring_.size(); }

    static std::string SignatureOf(const std::vector<EndpointPtr>& endpoints);
    static uint64_t Hash(const std::string& key);

private:
    std::map<uint64_t, int> ring_;
    std::string signature_;
};

} // namespace balancer
} // namespace gateway

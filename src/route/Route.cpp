#include "gateway/route/Route.h"
#include "gateway/common/StringUtil.h"

namespace gateway {
namespace route {

const char* PathMatchKindName(PathMatchKind kind) {
    switch (kind) {
        case PathMatchKind::kExact: return "exact";
        case PathMatchKind::kPrefix: return "prefix";
        case PathMatchKind::kWildcard: return "wildcard";
    }
    return "unknown";
}

const char* LbStrategyName(LbStrategy strategy) {
    switch (strategy) {
        case LbStrategy::kRoundRobin: return "round-robin";
        case LbStrategy::kLeastConnections: return "least-connections";
        case LbStrategy::kSourceIp: return "source-ip";
        case LbStrategy::kConsistentHash: return "consistent-hash";
    }
    return "unknown";
}

bool ParseLbStrategy(const std::string& s, LbStrategy* out) {
    const std::string v = gateway::common::ToLowerCopy(s);
    if (v == "round-robin" || v == "roundrobin" || v == "rr") {
        *out = LbStrategy::kRoundRobin;
    } else if (v == "least-connections" || v == "leastconn" || v == "least_conn") {
        *out = LbStrategy::kLeastConnections;
    } else if (v == "source-ip" || v == "ip-hash" || v == "iphash") {
        *out = LbStrategy::kSourceIp;
    } else if (v == "consistent-hash" || v == "consistent_hash" || v == "ring") {
        *out = LbStrategy::kConsistentHash;
    } else {
        return false;
    }
    return true;
}

} // namespace route
} // namespace gateway

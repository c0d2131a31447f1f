#pragma once

#include "gateway/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace balancer {
class ConsistentHashRing;
}

namespace route {

enum class PathMatchKind {
    kExact,
    kPrefix,
    kWildcard,
};

const char* PathMatchKindName(PathMatchKind kind);

enum class LbStrategy {
    kRoundRobin,
    kLeastConnections,
    kSourceIp,
    kConsistentHash,
};

const char* LbStrategyName(LbStrategy strategy);
bool ParseLbStrategy(const std::string& s, LbStrategy* out);

// Where the consistent-hash key comes from.
struct HashKeySource {
    enum Kind { kClientAddress, kPath, kHeader };
    Kind kind = kClientAddress;
    std::string header;
};

struct RouteMatch {
    PathMatchKind kind = PathMatchKind::kPrefix;
    std::string path;
    std::set<std::string> methods;  // upper-case; empty means any
    std::vector<std::pair<std::string, std::string>> headers;
};

struct Destination {
    std::string serviceId;  // "namespace/name"
    int weight = 100;
};

struct RetryPolicy {
    int maxRetries = 3;
    std::set<int> retryableStatuses = {502, 503, 504};
    bool retryOnConnectFailure = true;
    bool retryOnTimeout = true;
    int64_t initialBackoffMs = 100;
    int64_t maxBackoffMs = 10000;
};

struct TimeoutPolicy {
    int64_t requestTimeoutMs = 30000;
    int64_t connectTimeoutMs = 10000;
};

// Immutable once published in a RouteTable snapshot, apart from the two
// pieces of balancing state below.
struct Route : gateway::common::noncopyable {
    std::string id;
    RouteMatch match;
    std::vector<Destination> destinations;
    LbStrategy strategy = LbStrategy::kRoundRobin;
    HashKeySource hashKey;
    RetryPolicy retry;
    TimeoutPolicy timeout;

    mutable std::atomic<uint64_t> rrCounter{0};

    mutable std::mutex ringMutex;
    mutable std::shared_ptr<const balancer::ConsistentHashRing> ring;
};

using RoutePtr = std::shared_ptr<const Route>;

} // namespace route
} // namespace gateway

#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/resilience/CircuitBreaker.h"

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace gateway {
namespace resilience {

// One breaker per endpoint id, created lazily in Closed and dropped when the
// endpoint leaves the registry.
class CircuitBreakerRegistry : gateway::common::noncopyable {
public:
    explicit CircuitBreakerRegistry(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    CircuitBreakerPtr Get(const std::string& endpointId);
    // nullptr if none was created yet (which means Closed).
    CircuitBreakerPtr Peek(const std::string& endpointId) const;
    bool IsAvailable(const std::string& endpointId) const;
    void Remove(const std::string& endpointId);

    // Affects breakers created afterwards.
    void SetConfig(const CircuitBreakerConfig& config);
    void SetStateListener(CircuitBreaker::StateListener listener);

    std::map<std::string, CircuitState> States() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    CircuitBreakerConfig config_;
    CircuitBreaker::StateListener listener_;
    std::unordered_map<std::string, CircuitBreakerPtr> breakers_;
};

} // namespace resilience
} // namespace gateway

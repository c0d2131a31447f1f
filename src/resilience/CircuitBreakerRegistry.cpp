#include "gateway/resilience/CircuitBreakerRegistry.h"

#include <mutex>

namespace gateway {
namespace resilience {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& config)
    : config_(config) {
}

CircuitBreakerPtr CircuitBreakerRegistry::Get(const std::string& endpointId) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = breakers_.find(endpointId);
        if (it != breakers_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result = breakers_.try_emplace(endpointId, nullptr);
    if (result.second) {
        result.first->second = std::make_shared<CircuitBreaker>(endpointId, config_, listener_);
    }
    return result.first->second;
}

CircuitBreakerPtr CircuitBreakerRegistry::Peek(const std::string& endpointId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(endpointId);
    return it == breakers_.end() ? nullptr : it->second;
}

bool CircuitBreakerRegistry::IsAvailable(const std::string& endpointId) const {
    CircuitBreakerPtr breaker = Peek(endpointId);
    return !breaker || breaker->IsAvailable();
}

void CircuitBreakerRegistry::Remove(const std::string& endpointId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    breakers_.erase(endpointId);
}

void CircuitBreakerRegistry::SetConfig(const CircuitBreakerConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_ = config;
}

void CircuitBreakerRegistry::SetStateListener(CircuitBreaker::StateListener listener) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    listener_ = std::move(listener);
}

std::map<std::string, CircuitState> CircuitBreakerRegistry::States() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, CircuitState> out;
    for (const auto& kv : breakers_) {
        out[kv.first] = kv.second->GetState();
    }
    return out;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace resilience
} // namespace gateway

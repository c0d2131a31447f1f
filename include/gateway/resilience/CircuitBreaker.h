#pragma once

#include "gateway/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace gateway {
namespace resilience {

enum class CircuitState : int {
    kClosed = 0,
    kOpen = 1,
    kHalfOpen = 2,
};

const char* CircuitStateName(CircuitState state);

struct CircuitBreakerConfig {
    int failureThreshold = 5;
    int64_t cooldownMs = 60000;
};

// Per-endpoint breaker.
//
//   Closed   --failureThreshold consecutive failures-->  Open
//   Open     --cooldown elapsed, first TryAcquire-->      HalfOpen (one trial)
//   HalfOpen --trial succeeds-->                          Closed
//   HalfOpen --trial fails-->                             Open (cooldown restarts)
//
// Every transition is a compare-and-set on the state word, so concurrent
// callers agree on exactly one winner and at most one trial is outstanding.
class CircuitBreaker : gateway::common::noncopyable {
public:
    enum class Admission {
        kAllowed,
        kTrial,
        kRejected,
    };

    using StateListener = std::function<void(const std::string& id, CircuitState from, CircuitState to)>;

    CircuitBreaker(const std::string& id, const CircuitBreakerConfig& config, StateListener listener = StateListener());

    const std::string& id() const { return id_; }

    // Non-mutating: would TryAcquire admit a request right now?
    bool IsAvailable() const;
    Admission TryAcquire();

    void RecordSuccess(bool trial);
    void RecordFailure(bool trial);
    // The trial was abandoned without an outcome; the next caller may try.
    void ReleaseTrial();

    CircuitState GetState() const { return static_cast<CircuitState>(state_.load(std::memory_order_acquire)); }
    int ConsecutiveFailures() const { return consecutiveFailures_.load(std::memory_order_acquire); }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    static int64_t NowMs();
    bool CooldownElapsed() const;
    bool Transition(CircuitState from, CircuitState to);

    const std::string id_;
    const CircuitBreakerConfig config_;
    StateListener listener_;

    std::atomic<int> state_;
    std::atomic<int> consecutiveFailures_;
    std::atomic<int64_t> openedAtMs_;
    std::atomic<bool> trialInFlight_;
};

using CircuitBreakerPtr = std::shared_ptr<CircuitBreaker>;

} // namespace resilience
} // namespace gateway

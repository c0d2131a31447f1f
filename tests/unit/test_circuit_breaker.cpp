#include "gateway/common/Logger.h"
#include "gateway/resilience/CircuitBreaker.h"
#include "gateway/resilience/CircuitBreakerRegistry.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace gateway::resilience;

static CircuitBreakerConfig shortCooldown(int threshold) {
    CircuitBreakerConfig cfg;
    cfg.failureThreshold = threshold;
    cfg.cooldownMs = 50;
    return cfg;
}

void testOpensAfterThreshold() {
    CircuitBreaker cb("127.0.0.1:9001", shortCooldown(3));
    assert(cb.GetState() == CircuitState::kClosed);
    cb.RecordFailure(false);
    cb.RecordFailure(false);
    assert(cb.GetState() == CircuitState::kClosed);
    // a success in between resets the streak
    cb.RecordSuccess(false);
    assert(cb.ConsecutiveFailures() == 0);
    cb.RecordFailure(false);
    cb.RecordFailure(false);
    assert(cb.GetState() == CircuitState::kClosed);
    cb.RecordFailure(false);
    assert(cb.GetState() == CircuitState::kOpen);
    assert(!cb.IsAvailable());
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kRejected);
    LOG_INFO << "Open after threshold PASS";
}

void testHalfOpenTrialSucceeds() {
    std::vector<std::string> transitions;
    CircuitBreaker cb("ep", shortCooldown(1), [&](const std::string&, CircuitState from, CircuitState to) {
        transitions.push_back(std::string(CircuitStateName(from)) + "->" + CircuitStateName(to));
    });
    cb.RecordFailure(false);
    assert(cb.GetState() == CircuitState::kOpen);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(cb.IsAvailable());
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kTrial);
    assert(cb.GetState() == CircuitState::kHalfOpen);
    // only one trial at a time
    assert(!cb.IsAvailable());
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kRejected);

    cb.RecordSuccess(true);
    assert(cb.GetState() == CircuitState::kClosed);
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kAllowed);
    assert(transitions.size() == 3);
    assert(transitions[2] == std::string(CircuitStateName(CircuitState::kHalfOpen)) + "->" +
                                 CircuitStateName(CircuitState::kClosed));
    LOG_INFO << "HalfOpen success PASS";
}

void testHalfOpenTrialFails() {
    CircuitBreaker cb("ep", shortCooldown(1));
    cb.RecordFailure(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kTrial);
    cb.RecordFailure(true);
    assert(cb.GetState() == CircuitState::kOpen);
    // cooldown restarted
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kRejected);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kTrial);
    LOG_INFO << "HalfOpen failure PASS";
}

void testReleaseTrial() {
    CircuitBreaker cb("ep", shortCooldown(1));
    cb.RecordFailure(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kTrial);
    cb.ReleaseTrial();
    assert(cb.GetState() == CircuitState::kHalfOpen);
    assert(cb.TryAcquire() == CircuitBreaker::Admission::kTrial);
    LOG_INFO << "ReleaseTrial PASS";
}

void testSingleTrialUnderContention() {
    CircuitBreaker cb("ep", shortCooldown(1));
    cb.RecordFailure(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    std::atomic<int> trials{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
            }
            for (int j = 0; j < 100; ++j) {
                if (cb.TryAcquire() == CircuitBreaker::Admission::kTrial) {
                    trials.fetch_add(1);
                }
            }
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();
    assert(trials.load() == 1);
    LOG_INFO << "Single trial under contention PASS";
}

void testRegistry() {
    CircuitBreakerRegistry registry(shortCooldown(2));
    assert(registry.IsAvailable("a"));
    assert(registry.Peek("a") == nullptr);
    assert(registry.size() == 0);

    CircuitBreakerPtr a = registry.Get("a");
    assert(registry.Get("a") == a);
    a->RecordFailure(false);
    a->RecordFailure(false);
    assert(!registry.IsAvailable("a"));
    assert(registry.States().at("a") == CircuitState::kOpen);

    CircuitBreakerConfig cfg;
    cfg.failureThreshold = 7;
    registry.SetConfig(cfg);
    assert(registry.Get("b")->config().failureThreshold == 7);

    registry.Remove("a");
    assert(registry.Peek("a") == nullptr);
    assert(registry.IsAvailable("a"));
    assert(registry.size() == 1);
    LOG_INFO << "Registry PASS";
}

int main() {
    testOpensAfterThreshold();
    testHalfOpenTrialSucceeds();
    testHalfOpenTrialFails();
    testReleaseTrial();
    testSingleTrialUnderContention();
    testRegistry();
    return 0;
}

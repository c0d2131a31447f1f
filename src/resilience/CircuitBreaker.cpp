#include "gateway/resilience/CircuitBreaker.h"
#include "gateway/common/Logger.h"

namespace gateway {
namespace resilience {

const char* CircuitStateName(CircuitState state) {
    switch (state) {
        case CircuitState::kClosed: return "Closed";
        case CircuitState::kOpen: return "Open";
        case CircuitState::kHalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

CircuitBreaker::CircuitBreaker(const std::string& id, const CircuitBreakerConfig& config, StateListener listener)
    : id_(id),
      config_(config),
      listener_(std::move(listener)),
      state_(static_cast<int>(CircuitState::kClosed)),
      consecutiveFailures_(0),
      openedAtMs_(0),
      trialInFlight_(false) {
}

int64_t CircuitBreaker::NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool CircuitBreaker::CooldownElapsed() const {
    return NowMs() - openedAtMs_.load(std::memory_order_acquire) >= config_.cooldownMs;
}

bool CircuitBreaker::Transition(CircuitState from, CircuitState to) {
    int expected = static_cast<int>(from);
    if (!state_.compare_exchange_strong(expected, static_cast<int>(to), std::memory_order_acq_rel)) {
        return false;
    }
    if (to == CircuitState::kOpen) {
        LOG_WARN << "Circuit " << id_ << " " << CircuitStateName(from) << " -> " << CircuitStateName(to)
                 << " (failures=" << consecutiveFailures_.load() << ")";
    } else {
        LOG_INFO << "Circuit " << id_ << " " << CircuitStateName(from) << " -> " << CircuitStateName(to);
    }
    if (listener_) {
        listener_(id_, from, to);
    }
    return true;
}

bool CircuitBreaker::IsAvailable() const {
    switch (GetState()) {
        case CircuitState::kClosed:
            return true;
        case CircuitState::kOpen:
            return CooldownElapsed();
        case CircuitState::kHalfOpen:
            return !trialInFlight_.load(std::memory_order_acquire);
    }
    return false;
}

CircuitBreaker::Admission CircuitBreaker::TryAcquire() {
    while (true) {
        const CircuitState state = GetState();
        if (state == CircuitState::kClosed) {
            return Admission::kAllowed;
        }
        if (state == CircuitState::kOpen) {
            if (!CooldownElapsed()) {
                return Admission::kRejected;
            }
            if (!Transition(CircuitState::kOpen, CircuitState::kHalfOpen)) {
                continue;
            }
        }
        bool expected = false;
        if (trialInFlight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            // the state may have moved on while we raced for the slot
            if (GetState() == CircuitState::kHalfOpen) {
                return Admission::kTrial;
            }
            trialInFlight_.store(false, std::memory_order_release);
            continue;
        }
        return Admission::kRejected;
    }
}

void CircuitBreaker::RecordSuccess(bool trial) {
    consecutiveFailures_.store(0, std::memory_order_release);
    if (trial) {
        Transition(CircuitState::kHalfOpen, CircuitState::kClosed);
        trialInFlight_.store(false, std::memory_order_release);
    }
}

void CircuitBreaker::RecordFailure(bool trial) {
    const int failures = consecutiveFailures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (trial) {
        openedAtMs_.store(NowMs(), std::memory_order_release);
        Transition(CircuitState::kHalfOpen, CircuitState::kOpen);
        trialInFlight_.store(false, std::memory_order_release);
        return;
    }
    if (failures >= config_.failureThreshold && GetState() == CircuitState::kClosed) {
        openedAtMs_.store(NowMs(), std::memory_order_release);
        Transition(CircuitState::kClosed, CircuitState::kOpen);
    }
}

void CircuitBreaker::ReleaseTrial() {
    trialInFlight_.store(false, std::memory_order_release);
}

} // namespace resilience
} // namespace gateway

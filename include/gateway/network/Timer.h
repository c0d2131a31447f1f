#pragma once

#include "gateway/common/noncopyable.h"

#include <functional>
#include <memory>

namespace gateway {
namespace network {

class Channel;
class EventLoop;

// timerfd-backed timer bound to one loop. All calls must happen on that
// loop's thread. The callback may destroy the Timer.
class Timer : gateway::common::noncopyable {
public:
    using Callback = std::function<void()>;

    explicit Timer(EventLoop* loop);
    ~Timer();

    // Re-arming replaces the previous schedule and callback.
    void Start(double delaySec, Callback cb);
    void StartPeriodic(double intervalSec, Callback cb);
    void Cancel();

    bool armed() const { return armed_; }

private:
    void Arm(double delaySec, double intervalSec);
    void HandleRead();

    EventLoop* loop_;
    int timerfd_;
    // The channel can outlive the Timer by one dispatch round; its callback
    // only reaches the Timer while this token is alive.
    std::shared_ptr<Timer*> alive_;
    std::shared_ptr<Channel> channel_;
    Callback callback_;
    bool armed_;
    bool periodic_;
};

} // namespace network
} // namespace gateway

#include "gateway/network/Timer.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <sys/timerfd.h>
#include <unistd.h>

namespace gateway {
namespace network {

namespace {

struct timespec ToTimespec(double sec) {
    struct timespec ts;
    if (sec < 0.0) sec = 0.0;
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - static_cast<double>(ts.tv_sec)) * 1e9);
    // a zero it_value disarms the timer
    if (ts.tv_sec == 0 && ts.tv_nsec < 1000) {
        ts.tv_nsec = 1000;
    }
    return ts;
}

} // namespace

Timer::Timer(EventLoop* loop)
    : loop_(loop),
      timerfd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      alive_(std::make_shared<Timer*>(this)),
      armed_(false),
      periodic_(false) {
    if (timerfd_ < 0) {
        LOG_ERROR << "Timer: timerfd_create failed: " << strerror(errno);
        throw std::system_error(errno, std::generic_category(), "timerfd_create");
    }
    channel_ = std::make_shared<Channel>(loop_, timerfd_);
    std::weak_ptr<Timer*> alive(alive_);
    channel_->SetReadCallback([alive](std::chrono::system_clock::time_point) {
        // an expiry collected in the same poll round as our destruction
        if (std::shared_ptr<Timer*> self = alive.lock()) {
            (*self)->HandleRead();
        }
    });
    channel_->EnableReading();
}

Timer::~Timer() {
    Cancel();
    alive_.reset();
    channel_->DisableAll();
    channel_->Remove();
    int fd = timerfd_;
    if (loop_->IsInLoopThread() && loop_->looping()) {
        // We may be inside this channel's own read callback: keep the Channel
        // and the fd alive until the current dispatch round has finished.
        std::shared_ptr<Channel> keep = channel_;
        loop_->QueueInLoop([keep, fd]() { ::close(fd); });
    } else {
        ::close(fd);
    }
}

void Timer::Start(double delaySec, Callback cb) {
    callback_ = std::move(cb);
    periodic_ = false;
    Arm(delaySec, 0.0);
}

void Timer::StartPeriodic(double intervalSec, Callback cb) {
    callback_ = std::move(cb);
    periodic_ = true;
    Arm(intervalSec, intervalSec);
}

void Timer::Cancel() {
    if (!armed_) {
        return;
    }
    armed_ = false;
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    if (::timerfd_settime(timerfd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer: timerfd_settime (cancel) failed: " << strerror(errno);
    }
    // drain a pending expiry so it is not delivered after the cancel
    uint64_t expirations;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    (void)n;
}

void Timer::Arm(double delaySec, double intervalSec) {
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value = ToTimespec(delaySec);
    if (intervalSec > 0.0) {
        howlong.it_interval = ToTimespec(intervalSec);
    }
    if (::timerfd_settime(timerfd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer: timerfd_settime failed: " << strerror(errno);
        armed_ = false;
        return;
    }
    armed_ = true;
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations || !armed_) {
        return;
    }
    if (!periodic_) {
        armed_ = false;
    }
    // the callback may destroy this Timer; run it from a local copy
    Callback cb = callback_;
    if (cb) {
        cb();
    }
}

} // namespace network
} // namespace gateway

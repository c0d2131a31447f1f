#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EpollPoller.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace gateway {
namespace network {

// One loop per thread. Everything touching a connection, forward attempt or
// timer owned by this loop must run on its thread; other threads hand work
// over with RunInLoop/QueueInLoop.
class EventLoop : gateway::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    bool looping() const { return looping_; }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // wakeup fd
    void DoPendingFunctors();

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool callingPendingFunctors_;

    const std::thread::id threadId_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    EpollPoller::ChannelList activeChannels_;

    std::mutex mutex_;
    std::vector<Functor> pendingFunctors_;
};

} // namespace network
} // namespace gateway

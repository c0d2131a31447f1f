#pragma once

#include "gateway/common/noncopyable.h"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gateway {
namespace network {

class EventLoop;

// A thread running its own EventLoop; StartLoop blocks until the loop exists.
class EventLoopThread : gateway::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    EventLoop* StartLoop();
    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

// Worker loops handed out round-robin to new connections. With zero threads
// everything runs on the base loop.
class EventLoopThreadPool : gateway::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    EventLoop* GetNextLoop();
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace gateway

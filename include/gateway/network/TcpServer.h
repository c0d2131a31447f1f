#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Callbacks.h"
#include "gateway/network/EventLoopThreadPool.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/TcpConnection.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace gateway {
namespace network {

class Acceptor;
class EventLoop;
class Timer;

// Accepts on the base loop and hands each connection to a worker loop.
// The connection map is only touched on the base loop.
class TcpServer : gateway::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    uint16_t port() const;

    void SetThreadNum(int numThreads);
    // 0 disables. Idle connections are force-closed by a periodic sweep.
    void SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec = 1.0);

    void Start();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    std::atomic_int started_;
    int nextConnId_;
    ConnectionMap connections_;

    double idleTimeoutSec_;
    double cleanupIntervalSec_;
    std::unique_ptr<Timer> cleanupTimer_;
};

} // namespace network
} // namespace gateway

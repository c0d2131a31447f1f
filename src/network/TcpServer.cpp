#include "gateway/network/TcpServer.h"
#include "gateway/network/Acceptor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/network/Timer.h"
#include "gateway/common/Logger.h"

#include <cstdio>
#include <functional>
#include <vector>

namespace gateway {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      nextConnId_(1),
      idleTimeoutSec_(0.0),
      cleanupIntervalSec_(1.0) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    cleanupTimer_.reset();
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

uint16_t TcpServer::port() const {
    return acceptor_->BoundPort();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
    idleTimeoutSec_ = idleTimeoutSec;
    cleanupIntervalSec_ = (cleanupIntervalSec > 0.0) ? cleanupIntervalSec : 1.0;
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        loop_->RunInLoop([this]() {
            if (idleTimeoutSec_ > 0.0) {
                cleanupTimer_ = std::make_unique<Timer>(loop_);
                cleanupTimer_->StartPeriodic(cleanupIntervalSec_, [this]() { CleanupIdleConnections(); });
            }
            acceptor_->Listen();
        });
    }
}

void TcpServer::CleanupIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (const auto& item : connections_) {
        const TcpConnectionPtr& conn = item.second;
        if (conn && now - conn->LastActiveTime() > timeout) {
            LOG_INFO << "TcpServer [" << name_ << "] closing idle connection " << item.first
                     << " peer=" << conn->peerAddress().toIpPort();
            toClose.push_back(conn);
        }
    }

    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    InetAddress localAddr(Socket::GetLocalAddr(sockfd));
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd, localAddr, peerAddr);
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // deferred so removal never re-enters a TcpConnection callback
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace gateway

#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Channel.h"
#include "gateway/network/Socket.h"

#include <functional>

namespace gateway {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : gateway::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { newConnectionCallback_ = std::move(cb); }

    bool listening() const { return listening_; }
    void Listen();

    // Actual bound port; differs from the configured one when that was 0.
    uint16_t BoundPort() const;

private:
    void HandleRead();

    EventLoop* loop_;
    Socket acceptSocket_;
    Channel acceptChannel_;
    NewConnectionCallback newConnectionCallback_;
    bool listening_;
};

} // namespace network
} // namespace gateway

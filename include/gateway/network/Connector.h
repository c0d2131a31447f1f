#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Callbacks.h"
#include "gateway/network/InetAddress.h"

#include <functional>
#include <memory>

namespace gateway {
namespace network {

class Channel;
class EventLoop;

// Single non-blocking connect attempt. Success hands over the fd; failure
// reports errno once. Retrying is the caller's decision. Must be owned by a
// shared_ptr.
class Connector : public std::enable_shared_from_this<Connector>,
                  gateway::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(NewConnectionCallback cb) { newConnectionCallback_ = std::move(cb); }
    void SetConnectFailureCallback(ConnectFailureCallback cb) { connectFailureCallback_ = std::move(cb); }

    void Start();
    // No callback fires after Stop.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ConnectFailureCallback connectFailureCallback_;
};

} // namespace network
} // namespace gateway

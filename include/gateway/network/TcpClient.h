#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/Callbacks.h"
#include "gateway/network/InetAddress.h"

#include <memory>
#include <string>

namespace gateway {
namespace network {

class Connector;
class EventLoop;

// One upstream connection for one forwarding attempt. Connect() runs at most
// once: a refused or failed connect goes to the failure callback and is never
// retried here. Everything, destruction included, happens on the loop's
// thread; the destructor detaches all callbacks and force-closes a live
// connection.
class TcpClient : gateway::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    void Connect();

    const std::string& name() const { return name_; }
    const InetAddress& serverAddress() const { return serverAddr_; }
    bool connected() const { return static_cast<bool>(connection_); }

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetConnectFailureCallback(ConnectFailureCallback cb);

private:
    void NewConnection(int sockfd);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const InetAddress serverAddr_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    bool started_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace gateway

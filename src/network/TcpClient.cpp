#include "gateway/network/TcpClient.h"
#include "gateway/network/Connector.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/common/Logger.h"

namespace gateway {
namespace network {

namespace {

void DestroyConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      serverAddr_(serverAddr),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      started_(false) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
}

TcpClient::~TcpClient() {
    if (connection_) {
        TcpConnectionPtr conn;
        conn.swap(connection_);
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback(MessageCallback());
        conn->SetCloseCallback(std::bind(&DestroyConnection, loop_, std::placeholders::_1));
        conn->ForceClose();
    } else {
        // connect may still be in flight
        connector_->SetConnectFailureCallback(ConnectFailureCallback());
        connector_->Stop();
    }
}

void TcpClient::SetConnectFailureCallback(ConnectFailureCallback cb) {
    connector_->SetConnectFailureCallback(std::move(cb));
}

void TcpClient::Connect() {
    if (started_) {
        LOG_WARN << "TcpClient[" << name_ << "] connect requested twice, ignored";
        return;
    }
    started_ = true;
    LOG_DEBUG << "TcpClient[" << name_ << "] connecting to " << serverAddr_.toIpPort();
    connector_->Start();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress localAddr(Socket::GetLocalAddr(sockfd));
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        loop_, name_ + ":" + localAddr.toIpPort(), sockfd, localAddr, serverAddr_);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));
    connection_ = conn;
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    connection_.reset();
    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace gateway

#include "gateway/network/Connector.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Socket.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace gateway {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() = default;

void Connector::Start() {
    connect_ = true;
    loop_->RunInLoop([self = shared_from_this()]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    }
}

void Connector::Stop() {
    connect_ = false;
    loop_->QueueInLoop([self = shared_from_this()]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        int err = errno;
        LOG_ERROR << "Connector::Connect socket: " << strerror(err);
        if (connectFailureCallback_) {
            connectFailureCallback_(err);
        }
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // we may be inside Channel::HandleEvent; drop the channel afterwards
    loop_->QueueInLoop([self = shared_from_this()]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) {
        return;
    }
    int sockfd = RemoveAndResetChannel();
    int err = Socket::GetSocketError(sockfd);
    if (err) {
        Fail(sockfd, err);
    } else if (Socket::IsSelfConnect(sockfd)) {
        Fail(sockfd, ECONNREFUSED);
    } else {
        SetState(kConnected);
        if (connect_ && newConnectionCallback_) {
            newConnectionCallback_(sockfd);
        } else {
            ::close(sockfd);
        }
    }
}

void Connector::HandleError() {
    if (state_ == kConnecting) {
        int sockfd = RemoveAndResetChannel();
        Fail(sockfd, Socket::GetSocketError(sockfd));
    }
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    SetState(kDisconnected);
    LOG_DEBUG << "Connector: connect to " << serverAddr_.toIpPort() << " failed: " << strerror(err);
    if (connect_ && connectFailureCallback_) {
        connectFailureCallback_(err);
    }
}

} // namespace network
} // namespace gateway

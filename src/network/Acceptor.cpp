#include "gateway/network/Acceptor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace gateway {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      acceptSocket_(Socket::CreateNonblocking()),
      acceptChannel_(loop, acceptSocket_.fd()),
      listening_(false) {
    acceptSocket_.SetReuseAddr(true);
    acceptSocket_.SetReusePort(reuseport);
    acceptSocket_.BindAddress(listenAddr);

    acceptChannel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    if (listening_) {
        acceptChannel_.DisableAll();
        acceptChannel_.Remove();
    }
}

void Acceptor::Listen() {
    listening_ = true;
    acceptSocket_.Listen();
    acceptChannel_.EnableReading();
}

uint16_t Acceptor::BoundPort() const {
    return ntohs(Socket::GetLocalAddr(acceptSocket_.fd()).sin_port);
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = acceptSocket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (newConnectionCallback_) {
            newConnectionCallback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        int saved = errno;
        if (saved != EAGAIN && saved != EINTR) {
            LOG_ERROR << "Acceptor::HandleRead: " << strerror(saved);
        }
        if (saved == EMFILE) {
            LOG_ERROR << "Acceptor: file descriptor limit reached";
        }
    }
}

} // namespace network
} // namespace gateway

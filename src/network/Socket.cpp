#include "gateway/network/Socket.h"
#include "gateway/network/InetAddress.h"
#include "gateway/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace gateway {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

void Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        int saved = errno;
        LOG_FATAL << "Socket::BindAddress " << localaddr.toIpPort() << ": " << strerror(saved);
        throw std::system_error(saved, std::generic_category(), "bind " + localaddr.toIpPort());
    }
}

void Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        int saved = errno;
        LOG_FATAL << "Socket::Listen: " << strerror(saved);
        throw std::system_error(saved, std::generic_category(), "listen");
    }
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                           SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_ERROR << "Socket::ShutdownWrite fd=" << sockfd_ << ": " << strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof optval);
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetReusePort(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof optval);
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

int Socket::CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        int saved = errno;
        LOG_FATAL << "Socket::CreateNonblocking: " << strerror(saved);
        throw std::system_error(saved, std::generic_category(), "socket");
    }
    return sockfd;
}

int Socket::GetSocketError(int sockfd) {
    int optval = 0;
    socklen_t optlen = sizeof optval;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

struct sockaddr_in Socket::GetLocalAddr(int sockfd) {
    struct sockaddr_in localaddr;
    std::memset(&localaddr, 0, sizeof localaddr);
    socklen_t addrlen = sizeof localaddr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&localaddr), &addrlen) < 0) {
        LOG_ERROR << "Socket::GetLocalAddr: " << strerror(errno);
    }
    return localaddr;
}

struct sockaddr_in Socket::GetPeerAddr(int sockfd) {
    struct sockaddr_in peeraddr;
    std::memset(&peeraddr, 0, sizeof peeraddr);
    socklen_t addrlen = sizeof peeraddr;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&peeraddr), &addrlen) < 0) {
        LOG_ERROR << "Socket::GetPeerAddr: " << strerror(errno);
    }
    return peeraddr;
}

bool Socket::IsSelfConnect(int sockfd) {
    struct sockaddr_in localaddr = GetLocalAddr(sockfd);
    struct sockaddr_in peeraddr = GetPeerAddr(sockfd);
    return localaddr.sin_port == peeraddr.sin_port &&
           localaddr.sin_addr.s_addr == peeraddr.sin_addr.s_addr;
}

} // namespace network
} // namespace gateway

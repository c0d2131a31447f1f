#pragma once

#include "gateway/common/noncopyable.h"

#include <netinet/in.h>

namespace gateway {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : gateway::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Throws std::system_error; a gateway that cannot bind must not start.
    void BindAddress(const InetAddress& localaddr);
    void Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking();
    static int GetSocketError(int sockfd);
    static struct sockaddr_in GetLocalAddr(int sockfd);
    static struct sockaddr_in GetPeerAddr(int sockfd);
    static bool IsSelfConnect(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace gateway

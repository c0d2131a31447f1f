#pragma once

#include <netinet/in.h>
#include <string>

namespace gateway {
namespace network {

// IPv4 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // ip must be a dotted quad; see Resolve for host names.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    // Accepts a dotted quad or a host name (first IPv4 result).
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    // Decimal 1..65535, surrounding blanks allowed.
    static bool ParsePort(const std::string& text, uint16_t* port);
    // "10.0.0.1:8080" or "backend.local:8080". The host is not resolved and
    // an IPv6 literal is rejected.
    static bool ParseHostPort(const std::string& hostPort, std::string* host, uint16_t* port);

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace gateway

#include "gateway/balancer/HttpHealthChecker.h"
#include "gateway/network/Acceptor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/common/Logger.h"

#include <atomic>
#include <cassert>
#include <cstring>
#include <memory>
#include <unistd.h>

using namespace gateway;

static void WriteAllAndClose(int fd, const char* data) {
    const size_t len = std::strlen(data);
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, data + off, len - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        break;
    }
    ::close(fd);
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);

    assert(balancer::HttpHealthChecker::ParseHttpStatusCode("HTTP/1.1 204 No Content") == 204);
    assert(balancer::HttpHealthChecker::ParseHttpStatusCode("HTTP/1.0 503") == 503);
    assert(balancer::HttpHealthChecker::ParseHttpStatusCode("ICY 200 OK") < 0);

    network::EventLoop loop;

    network::Acceptor okAcceptor(&loop, network::InetAddress(0, true), false);
    okAcceptor.SetNewConnectionCallback([](int sockfd, const network::InetAddress&) {
        WriteAllAndClose(sockfd, "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    });
    okAcceptor.Listen();

    network::Acceptor badAcceptor(&loop, network::InetAddress(0, true), false);
    badAcceptor.SetNewConnectionCallback([](int sockfd, const network::InetAddress&) {
        WriteAllAndClose(sockfd, "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    });
    badAcceptor.Listen();

    // accepts and never answers: the check must time out
    network::Acceptor silentAcceptor(&loop, network::InetAddress(0, true), false);
    int silentFd = -1;
    silentAcceptor.SetNewConnectionCallback([&](int sockfd, const network::InetAddress&) { silentFd = sockfd; });
    silentAcceptor.Listen();

    auto http = std::make_shared<balancer::HttpHealthChecker>(&loop, 0.5, "/healthz");
    auto tcp = std::make_shared<balancer::TcpHealthChecker>(&loop, 0.5);

    std::atomic<int> callbacks{0};
    std::atomic<int> correct{0};
    const int kChecks = 4;
    auto expect = [&](bool wanted) {
        return [&, wanted](bool healthy, const network::InetAddress& addr) {
            LOG_INFO << "Check " << addr.toIpPort() << " healthy=" << healthy;
            if (healthy == wanted) correct++;
            if (++callbacks == kChecks) loop.Quit();
        };
    };

    http->Check(network::InetAddress("127.0.0.1", okAcceptor.BoundPort()), expect(true));
    http->Check(network::InetAddress("127.0.0.1", badAcceptor.BoundPort()), expect(false));
    http->Check(network::InetAddress("127.0.0.1", silentAcceptor.BoundPort()), expect(false));
    tcp->Check(network::InetAddress("127.0.0.1", badAcceptor.BoundPort()), expect(true));

    loop.Loop();
    if (silentFd >= 0) ::close(silentFd);

    if (correct != kChecks) {
        LOG_ERROR << "HttpHealthChecker: FAIL";
        return 1;
    }
    LOG_INFO << "HttpHealthChecker: PASS";
    return 0;
}

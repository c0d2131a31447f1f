#include "gateway/GatewayServer.h"
#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/protocol/HttpServer.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <future>
#include <string>
#include <thread>

using gateway::network::EventLoop;
using gateway::network::InetAddress;
using gateway::network::TcpConnectionPtr;
using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;
using gateway::protocol::HttpServer;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntilClose(int fd, int timeoutMs = 2000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static std::string httpRequest(uint16_t port, const std::string& raw) {
    int fd = connectTo(port);
    ssize_t n = ::send(fd, raw.data(), raw.size(), 0);
    assert(n == (ssize_t)raw.size());
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static std::string get(uint16_t port, const std::string& path) {
    return httpRequest(port, "GET " + path + " HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
}

static std::string post(uint16_t port, const std::string& path, const std::string& body) {
    std::string req = "POST " + path + " HTTP/1.1\r\nHost: test\r\nContent-Type: application/json\r\nContent-Length: " +
                      std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
    return httpRequest(port, req);
}

static bool has(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

int main() {
    gateway::common::Logger::Instance().SetLevel(gateway::common::LogLevel::ERROR);

    EventLoop loop;

    HttpServer backend(&loop, InetAddress(0, true), "backend");
    backend.setRequestCallback([](const TcpConnectionPtr& conn, const HttpRequest& req) {
        HttpResponse resp = HttpResponse::Plain(200, "hello from " + req.path() + "\n");
        HttpServer::SendResponse(conn, resp);
    });
    backend.start();
    const uint16_t backendPort = backend.port();

    gateway::GatewayServer server(&loop, InetAddress(0, true), "DynRegGateway");
    server.EnableHealthMonitor(false);
    server.Start();
    const uint16_t port = server.port();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // No routes yet: live but not ready.
        assert(has(get(port, "/healthz"), "200 OK"));
        assert(has(get(port, "/readyz"), "HTTP/1.1 503"));

        // Publish a route to a service that has no endpoints.
        std::promise<bool> applied;
        loop.QueueInLoop([&]() {
            gateway::common::Config& conf = gateway::common::Config::Instance();
            assert(conf.LoadFromString("[health_check]\nmode = off\n"
                                       "[route:dyn]\npath = /dyn/\ndestinations = default/dyn\n"));
            applied.set_value(server.ApplyConfig(conf));
        });
        assert(applied.get_future().get());
        assert(has(get(port, "/readyz"), "200 OK"));

        std::string r = get(port, "/dyn/a");
        assert(has(r, "HTTP/1.1 503"));
        assert(has(r, "X-Gateway-Error: NoHealthyEndpoint"));

        // Register the backend.
        const std::string body = "{\"service\":\"default/dyn\",\"ip\":\"127.0.0.1\",\"port\":" +
                                 std::to_string(backendPort) + ",\"ready\":1}";
        r = post(port, "/admin/endpoint_register", body);
        assert(has(r, "200 OK"));
        r = get(port, "/dyn/a");
        assert(has(r, "200 OK"));
        assert(has(r, "hello from /dyn/a"));

        const std::string id = "127.0.0.1:" + std::to_string(backendPort);
        assert(has(get(port, "/admin/endpoints"), id + " UP"));
        assert(has(get(port, "/admin/routes"), "dyn prefix /dyn/"));

        // Malformed and wrong-method admin calls.
        r = post(port, "/admin/endpoint_register", "{\"service\":\"default/dyn\"}");
        assert(has(r, "HTTP/1.1 400"));
        r = get(port, "/admin/endpoint_register");
        assert(has(r, "HTTP/1.1 405"));

        // Remove it again.
        r = post(port, "/admin/endpoint_remove",
                 "{\"service\":\"default/dyn\",\"ip\":\"127.0.0.1\",\"port\":" + std::to_string(backendPort) + "}");
        assert(has(r, "200 OK"));
        assert(!has(get(port, "/admin/endpoints"), id));
        r = get(port, "/dyn/a");
        assert(has(r, "HTTP/1.1 503"));
        r = post(port, "/admin/endpoint_remove",
                 "{\"service\":\"default/dyn\",\"ip\":\"127.0.0.1\",\"port\":" + std::to_string(backendPort) + "}");
        assert(has(r, "HTTP/1.1 404"));

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    return 0;
}

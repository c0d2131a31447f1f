#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/TcpServer.h"

#include <functional>

namespace gateway {
namespace protocol {

class HttpContext;
class HttpRequest;
class HttpResponse;

// HTTP/1.1 front end with asynchronous handlers. Each request is handed to
// the request callback on its connection's loop, and the handler answers
// later through SendResponse. One request per connection is in flight;
// pipelined requests wait and are answered in arrival order.
class HttpServer : gateway::common::noncopyable {
public:
    using RequestCallback = std::function<void(const gateway::network::TcpConnectionPtr&, const HttpRequest&)>;
    using ConnectionCallback = std::function<void(const gateway::network::TcpConnectionPtr&)>;

    static const size_t kMaxPipelinedRequests = 32;

    HttpServer(gateway::network::EventLoop* loop,
               const gateway::network::InetAddress& listenAddr,
               const std::string& name,
               gateway::network::TcpServer::Option option = gateway::network::TcpServer::kNoReusePort);

    gateway::network::EventLoop* getLoop() const { return server_.getLoop(); }
    uint16_t port() const { return server_.port(); }

    void setRequestCallback(RequestCallback cb) { requestCallback_ = std::move(cb); }
    // Fires for connect and disconnect, after the server's own bookkeeping.
    void setConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }

    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    void setIdleTimeout(double sec) { server_.SetIdleTimeout(sec); }

    void start();

    // Must run on the connection's loop. Exactly once per dispatched request.
    static void SendResponse(const gateway::network::TcpConnectionPtr& conn, HttpResponse& response);
    // Registers the action that aborts the in-flight request if the client goes away.
    static void SetCancelHandler(const gateway::network::TcpConnectionPtr& conn, std::function<void()> cancel);

private:
    void onConnection(const gateway::network::TcpConnectionPtr& conn);
    void onMessage(const gateway::network::TcpConnectionPtr& conn,
                   gateway::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void dispatchNext(const gateway::network::TcpConnectionPtr& conn);

    RequestCallback requestCallback_;
    ConnectionCallback connectionCallback_;
    // last: ~TcpServer tears down live connections through the callbacks above
    gateway::network::TcpServer server_;
};

} // namespace protocol
} // namespace gateway

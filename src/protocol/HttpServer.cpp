#include "gateway/protocol/HttpServer.h"
#include "gateway/protocol/HttpContext.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/network/EventLoop.h"
#include "gateway/common/Logger.h"

#include <exception>

namespace gateway {
namespace protocol {

using gateway::network::TcpConnectionPtr;

namespace {

HttpContext* ContextOf(const TcpConnectionPtr& conn) {
    return std::any_cast<HttpContext>(conn->GetMutableContext());
}

} // namespace

HttpServer::HttpServer(gateway::network::EventLoop* loop,
                       const gateway::network::InetAddress& listenAddr,
                       const std::string& name,
                       gateway::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        HttpContext context;
        context.setDispatcher([this](const TcpConnectionPtr& c) { dispatchNext(c); });
        conn->SetContext(std::move(context));
        conn->SetTcpNoDelay(true);
    } else if (HttpContext* context = ContextOf(conn)) {
        context->pending().clear();
        std::function<void()> cancel = context->takeCancelHandler();
        if (cancel) {
            cancel();
        }
    }
    if (connectionCallback_) {
        connectionCallback_(conn);
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           gateway::network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    HttpContext* context = ContextOf(conn);
    if (context == nullptr || context->closeAfterResponse()) {
        buf->RetrieveAll();
        return;
    }

    while (buf->ReadableBytes() > 0) {
        if (!context->parseRequest(buf, receiveTime)) {
            LOG_DEBUG << "HttpServer: malformed request from " << conn->peerAddress().toIpPort();
            buf->RetrieveAll();
            context->pending().clear();
            context->setCloseAfterResponse(true);
            if (!context->inFlight()) {
                HttpResponse resp = HttpResponse::Plain(400, "Bad Request\n", true);
                resp.addHeader("X-Gateway-Error", "BadRequest");
                context->setInFlight(true);
                SendResponse(conn, resp);
            }
            return;
        }
        if (!context->gotAll()) {
            break;
        }
        HttpRequest req;
        req.swap(context->request());
        context->reset();
        const bool keepAlive = req.keepAlive();
        context->pending().push_back(std::move(req));
        if (!keepAlive) {
            // nothing after a closing request is served
            buf->RetrieveAll();
            break;
        }
    }

    if (context->pending().size() >= kMaxPipelinedRequests) {
        conn->StopRead();
    }
    if (!context->inFlight()) {
        dispatchNext(conn);
    }
}

void HttpServer::dispatchNext(const TcpConnectionPtr& conn) {
    HttpContext* context = ContextOf(conn);
    if (context == nullptr || context->inFlight() || context->pending().empty() || !conn->connected()) {
        return;
    }
    HttpRequest req(std::move(context->pending().front()));
    context->pending().pop_front();
    if (context->pending().size() + 1 == kMaxPipelinedRequests) {
        conn->StartRead();
    }
    context->setInFlight(true);
    if (!req.keepAlive()) {
        context->setCloseAfterResponse(true);
    }

    if (!requestCallback_) {
        HttpResponse resp = HttpResponse::Plain(404, "Not Found\n");
        SendResponse(conn, resp);
        return;
    }
    try {
        requestCallback_(conn, req);
    } catch (const std::exception& e) {
        LOG_ERROR << "HttpServer: request handler threw: " << e.what();
        if (context->inFlight()) {
            context->takeCancelHandler();
            HttpResponse resp = HttpResponse::Plain(500, "Internal Server Error\n");
            SendResponse(conn, resp);
        }
    }
}

void HttpServer::SendResponse(const TcpConnectionPtr& conn, HttpResponse& response) {
    HttpContext* context = ContextOf(conn);
    if (context == nullptr || !conn->connected()) {
        return;
    }
    if (context->closeAfterResponse()) {
        response.setCloseConnection(true);
    }
    context->takeCancelHandler();
    context->setInFlight(false);

    gateway::network::Buffer buf;
    response.appendToBuffer(&buf);
    conn->Send(buf.Peek(), buf.ReadableBytes());

    if (response.closeConnection()) {
        context->pending().clear();
        context->setCloseAfterResponse(true);
        conn->Shutdown();
        return;
    }
    if (!context->pending().empty()) {
        // keep the stack flat when a handler answers synchronously
        conn->getLoop()->QueueInLoop([conn]() {
            HttpContext* ctx = ContextOf(conn);
            if (ctx != nullptr && ctx->dispatcher()) {
                ctx->dispatcher()(conn);
            }
        });
    }
}

void HttpServer::SetCancelHandler(const TcpConnectionPtr& conn, std::function<void()> cancel) {
    HttpContext* context = ContextOf(conn);
    if (context != nullptr) {
        context->setCancelHandler(std::move(cancel));
    }
}

} // namespace protocol
} // namespace gateway

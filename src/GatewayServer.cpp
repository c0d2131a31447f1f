#include "gateway/GatewayServer.h"
#include "gateway/common/Logger.h"
#include "gateway/common/StringUtil.h"
#include "gateway/forward/ProxyExchange.h"
#include "gateway/monitor/Stats.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/route/RouteMatcher.h"

#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>

namespace gateway {

using common::Config;
using forward::GatewayError;
using forward::GatewayErrorKind;
using forward::RequestContext;
using forward::RequestContextPtr;
using network::TcpConnectionPtr;
using protocol::HttpRequest;
using protocol::HttpResponse;

namespace {

bool ParseInt64(const std::string& s, int64_t* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *out = v;
    return true;
}

const std::string* Find(const Config::Section& section, const std::string& key) {
    auto it = section.find(key);
    return it == section.end() ? nullptr : &it->second;
}

std::string Upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

balancer::HealthCheckSpec ReadHealthCheck(const Config& conf) {
    balancer::HealthCheckSpec spec;
    spec.mode = common::ToLowerCopy(conf.GetString("health_check", "mode", spec.mode));
    spec.path = conf.GetString("health_check", "path", spec.path);
    spec.intervalSec = conf.GetDouble("health_check", "interval", spec.intervalSec);
    spec.timeoutSec = conf.GetDouble("health_check", "timeout", spec.timeoutSec);
    spec.unhealthyThreshold = conf.GetInt("health_check", "unhealthy_threshold", spec.unhealthyThreshold);
    spec.healthyThreshold = conf.GetInt("health_check", "healthy_threshold", spec.healthyThreshold);
    return spec;
}

} // namespace

GatewayServer::GatewayServer(network::EventLoop* loop,
                             const network::InetAddress& listenAddr,
                             const std::string& name)
    : loop_(loop),
      healthMonitor_(loop, &registry_),
      middleware_(forward::MiddlewareChain::Default()),
      healthMonitorEnabled_(true),
      livePath_("/healthz"),
      readyPath_("/readyz"),
      metricsPath_("/metrics"),
      signalFd_(-1),
      server_(loop, listenAddr, name) {
    server_.setRequestCallback(
        std::bind(&GatewayServer::OnRequest, this, std::placeholders::_1, std::placeholders::_2));
    server_.setConnectionCallback(std::bind(&GatewayServer::OnConnection, this, std::placeholders::_1));
    registry_.SetRemovalListener([this](const std::string& endpointId) {
        breakers_.Remove(endpointId);
    });
}

GatewayServer::~GatewayServer() {
    if (signalChannel_) {
        signalChannel_->DisableAll();
        signalChannel_->Remove();
    }
    if (signalFd_ >= 0) {
        ::close(signalFd_);
    }
}

void GatewayServer::SetStatusPaths(const std::string& live, const std::string& ready, const std::string& metrics) {
    livePath_ = live;
    readyPath_ = ready;
    metricsPath_ = metrics;
}

void GatewayServer::Start() {
    if (healthMonitorEnabled_) {
        healthMonitor_.Start();
    }
    server_.start();
}

void GatewayServer::OnConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        monitor::Stats::Instance().IncActiveConnections();
    } else {
        monitor::Stats::Instance().DecActiveConnections();
    }
}

// ---------------------------------------------------------------------------
// configuration

bool GatewayServer::ParseRoute(const std::string& id,
                               const Config::Section& section,
                               route::Route* out,
                               std::string* error) {
    out->id = id;

    const std::string* path = Find(section, "path");
    if (path == nullptr || path->empty() || (*path)[0] != '/') {
        *error = "missing or invalid path";
        return false;
    }
    out->match.path = Config::Trim(*path);
    if (const std::string* kind = Find(section, "match")) {
        const std::string k = common::ToLowerCopy(Config::Trim(*kind));
        if (k == "exact") out->match.kind = route::PathMatchKind::kExact;
        else if (k == "prefix") out->match.kind = route::PathMatchKind::kPrefix;
        else if (k == "wildcard") out->match.kind = route::PathMatchKind::kWildcard;
        else {
            *error = "unknown match kind '" + *kind + "'";
            return false;
        }
    } else {
        out->match.kind = route::RouteMatcher::InferKind(out->match.path);
    }

    if (const std::string* methods = Find(section, "methods")) {
        for (const auto& m : Config::SplitList(*methods)) {
            out->match.methods.insert(Upper(m));
        }
    }
    if (const std::string* headers = Find(section, "headers")) {
        for (const auto& pair : Config::SplitList(*headers, ';')) {
            const size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                *error = "bad header predicate '" + pair + "'";
                return false;
            }
            out->match.headers.emplace_back(Config::Trim(pair.substr(0, eq)), Config::Trim(pair.substr(eq + 1)));
        }
    }

    const std::string* dests = Find(section, "destinations");
    if (dests == nullptr) {
        *error = "no destinations";
        return false;
    }
    for (const auto& item : Config::SplitList(*dests)) {
        route::Destination d;
        d.serviceId = item;
        const size_t colon = item.rfind(':');
        if (colon != std::string::npos) {
            int64_t w = 0;
            if (!ParseInt64(item.substr(colon + 1), &w) || w < 0) {
                *error = "bad destination weight in '" + item + "'";
                return false;
            }
            d.serviceId = item.substr(0, colon);
            d.weight = static_cast<int>(w);
        }
        out->destinations.push_back(d);
    }
    if (out->destinations.empty()) {
        *error = "no destinations";
        return false;
    }

    if (const std::string* strategy = Find(section, "strategy")) {
        if (!route::ParseLbStrategy(Config::Trim(*strategy), &out->strategy)) {
            *error = "unknown strategy '" + *strategy + "'";
            return false;
        }
    }
    if (const std::string* key = Find(section, "hash_key")) {
        const std::string k = Config::Trim(*key);
        if (k.empty() || k == "client") {
            out->hashKey.kind = route::HashKeySource::kClientAddress;
        } else if (k == "path") {
            out->hashKey.kind = route::HashKeySource::kPath;
        } else if (k.compare(0, 7, "header:") == 0 && k.size() > 7) {
            out->hashKey.kind = route::HashKeySource::kHeader;
            out->hashKey.header = k.substr(7);
        } else {
            *error = "bad hash_key '" + k + "'";
            return false;
        }
    }

    struct IntKey {
        const char* name;
        int64_t* target;
        int64_t min;
    };
    int64_t maxRetries = out->retry.maxRetries;
    const IntKey ints[] = {
        {"timeout_ms", &out->timeout.requestTimeoutMs, 1},
        {"connect_timeout_ms", &out->timeout.connectTimeoutMs, 1},
        {"max_retries", &maxRetries, 0},
        {"backoff_initial_ms", &out->retry.initialBackoffMs, 0},
        {"backoff_max_ms", &out->retry.maxBackoffMs, 0},
    };
    for (const auto& k : ints) {
        if (const std::string* v = Find(section, k.name)) {
            int64_t parsed = 0;
            if (!ParseInt64(Config::Trim(*v), &parsed) || parsed < k.min) {
                *error = std::string("bad ") + k.name + " '" + *v + "'";
                return false;
            }
            *k.target = parsed;
        }
    }
    out->retry.maxRetries = static_cast<int>(maxRetries);
    if (out->retry.maxBackoffMs < out->retry.initialBackoffMs) {
        out->retry.maxBackoffMs = out->retry.initialBackoffMs;
    }

    if (const std::string* retryOn = Find(section, "retry_on")) {
        out->retry.retryableStatuses.clear();
        out->retry.retryOnConnectFailure = false;
        out->retry.retryOnTimeout = false;
        for (const auto& item : Config::SplitList(*retryOn)) {
            int64_t status = 0;
            if (item == "connect-failure") {
                out->retry.retryOnConnectFailure = true;
            } else if (item == "timeout") {
                out->retry.retryOnTimeout = true;
            } else if (ParseInt64(item, &status) && status >= 100 && status <= 599) {
                out->retry.retryableStatuses.insert(static_cast<int>(status));
            } else {
                *error = "bad retry_on item '" + item + "'";
                return false;
            }
        }
    }
    return true;
}

bool GatewayServer::ApplyConfig(const Config& conf) {
    bool ok = true;

    defaultHealthCheck_ = ReadHealthCheck(conf);

    resilience::CircuitBreakerConfig cb;
    cb.failureThreshold = conf.GetInt("circuit_breaker", "failure_threshold", cb.failureThreshold);
    cb.cooldownMs = conf.GetInt("circuit_breaker", "cooldown_ms", static_cast<int>(cb.cooldownMs));
    if (cb.failureThreshold < 1) cb.failureThreshold = 1;
    breakers_.SetConfig(cb);

    for (const auto& named : conf.GetSectionsWithPrefix("service:")) {
        const std::string serviceId = named.first.substr(8);
        const Config::Section& section = named.second;
        if (serviceId.empty()) {
            LOG_ERROR << "Config: [" << named.first << "] has no service id, skipped";
            ok = false;
            continue;
        }
        balancer::HealthCheckSpec spec = defaultHealthCheck_;
        if (const std::string* v = Find(section, "health_path")) spec.path = *v;
        if (const std::string* v = Find(section, "health_mode")) spec.mode = common::ToLowerCopy(*v);
        if (const std::string* v = Find(section, "health_interval")) spec.intervalSec = std::atof(v->c_str());
        if (const std::string* v = Find(section, "health_timeout")) spec.timeoutSec = std::atof(v->c_str());
        registry_.UpsertService(serviceId, spec);

        if (const std::string* list = Find(section, "endpoints")) {
            for (const auto& item : Config::SplitList(*list)) {
                std::string host;
                uint16_t port = 0;
                if (!network::InetAddress::ParseHostPort(item, &host, &port)) {
                    LOG_ERROR << "Config: [" << named.first << "] bad endpoint '" << item << "', skipped";
                    ok = false;
                    continue;
                }
                if (!registry_.UpsertEndpoint(serviceId, host, port, true)) {
                    ok = false;
                }
            }
        }
    }

    for (const auto& named : conf.GetSectionsWithPrefix("endpoint:")) {
        const Config::Section& section = named.second;
        const std::string* service = Find(section, "service");
        const std::string* ip = Find(section, "ip");
        const std::string* portStr = Find(section, "port");
        uint16_t port = 0;
        if (service == nullptr || ip == nullptr || portStr == nullptr ||
            !network::InetAddress::ParsePort(*portStr, &port)) {
            LOG_ERROR << "Config: [" << named.first << "] needs service, ip and port, skipped";
            ok = false;
            continue;
        }
        if (!registry_.HasService(*service)) {
            registry_.UpsertService(*service, defaultHealthCheck_);
        }
        const std::string* ready = Find(section, "ready");
        const bool isReady = ready == nullptr || (*ready != "0" && common::ToLowerCopy(*ready) != "false");
        if (!registry_.UpsertEndpoint(*service, *ip, port, isReady)) {
            ok = false;
        }
    }

    route::RouteSnapshot snapshot;
    for (const auto& named : conf.GetSectionsWithPrefix("route:")) {
        auto r = std::make_shared<route::Route>();
        std::string error;
        if (!ParseRoute(named.first.substr(6), named.second, r.get(), &error)) {
            LOG_ERROR << "Config: [" << named.first << "] " << error << ", skipped";
            ok = false;
            continue;
        }
        for (const auto& d : r->destinations) {
            if (!registry_.HasService(d.serviceId)) {
                LOG_WARN << "Config: route " << r->id << " targets unknown service " << d.serviceId;
            }
        }
        snapshot.push_back(std::move(r));
    }
    routes_.Publish(std::move(snapshot));
    LOG_INFO << "Config applied: " << registry_.ServiceCount() << " services, "
             << routes_.Snapshot()->size() << " routes" << (ok ? "" : " (with errors)");
    return ok;
}

void GatewayServer::HandleSignals(const std::string& configPath) {
    configPath_ = configPath;
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGHUP);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR << "pthread_sigmask failed";
        return;
    }
    signalFd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signalFd_ < 0) {
        int err = errno;
        LOG_FATAL << "signalfd failed: " << strerror(err);
        throw std::system_error(err, std::generic_category(), "signalfd");
    }
    signalChannel_.reset(new network::Channel(loop_, signalFd_));
    signalChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { OnSignal(); });
    signalChannel_->EnableReading();
}

void GatewayServer::OnSignal() {
    struct signalfd_siginfo info;
    while (::read(signalFd_, &info, sizeof info) == static_cast<ssize_t>(sizeof info)) {
        if (info.ssi_signo == SIGHUP) {
            LOG_INFO << "SIGHUP: reloading " << configPath_;
            Config& conf = Config::Instance();
            if (!conf.Load(configPath_)) {
                LOG_ERROR << "Reload failed, keeping current configuration";
                continue;
            }
            common::Logger::Instance().SetLevel(
                common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));
            ApplyConfig(conf);
        } else {
            LOG_INFO << "Signal " << info.ssi_signo << " received, shutting down";
            loop_->Quit();
        }
    }
}

// ---------------------------------------------------------------------------
// request path

void GatewayServer::OnRequest(const TcpConnectionPtr& conn, const HttpRequest& req) {
    const std::string& path = req.path();
    if (path == livePath_) {
        HttpResponse resp = HttpResponse::Plain(200, "OK\n");
        Reply(conn, nullptr, resp);
    } else if (path == readyPath_) {
        HttpResponse resp = routes_.HasRoutes() ? HttpResponse::Plain(200, "READY\n")
                                                : HttpResponse::Plain(503, "NOT READY: no routes\n");
        Reply(conn, nullptr, resp);
    } else if (path == metricsPath_) {
        HttpResponse resp = HttpResponse::Plain(200, monitor::Stats::Instance().ToPrometheus());
        resp.setContentType("text/plain; version=0.0.4");
        Reply(conn, nullptr, resp);
    } else if (path.compare(0, 7, "/admin/") == 0) {
        HandleAdmin(conn, req);
    } else {
        HandleProxy(conn, req);
    }
}

void GatewayServer::HandleProxy(const TcpConnectionPtr& conn, const HttpRequest& req) {
    auto ctx = std::make_shared<RequestContext>();
    ctx->trace = forward::TraceContext::ForIncoming(req.getHeader("traceparent"));
    ctx->clientIp = conn->peerAddress().toIp();
    ctx->clientPort = conn->peerAddress().toPort();
    ctx->method = req.method();
    ctx->path = req.path();
    ctx->requestBytes = req.body().size();

    route::RouteSnapshotPtr snapshot = routes_.Snapshot();
    route::RoutePtr matched = route::RouteMatcher::Match(*snapshot, req.method(), req.path(), req.headers());
    if (matched) {
        ctx->routeId = matched->id;
    }
    LOG_DEBUG << ctx->LogTag() << req.method() << " " << req.path() << " from " << ctx->clientIp
              << " -> route " << (matched ? matched->id : "<none>");

    HttpResponse reject = HttpResponse::Plain(403, "Forbidden\n");
    if (!middleware_->RunRequest(*ctx, req, &reject)) {
        Reply(conn, ctx, reject);
        return;
    }
    if (!matched) {
        GatewayError error(GatewayErrorKind::kRouteNotFound, "no route for " + req.method() + " " + req.path());
        middleware_->RunError(*ctx, error);
        HttpResponse resp = error.ToResponse();
        Reply(conn, ctx, resp);
        return;
    }

    auto exchange = std::make_shared<forward::ProxyExchange>(conn->getLoop(), matched, req, ctx,
                                                             &registry_, &breakers_);
    // the cancel handler owns the exchange until the response is sent
    protocol::HttpServer::SetCancelHandler(conn, [exchange]() { exchange->Cancel(); });
    std::weak_ptr<network::TcpConnection> weakConn(conn);
    exchange->Start([this, weakConn, ctx](HttpResponse& response, const GatewayError* error) {
        if (error != nullptr) {
            middleware_->RunError(*ctx, *error);
        }
        TcpConnectionPtr c = weakConn.lock();
        if (!c) {
            return;
        }
        Reply(c, ctx, response);
    });
}

void GatewayServer::Reply(const TcpConnectionPtr& conn, const RequestContextPtr& ctx, HttpResponse& response) {
    if (ctx) {
        middleware_->RunResponse(*ctx, response);
        if (ctx->method == "HEAD") {
            response.setHeadOnly(true);
        }
    }
    protocol::HttpServer::SendResponse(conn, response);
}

// ---------------------------------------------------------------------------
// admin

void GatewayServer::HandleAdmin(const TcpConnectionPtr& conn, const HttpRequest& req) {
    const std::string& path = req.path();
    const std::string& method = req.method();
    HttpResponse resp;

    if (path == "/admin/routes" || path == "/admin/endpoints") {
        if (method != "GET" && method != "HEAD") {
            resp = HttpResponse::Plain(405, "Method Not Allowed\n");
        } else {
            resp = HttpResponse::Plain(200, path == "/admin/routes" ? DumpRoutes() : DumpEndpoints());
        }
    } else if (path == "/admin/endpoint_register" || path == "/admin/endpoint_remove") {
        const bool registering = path == "/admin/endpoint_register";
        auto service = common::ExtractJsonString(req.body(), "service");
        auto ip = common::ExtractJsonString(req.body(), "ip");
        auto port = common::ExtractJsonNumber(req.body(), "port");
        if (method != "POST") {
            resp = HttpResponse::Plain(405, "Method Not Allowed\n");
        } else if (!service || service->empty() || !ip || ip->empty() || !port || *port <= 0 || *port > 65535) {
            resp = HttpResponse::Plain(400, "Bad Request: need service, ip and port\n");
            resp.addHeader(GatewayError::kHeader, "BadRequest");
        } else if (registering) {
            auto ready = common::ExtractJsonNumber(req.body(), "ready");
            if (!registry_.HasService(*service)) {
                registry_.UpsertService(*service, defaultHealthCheck_);
            }
            auto ep = registry_.UpsertEndpoint(*service, *ip, static_cast<uint16_t>(*port), !ready || *ready != 0);
            if (ep) {
                LOG_INFO << "Admin: registered " << ep->id() << " in " << *service;
                resp = HttpResponse::Plain(200, "OK " + ep->id() + "\n");
            } else {
                resp = HttpResponse::Plain(400, "Bad Request: cannot resolve " + *ip + "\n");
                resp.addHeader(GatewayError::kHeader, "BadRequest");
            }
        } else if (registry_.RemoveEndpoint(*service, *ip, static_cast<uint16_t>(*port))) {
            LOG_INFO << "Admin: removed " << *ip << ":" << static_cast<int>(*port) << " from " << *service;
            resp = HttpResponse::Plain(200, "OK\n");
        } else {
            resp = HttpResponse::Plain(404, "Not Found: no such endpoint\n");
        }
    } else {
        resp = HttpResponse::Plain(404, "Not Found\n");
    }

    if (method == "HEAD") {
        resp.setHeadOnly(true);
    }
    protocol::HttpServer::SendResponse(conn, resp);
}

std::string GatewayServer::DumpRoutes() const {
    std::ostringstream out;
    route::RouteSnapshotPtr snapshot = routes_.Snapshot();
    out << "generation " << routes_.Generation() << ", " << snapshot->size() << " routes\n";
    for (const auto& r : *snapshot) {
        out << r->id << " " << route::PathMatchKindName(r->match.kind) << " " << r->match.path;
        if (!r->match.methods.empty()) {
            out << " methods=";
            bool first = true;
            for (const auto& m : r->match.methods) {
                out << (first ? "" : ",") << m;
                first = false;
            }
        }
        for (const auto& h : r->match.headers) {
            out << " header:" << h.first << "=" << h.second;
        }
        out << " ->";
        for (const auto& d : r->destinations) {
            out << " " << d.serviceId << ":" << d.weight;
        }
        out << " strategy=" << route::LbStrategyName(r->strategy)
            << " timeout_ms=" << r->timeout.requestTimeoutMs
            << " max_retries=" << r->retry.maxRetries << "\n";
    }
    return out.str();
}

std::string GatewayServer::DumpEndpoints() const {
    std::ostringstream out;
    const auto states = breakers_.States();
    for (const auto& service : registry_.ListServices()) {
        out << service.serviceId << " (health " << service.healthCheck.mode << " " << service.healthCheck.path << ")\n";
        for (const auto& ep : service.endpoints) {
            auto it = states.find(ep->id());
            out << "  " << ep->id() << " " << (ep->healthy() ? "UP" : "DOWN")
                << " active=" << ep->ActiveConnections()
                << " circuit=" << resilience::CircuitStateName(it == states.end() ? resilience::CircuitState::kClosed : it->second)
                << "\n";
        }
    }
    return out.str();
}

} // namespace gateway

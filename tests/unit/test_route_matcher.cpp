#include "gateway/common/Logger.h"
#include "gateway/protocol/HttpHeaders.h"
#include "gateway/route/RouteMatcher.h"
#include "gateway/route/RouteTable.h"

#include <cassert>
#include <memory>
#include <string>

using namespace gateway::route;
using gateway::protocol::HttpHeaders;

static std::shared_ptr<Route> makeRoute(const std::string& id, PathMatchKind kind, const std::string& path) {
    auto r = std::make_shared<Route>();
    r->id = id;
    r->match.kind = kind;
    r->match.path = path;
    r->destinations.push_back(Destination{"default/svc", 100});
    return r;
}

static std::string matchId(const RouteSnapshot& routes, const std::string& method, const std::string& path,
                           const HttpHeaders& headers = HttpHeaders()) {
    RoutePtr r = RouteMatcher::Match(routes, method, path, headers);
    return r ? r->id : std::string();
}

void testSpecificity() {
    RouteSnapshot routes;
    routes.push_back(makeRoute("wild", PathMatchKind::kWildcard, "/api/*"));
    routes.push_back(makeRoute("prefix-short", PathMatchKind::kPrefix, "/api/"));
    routes.push_back(makeRoute("prefix-long", PathMatchKind::kPrefix, "/api/users/"));
    routes.push_back(makeRoute("exact", PathMatchKind::kExact, "/api/users/me"));

    assert(matchId(routes, "GET", "/api/users/me") == "exact");
    assert(matchId(routes, "GET", "/api/users/42") == "prefix-long");
    assert(matchId(routes, "GET", "/api/orders") == "prefix-short");
    assert(matchId(routes, "GET", "/other").empty());
    LOG_INFO << "Specificity PASS";
}

void testWildcardOnly() {
    RouteSnapshot routes;
    routes.push_back(makeRoute("files", PathMatchKind::kWildcard, "/files/*"));
    routes.push_back(makeRoute("files-img", PathMatchKind::kWildcard, "/files/img/*"));
    assert(matchId(routes, "GET", "/files/a.txt") == "files");
    assert(matchId(routes, "GET", "/files/img/logo.png") == "files-img");
    assert(matchId(routes, "GET", "/filesystem").empty());
    LOG_INFO << "Wildcard PASS";
}

void testFirstDeclaredWinsOnTie() {
    RouteSnapshot routes;
    routes.push_back(makeRoute("first", PathMatchKind::kPrefix, "/svc/"));
    routes.push_back(makeRoute("second", PathMatchKind::kPrefix, "/svc/"));
    assert(matchId(routes, "GET", "/svc/x") == "first");
    LOG_INFO << "Tie-break PASS";
}

void testMethodAndHeaderPredicates() {
    RouteSnapshot routes;
    auto writes = makeRoute("writes", PathMatchKind::kPrefix, "/items/");
    writes->match.methods = {"POST", "PUT"};
    auto tenant = makeRoute("tenant", PathMatchKind::kPrefix, "/items/");
    tenant->match.headers.emplace_back("X-Tenant", "acme");
    auto any = makeRoute("any", PathMatchKind::kPrefix, "/items/");
    routes.push_back(writes);
    routes.push_back(tenant);
    routes.push_back(any);

    assert(matchId(routes, "POST", "/items/1") == "writes");
    assert(matchId(routes, "GET", "/items/1") == "any");

    HttpHeaders headers;
    headers["x-tenant"] = "acme";
    assert(matchId(routes, "GET", "/items/1", headers) == "tenant");
    headers["x-tenant"] = "other";
    assert(matchId(routes, "GET", "/items/1", headers) == "any");
    LOG_INFO << "Predicates PASS";
}

void testInferKind() {
    assert(RouteMatcher::InferKind("/api/*") == PathMatchKind::kWildcard);
    assert(RouteMatcher::InferKind("/api/") == PathMatchKind::kPrefix);
    assert(RouteMatcher::InferKind("/api") == PathMatchKind::kExact);
    LOG_INFO << "InferKind PASS";
}

void testRouteTablePublish() {
    RouteTable table;
    assert(!table.HasRoutes());
    RouteSnapshotPtr before = table.Snapshot();
    uint64_t gen = table.Generation();

    RouteSnapshot routes;
    routes.push_back(makeRoute("a", PathMatchKind::kExact, "/a"));
    table.Publish(std::move(routes));

    assert(table.HasRoutes());
    assert(table.Generation() == gen + 1);
    // a snapshot taken earlier is unaffected
    assert(before->empty());
    assert(table.Snapshot()->size() == 1);
    LOG_INFO << "RouteTable PASS";
}

int main() {
    testSpecificity();
    testWildcardOnly();
    testFirstDeclaredWinsOnTie();
    testMethodAndHeaderPredicates();
    testInferKind();
    testRouteTablePublish();
    return 0;
}

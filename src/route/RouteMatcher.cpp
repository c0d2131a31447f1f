#include "gateway/route/RouteMatcher.h"
#include "gateway/common/StringUtil.h"

#include <cctype>

namespace gateway {
namespace route {

namespace {

const int kRankExact = 3;
const int kRankPrefix = 2;
const int kRankWildcard = 1;

// "/a/b" under base "/a": identical, or followed by a segment boundary.
bool SegmentPrefix(const std::string& base, const std::string& path) {
    if (base.empty() || base == "/") {
        return true;
    }
    if (path.compare(0, base.size(), base) != 0) {
        return false;
    }
    if (path.size() == base.size() || base.back() == '/') {
        return true;
    }
    return path[base.size()] == '/';
}

bool MethodAllowed(const RouteMatch& match, const std::string& method) {
    if (match.methods.empty()) {
        return true;
    }
    std::string upper(method);
    for (char& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return match.methods.count(upper) != 0;
}

bool HeadersMatch(const RouteMatch& match, const gateway::protocol::HttpHeaders& headers) {
    for (const auto& predicate : match.headers) {
        auto it = headers.find(predicate.first);
        if (it == headers.end() || it->second != predicate.second) {
            return false;
        }
    }
    return true;
}

} // namespace

PathMatchKind RouteMatcher::InferKind(const std::string& pattern) {
    if (!pattern.empty() && pattern.back() == '*') {
        return PathMatchKind::kWildcard;
    }
    if (!pattern.empty() && pattern.back() == '/') {
        return PathMatchKind::kPrefix;
    }
    return PathMatchKind::kExact;
}

bool RouteMatcher::PathMatches(const RouteMatch& match, const std::string& path, int* rank, size_t* length) {
    switch (match.kind) {
        case PathMatchKind::kExact:
            if (path == match.path) {
                *rank = kRankExact;
                *length = match.path.size();
                return true;
            }
            return false;
        case PathMatchKind::kPrefix:
            if (SegmentPrefix(match.path, path)) {
                *rank = kRankPrefix;
                *length = match.path.size();
                return true;
            }
            return false;
        case PathMatchKind::kWildcard: {
            std::string base = match.path;
            if (!base.empty() && base.back() == '*') base.pop_back();
            if (base.size() > 1 && base.back() == '/') base.pop_back();
            if (SegmentPrefix(base, path)) {
                *rank = kRankWildcard;
                *length = base.size();
                return true;
            }
            return false;
        }
    }
    return false;
}

RoutePtr RouteMatcher::Match(const RouteSnapshot& routes,
                             const std::string& method,
                             const std::string& path,
                             const gateway::protocol::HttpHeaders& headers) {
    RoutePtr best;
    int bestRank = 0;
    size_t bestLength = 0;
    for (const RoutePtr& route : routes) {
        int rank = 0;
        size_t length = 0;
        if (!PathMatches(route->match, path, &rank, &length)) {
            continue;
        }
        if (!MethodAllowed(route->match, method) || !HeadersMatch(route->match, headers)) {
            continue;
        }
        // strictly better only: the earlier declaration keeps ties
        if (!best || rank > bestRank || (rank == bestRank && length > bestLength)) {
            best = route;
            bestRank = rank;
            bestLength = length;
        }
    }
    return best;
}

} // namespace route
} // namespace gateway

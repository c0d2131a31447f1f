#pragma once

#include "gateway/protocol/HttpHeaders.h"
#include "gateway/route/RouteTable.h"

#include <string>

namespace gateway {
namespace route {

// Picks the most specific route for a request:
//   exact (3) > prefix (2, longer wins) > wildcard (1, longer base wins);
// on a tie the route declared first wins. Method and header predicates
// must also hold.
class RouteMatcher {
public:
    static RoutePtr Match(const RouteSnapshot& routes,
                          const std::string& method,
                          const std::string& path,
                          const gateway::protocol::HttpHeaders& headers);

    // Path-only test for one match spec; on success *rank and *length
    // describe how specific the match is.
    static bool PathMatches(const RouteMatch& match, const std::string& path, int* rank, size_t* length);

    // "/api/*" -> wildcard, "/api/" -> prefix, else exact.
    static PathMatchKind InferKind(const std::string& pattern);
};

} // namespace route
} // namespace gateway

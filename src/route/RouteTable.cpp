#include "gateway/route/RouteTable.h"
#include "gateway/common/Logger.h"

#include <atomic>

namespace gateway {
namespace route {

RouteTable::RouteTable()
    : snapshot_(std::make_shared<const RouteSnapshot>()),
      generation_(0) {
}

RouteSnapshotPtr RouteTable::Snapshot() const {
    return std::atomic_load(&snapshot_);
}

void RouteTable::Publish(RouteSnapshot routes) {
    const size_t n = routes.size();
    auto next = std::make_shared<const RouteSnapshot>(std::move(routes));
    std::atomic_store(&snapshot_, RouteSnapshotPtr(next));
    uint64_t gen = generation_.fetch_add(1) + 1;
    LOG_INFO << "Route table published: " << n << " route(s), generation " << gen;
}

bool RouteTable::HasRoutes() const {
    return !Snapshot()->empty();
}

uint64_t RouteTable::Generation() const {
    return generation_.load();
}

} // namespace route
} // namespace gateway

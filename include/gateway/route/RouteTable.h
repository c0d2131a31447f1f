#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/route/Route.h"

#include <memory>
#include <vector>

namespace gateway {
namespace route {

using RouteSnapshot = std::vector<RoutePtr>;
using RouteSnapshotPtr = std::shared_ptr<const RouteSnapshot>;

// Routes in declaration order. Readers take a snapshot and keep it for the
// whole request; Publish swaps in a new one atomically.
class RouteTable : gateway::common::noncopyable {
public:
    RouteTable();

    RouteSnapshotPtr Snapshot() const;
    void Publish(RouteSnapshot routes);

    // Ready once a snapshot with at least one route has been published.
    bool HasRoutes() const;
    uint64_t Generation() const;

private:
    RouteSnapshotPtr snapshot_;
    std::atomic<uint64_t> generation_;
};

} // namespace route
} // namespace gateway

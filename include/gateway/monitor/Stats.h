#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway {
namespace monitor {

// Process-wide counters, rendered in Prometheus text format by /metrics.
// Label maps are bounded; keys beyond the bound are folded into "OTHER".
class Stats {
public:
    static Stats& Instance();

    struct AttemptEvent {
        std::chrono::system_clock::time_point time;
        std::string traceId;
        std::string routeId;
        std::string endpointId;
        std::string outcome;
        int status{0};
        double latencyMs{0.0};
    };

    void AddBytesIn(long long n) { bytesIn_.fetch_add(n, std::memory_order_relaxed); }
    void AddBytesOut(long long n) { bytesOut_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesIn() const { return bytesIn_.load(std::memory_order_relaxed); }
    long long GetBytesOut() const { return bytesOut_.load(std::memory_order_relaxed); }

    void IncActiveConnections() { activeConnections_.fetch_add(1, std::memory_order_relaxed); }
    void DecActiveConnections() { activeConnections_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveConnections() const { return activeConnections_.load(std::memory_order_relaxed); }

    void RecordRequest(const std::string& method, const std::string& routeId, size_t requestBytes);
    void RecordResponse(int status, size_t responseBytes, double durationSec);
    void RecordError(const std::string& kind);

    void RecordAttemptStarted(const std::string& endpointId);
    void RecordAttemptCompleted(AttemptEvent event);

    long long GetTotalRequests() const;
    unsigned long long GetResponses(int status) const;
    unsigned long long GetErrors(const std::string& kind) const;
    unsigned long long GetAttempts(const std::string& endpointId, const std::string& outcome) const;

    // Most recent first, at most kRecentAttempts.
    std::vector<AttemptEvent> RecentAttempts() const;

    std::string ToPrometheus() const;

    // Tests only.
    void Reset();

    static constexpr size_t kRecentAttempts = 256;
    static constexpr size_t kMaxLabelKeys = 512;

private:
    struct Histogram {
        explicit Histogram(std::vector<double> bounds);
        void Observe(double v);
        void Render(std::ostringstream& out, const std::string& name, const std::string& help) const;
        void Clear();

        std::vector<double> bounds;
        std::vector<unsigned long long> counts;  // one per bound plus +Inf
        double sum{0.0};
        unsigned long long count{0};
    };

    Stats();

    std::atomic<long long> bytesIn_{0};
    std::atomic<long long> bytesOut_{0};
    std::atomic<long> activeConnections_{0};
    std::chrono::system_clock::time_point startTime_;

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, unsigned long long> requests_;  // (method, route)
    std::map<int, unsigned long long> responses_;
    std::map<std::string, unsigned long long> errors_;
    std::unordered_map<std::string, unsigned long long> attemptsStarted_;
    std::map<std::pair<std::string, std::string>, unsigned long long> attempts_;  // (endpoint, outcome)
    Histogram requestDuration_;
    Histogram requestSize_;
    Histogram responseSize_;
    Histogram attemptDuration_;
    std::vector<AttemptEvent> recentAttempts_;
    size_t recentPos_{0};
};

} // namespace monitor
} // namespace gateway

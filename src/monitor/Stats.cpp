#include "gateway/monitor/Stats.h"

#include <algorithm>
#include <iomanip>

namespace gateway {
namespace monitor {

namespace {

const char* const kOverflowKey = "OTHER";

std::string EscapeLabel(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\' || c == '"') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

template <typename Map, typename Key>
void BoundedInc(Map& m, const Key& key, const Key& overflowKey, size_t maxKeys) {
    auto it = m.find(key);
    if (it != m.end()) {
        it->second += 1;
        return;
    }
    if (m.size() >= maxKeys) {
        m[overflowKey] += 1;
        return;
    }
    m.emplace(key, 1ULL);
}

std::string FormatDouble(double v) {
    std::ostringstream oss;
    oss << std::setprecision(6) << v;
    return oss.str();
}

} // namespace

Stats::Histogram::Histogram(std::vector<double> b)
    : bounds(std::move(b)), counts(bounds.size() + 1, 0) {
}

void Stats::Histogram::Observe(double v) {
    size_t i = 0;
    while (i < bounds.size() && v > bounds[i]) {
        ++i;
    }
    counts[i] += 1;
    sum += v;
    count += 1;
}

void Stats::Histogram::Render(std::ostringstream& out, const std::string& name, const std::string& help) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";
    unsigned long long cumulative = 0;
    for (size_t i = 0; i < bounds.size(); ++i) {
        cumulative += counts[i];
        out << name << "_bucket{le=\"" << FormatDouble(bounds[i]) << "\"} " << cumulative << "\n";
    }
    cumulative += counts.back();
    out << name << "_bucket{le=\"+Inf\"} " << cumulative << "\n";
    out << name << "_sum " << FormatDouble(sum) << "\n";
    out << name << "_count " << count << "\n";
}

void Stats::Histogram::Clear() {
    std::fill(counts.begin(), counts.end(), 0);
    sum = 0.0;
    count = 0;
}

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

Stats::Stats()
    : startTime_(std::chrono::system_clock::now()),
      requestDuration_({0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30}),
      requestSize_({100, 1000, 10000, 100000, 1000000, 10000000}),
      responseSize_({100, 1000, 10000, 100000, 1000000, 10000000}),
      attemptDuration_({0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30}) {
}

void Stats::RecordRequest(const std::string& method, const std::string& routeId, size_t requestBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string route = routeId.empty() ? "none" : routeId;
    BoundedInc(requests_, std::make_pair(method, route),
               std::make_pair(std::string(kOverflowKey), std::string(kOverflowKey)), kMaxLabelKeys);
    requestSize_.Observe(static_cast<double>(requestBytes));
}

void Stats::RecordResponse(int status, size_t responseBytes, double durationSec) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[status] += 1;
    responseSize_.Observe(static_cast<double>(responseBytes));
    requestDuration_.Observe(durationSec);
}

void Stats::RecordError(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    BoundedInc(errors_, kind, std::string(kOverflowKey), kMaxLabelKeys);
}

void Stats::RecordAttemptStarted(const std::string& endpointId) {
    std::lock_guard<std::mutex> lock(mutex_);
    BoundedInc(attemptsStarted_, endpointId, std::string(kOverflowKey), kMaxLabelKeys);
}

void Stats::RecordAttemptCompleted(AttemptEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    BoundedInc(attempts_, std::make_pair(event.endpointId, event.outcome),
               std::make_pair(std::string(kOverflowKey), event.outcome), kMaxLabelKeys);
    attemptDuration_.Observe(event.latencyMs / 1000.0);
    if (recentAttempts_.size() < kRecentAttempts) {
        recentAttempts_.push_back(std::move(event));
    } else {
        recentAttempts_[recentPos_ % kRecentAttempts] = std::move(event);
    }
    recentPos_ += 1;
}

long long Stats::GetTotalRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    long long total = 0;
    for (const auto& kv : requests_) {
        total += static_cast<long long>(kv.second);
    }
    return total;
}

unsigned long long Stats::GetResponses(int status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = responses_.find(status);
    return it == responses_.end() ? 0 : it->second;
}

unsigned long long Stats::GetErrors(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = errors_.find(kind);
    return it == errors_.end() ? 0 : it->second;
}

unsigned long long Stats::GetAttempts(const std::string& endpointId, const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(std::make_pair(endpointId, outcome));
    return it == attempts_.end() ? 0 : it->second;
}

std::vector<Stats::AttemptEvent> Stats::RecentAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AttemptEvent> out;
    out.reserve(recentAttempts_.size());
    const size_t n = recentAttempts_.size();
    for (size_t i = 0; i < n; ++i) {
        // walk backwards from the newest slot
        const size_t idx = (recentPos_ + kRecentAttempts - 1 - i) % kRecentAttempts;
        out.push_back(recentAttempts_[n < kRecentAttempts ? n - 1 - i : idx]);
    }
    return out;
}

std::string Stats::ToPrometheus() const {
    std::ostringstream out;
    std::lock_guard<std::mutex> lock(mutex_);

    out << "# HELP http_requests_total Requests received, by method and matched route.\n";
    out << "# TYPE http_requests_total counter\n";
    for (const auto& kv : requests_) {
        out << "http_requests_total{method=\"" << EscapeLabel(kv.first.first)
            << "\",route=\"" << EscapeLabel(kv.first.second) << "\"} " << kv.second << "\n";
    }

    out << "# HELP http_responses_total Responses sent, by status code.\n";
    out << "# TYPE http_responses_total counter\n";
    for (const auto& kv : responses_) {
        out << "http_responses_total{status=\"" << kv.first << "\"} " << kv.second << "\n";
    }

    out << "# HELP http_errors_total Gateway errors, by kind.\n";
    out << "# TYPE http_errors_total counter\n";
    for (const auto& kv : errors_) {
        out << "http_errors_total{kind=\"" << EscapeLabel(kv.first) << "\"} " << kv.second << "\n";
    }

    requestDuration_.Render(out, "http_request_duration_seconds", "Time from request receipt to response.");
    requestSize_.Render(out, "http_request_size_bytes", "Request body size.");
    responseSize_.Render(out, "http_response_size_bytes", "Response body size.");

    out << "# HELP gateway_attempts_started_total Backend attempts started, by endpoint.\n";
    out << "# TYPE gateway_attempts_started_total counter\n";
    std::map<std::string, unsigned long long> started(attemptsStarted_.begin(), attemptsStarted_.end());
    for (const auto& kv : started) {
        out << "gateway_attempts_started_total{endpoint=\"" << EscapeLabel(kv.first) << "\"} " << kv.second << "\n";
    }

    out << "# HELP gateway_attempts_total Backend attempts completed, by endpoint and outcome.\n";
    out << "# TYPE gateway_attempts_total counter\n";
    for (const auto& kv : attempts_) {
        out << "gateway_attempts_total{endpoint=\"" << EscapeLabel(kv.first.first)
            << "\",outcome=\"" << EscapeLabel(kv.first.second) << "\"} " << kv.second << "\n";
    }

    attemptDuration_.Render(out, "gateway_attempt_duration_seconds", "Backend attempt latency.");

    out << "# HELP gateway_bytes_received_total Bytes read from sockets.\n";
    out << "# TYPE gateway_bytes_received_total counter\n";
    out << "gateway_bytes_received_total " << GetBytesIn() << "\n";
    out << "# HELP gateway_bytes_sent_total Bytes written to sockets.\n";
    out << "# TYPE gateway_bytes_sent_total counter\n";
    out << "gateway_bytes_sent_total " << GetBytesOut() << "\n";
    out << "# HELP gateway_active_client_connections Open client connections.\n";
    out << "# TYPE gateway_active_client_connections gauge\n";
    out << "gateway_active_client_connections " << GetActiveConnections() << "\n";

    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - startTime_).count();
    out << "# HELP gateway_uptime_seconds Seconds since start.\n";
    out << "# TYPE gateway_uptime_seconds gauge\n";
    out << "gateway_uptime_seconds " << uptime << "\n";
    return out.str();
}

void Stats::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
    responses_.clear();
    errors_.clear();
    attemptsStarted_.clear();
    attempts_.clear();
    requestDuration_.Clear();
    requestSize_.Clear();
    responseSize_.Clear();
    attemptDuration_.Clear();
    recentAttempts_.clear();
    recentPos_ = 0;
}

} // namespace monitor
} // namespace gateway

#include "internal/observability/retrieval_metrics.hpp"

#include "internal/observability/spans.hpp"

namespace engram::observability {

void RetrievalMetrics::RecordSearch(double latency_ms, std::uint64_t results) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    totals_.requests_total += 1;
    totals_.results_total += results;
    totals_.latency_ms_total += latency_ms;
  }
  Metrics::Instance().RecordSearch(latency_ms, results, true);
}

void RetrievalMetrics::RecordError(double latency_ms) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    totals_.requests_total += 1;
    totals_.errors_total += 1;
    totals_.latency_ms_total += latency_ms;
  }
  Metrics::Instance().RecordSearch(latency_ms, 0, false);
}

RetrievalMetricsSnapshot RetrievalMetrics::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RetrievalMetricsSnapshot    snapshot = totals_;
  snapshot.avg_latency_ms = snapshot.requests_total == 0 ? 0.0 : snapshot.latency_ms_total / static_cast<double>(snapshot.requests_total);
  return snapshot;
}

} // namespace engram::observability

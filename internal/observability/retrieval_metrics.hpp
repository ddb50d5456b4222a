#pragma once

#include <cstdint>
#include <mutex>

namespace engram::observability {

struct RetrievalMetricsSnapshot {
  std::uint64_t requests_total   = 0;
  std::uint64_t errors_total     = 0;
  std::uint64_t results_total    = 0;
  double        latency_ms_total = 0.0;
  double        avg_latency_ms   = 0.0;
};

/*
  Process-wide search counters. Every update and every snapshot takes the
  same lock, so a snapshot never mixes two requests.
*/
class RetrievalMetrics {
 public:
  void RecordSearch(double latency_ms, std::uint64_t results);
  void RecordError(double latency_ms);

  RetrievalMetricsSnapshot Snapshot() const;

 private:
  mutable std::mutex       mutex_;
  RetrievalMetricsSnapshot totals_;
};

} // namespace engram::observability

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace engram::runtime::config {
class RuntimeConfig;
}

namespace engram::observability {

/*
  Tracing and metrics facade. Built against OpenTelemetry when
  ENGRAM_ENABLE_OTEL is defined; otherwise every call is an inline no-op.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"engramd"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

#ifdef ENGRAM_ENABLE_OTEL
OtlpConfig ToOtlpConfig(const engram::runtime::config::RuntimeConfig& config);
#endif

bool InitializeTracing(const engram::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const engram::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENGRAM_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, bool success, double latency_ms);
  void RecordSearch(double latency_ms, std::uint64_t results, bool success);
  void SetCollectionSize(std::string_view collection, std::uint64_t records);
  void RecordLifecycleSweep(std::string_view collection, std::uint64_t deleted);

 private:
  Metrics();
#ifdef ENGRAM_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENGRAM_ENABLE_OTEL
inline bool InitializeTracing(const engram::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const engram::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool, double) {
}

inline void Metrics::RecordSearch(double, std::uint64_t, bool) {
}

inline void Metrics::SetCollectionSize(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordLifecycleSweep(std::string_view, std::uint64_t) {
}
#endif

} // namespace engram::observability

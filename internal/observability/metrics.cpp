#include "internal/observability/spans.hpp"

#ifdef ENGRAM_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace engram::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> search_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      search_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> search_results;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> expired_deleted;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   collection_size_gauge;

  std::mutex                                    collection_mutex;
  std::unordered_map<std::string, std::int64_t> collection_sizes;
};

bool InitializeMetrics(const engram::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);
  const auto endpoint    = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("engram", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("engram.operation.count", "Operations by name and outcome", "1");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("engram.operation.latency_ms", "Operation latency", "ms");
  impl_->search_count         = impl_->meter->CreateUInt64Counter("engram.search.count", "Search requests by outcome", "1");
  impl_->search_latency_ms    = impl_->meter->CreateDoubleHistogram("engram.search.latency_ms", "Search latency", "ms");
  impl_->search_results       = impl_->meter->CreateUInt64Counter("engram.search.results", "Results returned by searches", "1");
  impl_->expired_deleted      = impl_->meter->CreateUInt64Counter("engram.lifecycle.expired_deleted", "Entries purged by TTL", "1");
  impl_->collection_size_gauge =
      impl_->meter->CreateInt64ObservableGauge("engram.collection.records", "Records per collection", "1");
  impl_->collection_size_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->collection_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [collection, records] : impl->collection_sizes) {
          const std::initializer_list<AttributePair> attributes = {{"collection", collection}};
          int_result->Observe(records, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}, {"success", success}};
  impl_->operation_count->Add(1, attributes);

  const std::initializer_list<AttributePair> latency_attributes = {{"operation", std::string(operation)}};
  impl_->operation_latency_ms->Record(latency_ms, latency_attributes, opentelemetry::context::Context{});
}

void Metrics::RecordSearch(double latency_ms, std::uint64_t results, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  impl_->search_count->Add(1, attributes);
  impl_->search_latency_ms->Record(latency_ms, opentelemetry::context::Context{});
  if (results > 0) {
    impl_->search_results->Add(results);
  }
}

void Metrics::SetCollectionSize(std::string_view collection, std::uint64_t records) {
  std::lock_guard<std::mutex> lock(impl_->collection_mutex);
  impl_->collection_sizes[std::string(collection)] = static_cast<std::int64_t>(records);
}

void Metrics::RecordLifecycleSweep(std::string_view collection, std::uint64_t deleted) {
  const std::initializer_list<AttributePair> attributes = {{"collection", std::string(collection)}};
  impl_->expired_deleted->Add(deleted, attributes);
}

} // namespace engram::observability

#endif

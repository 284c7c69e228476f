#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace mediacache::observability {
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

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> proxy_request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      proxy_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      download_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::atomic<std::int64_t> pending{0};
  std::atomic<std::int64_t> in_flight{0};
};

bool InitializeMetrics(const mediacache::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == mediacache::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.export_interval_ms();
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
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
  impl_->meter  = provider->GetMeter("mediacache", "0.1.0");

  impl_->proxy_request_count  = impl_->meter->CreateUInt64Counter("mediacache.proxy.request.count", "Proxy requests by status", "1");
  impl_->proxy_latency_ms     = impl_->meter->CreateDoubleHistogram("mediacache.proxy.latency_ms", "Proxy request latency", "ms");
  impl_->download_duration_ms = impl_->meter->CreateDoubleHistogram("mediacache.download.duration_ms", "Chunk download duration", "ms");
  impl_->queue_depth_gauge    = impl_->meter->CreateInt64ObservableGauge("mediacache.chunk.queue_depth", "Chunk requests by state", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        const std::initializer_list<AttributePair> pending   = {{"state", "pending"}};
        const std::initializer_list<AttributePair> in_flight = {{"state", "in_flight"}};
        int_result->Observe(impl->pending.load(), pending);
        int_result->Observe(impl->in_flight.load(), in_flight);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordProxyRequest(std::string_view route, int http_status) {
  if (!impl_ || !impl_->proxy_request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"status", http_status}};
  impl_->proxy_request_count->Add(1, attributes);
}

void Metrics::ObserveProxyLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->proxy_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->proxy_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveDownloadDurationMs(std::string_view outcome, double duration_ms) {
  if (!impl_ || !impl_->download_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  impl_->download_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::SetQueueDepth(std::uint64_t pending, std::uint64_t in_flight) {
  if (!impl_) {
    return;
  }

  impl_->pending   = static_cast<std::int64_t>(pending);
  impl_->in_flight = static_cast<std::int64_t>(in_flight);
}

} // namespace mediacache::observability

#endif

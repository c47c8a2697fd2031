#include "internal/observability/spans.hpp"

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

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace cadence::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const cadence::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport() == cadence::runtime::config::OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> analysis_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      analysis_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stage_failures;
};

bool InitializeMetrics(const cadence::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto endpoint = ResolveEndpoint(observability);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (observability.transport() == cadence::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader                           = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", std::string("cadence")}};
  auto res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AddMetricReaderCompat(g_provider, std::move(reader));

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
  impl_->meter  = provider->GetMeter("cadence", "0.1.0");

  impl_->analysis_count      = impl_->meter->CreateUInt64Counter("cadence.analysis.count", "1", "Total number of analysis requests");
  impl_->analysis_latency_ms = impl_->meter->CreateDoubleHistogram("cadence.analysis.latency_ms", "ms", "End-to-end analysis latency in milliseconds");
  impl_->stage_failures      = impl_->meter->CreateUInt64Counter("cadence.analysis.stage_failures", "1", "Sub-analysis failures isolated by the engine");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAnalysis(std::string_view route, bool success) {
  if (!impl_ || !impl_->analysis_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->analysis_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveAnalysisLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->analysis_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->analysis_latency_ms, latency_ms, attributes);
}

void Metrics::RecordStageFailure(std::string_view stage) {
  if (!impl_ || !impl_->stage_failures) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"stage", std::string(stage)}};
  AddWithAttributes(impl_->stage_failures, static_cast<std::uint64_t>(1), attributes);
}

} // namespace cadence::observability

#endif

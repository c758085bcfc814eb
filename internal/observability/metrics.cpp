#include "internal/observability/metrics.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_options.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>
#include <utility>

namespace buildq::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const buildq::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return std::string(endpoint) + "/v1/metrics";
  }

  return "http://localhost:4318/v1/metrics";
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value>
void RecordValue(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

const char* StatusLabel(bool success) {
  return success ? "success" : "failed";
}

double Seconds(std::chrono::nanoseconds d) {
  return std::chrono::duration<double>(d).count();
}

} // namespace

struct OtelMetricsSink::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>     builds_total;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>     deployments_total;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>          build_duration;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>          deploy_duration;
  opentelemetry::nostd::shared_ptr<metrics_api::UpDownCounter<std::int64_t>> jobs_active;
};

OtelMetricsSink::OtelMetricsSink() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("buildq", "0.1.0");

  impl_->builds_total      = impl_->meter->CreateUInt64Counter("buildq.builds.total", "Total number of builds by status", "1");
  impl_->deployments_total = impl_->meter->CreateUInt64Counter("buildq.deployments.total", "Total number of deployments by status", "1");
  impl_->build_duration    = impl_->meter->CreateDoubleHistogram("buildq.build.duration_seconds", "Duration of build operations", "s");
  impl_->deploy_duration   = impl_->meter->CreateDoubleHistogram("buildq.deploy.duration_seconds", "Duration of deployment operations", "s");
  impl_->jobs_active       = impl_->meter->CreateInt64UpDownCounter("buildq.jobs.active", "Jobs dispatched and not yet finished", "1");
}

OtelMetricsSink::~OtelMetricsSink() = default;

void OtelMetricsSink::RecordBuild(bool success, std::chrono::nanoseconds duration) noexcept {
  const std::initializer_list<AttributePair> attributes = {{"status", StatusLabel(success)}};
  AddWithAttributes(impl_->builds_total, static_cast<std::uint64_t>(1), attributes);
  RecordValue(impl_->build_duration, Seconds(duration));
}

void OtelMetricsSink::RecordDeployment(bool success, std::chrono::nanoseconds duration) noexcept {
  const std::initializer_list<AttributePair> attributes = {{"status", StatusLabel(success)}};
  AddWithAttributes(impl_->deployments_total, static_cast<std::uint64_t>(1), attributes);
  RecordValue(impl_->deploy_duration, Seconds(duration));
}

void OtelMetricsSink::IncActiveJobs() noexcept {
  AddWithAttributes(impl_->jobs_active, static_cast<std::int64_t>(1), std::initializer_list<AttributePair>{});
}

void OtelMetricsSink::DecActiveJobs() noexcept {
  AddWithAttributes(impl_->jobs_active, static_cast<std::int64_t>(-1), std::initializer_list<AttributePair>{});
}

bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpHttpMetricExporterOptions exporter_options;
  exporter_options.url = ResolveEndpoint(observability);
  auto exporter        = otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.export_interval_ms() > 0 ? observability.export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(interval_ms / 2);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", observability.service_name()}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  BUILDQ_LOG_INFO("metrics exporter initialized", {StringField("endpoint", exporter_options.url)});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

std::shared_ptr<MetricsSink> MakeMetricsSink(const buildq::runtime::config::RuntimeConfig& config) {
  if (InitializeMetrics(config)) {
    return std::make_shared<OtelMetricsSink>();
  }
  return std::make_shared<NoopMetricsSink>();
}

} // namespace buildq::observability

#else

namespace buildq::observability {

bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig& config) {
  if (config.observability().metrics_enabled()) {
    BUILDQ_LOG_WARN("metrics requested but buildq was built without ENABLE_OTEL");
  }
  return false;
}

void ShutdownMetrics() {
}

std::shared_ptr<MetricsSink> MakeMetricsSink(const buildq::runtime::config::RuntimeConfig& config) {
  InitializeMetrics(config);
  return std::make_shared<NoopMetricsSink>();
}

} // namespace buildq::observability

#endif

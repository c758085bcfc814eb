#pragma once

#include <chrono>
#include <memory>

namespace buildq::runtime::config {
class RuntimeConfig;
}

namespace buildq::observability {

/*
  Metrics sink injected into the queue and the operation handlers.

  Implementations must be thread-safe and must not throw: a metrics
  failure never changes a job outcome.
*/
class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  virtual void RecordBuild(bool success, std::chrono::nanoseconds duration) noexcept      = 0;
  virtual void RecordDeployment(bool success, std::chrono::nanoseconds duration) noexcept = 0;
  virtual void IncActiveJobs() noexcept                                                   = 0;
  virtual void DecActiveJobs() noexcept                                                   = 0;
};

class NoopMetricsSink final : public MetricsSink {
 public:
  void RecordBuild(bool, std::chrono::nanoseconds) noexcept override {
  }
  void RecordDeployment(bool, std::chrono::nanoseconds) noexcept override {
  }
  void IncActiveJobs() noexcept override {
  }
  void DecActiveJobs() noexcept override {
  }
};

#ifdef ENABLE_OTEL
/*
  Exports through the global OTEL MeterProvider:
    buildq.builds.total{status}        counter
    buildq.deployments.total{status}   counter
    buildq.build.duration_seconds      histogram
    buildq.deploy.duration_seconds     histogram
    buildq.jobs.active                 up-down counter
*/
class OtelMetricsSink final : public MetricsSink {
 public:
  OtelMetricsSink();
  ~OtelMetricsSink() override;

  void RecordBuild(bool success, std::chrono::nanoseconds duration) noexcept override;
  void RecordDeployment(bool success, std::chrono::nanoseconds duration) noexcept override;
  void IncActiveJobs() noexcept override;
  void DecActiveJobs() noexcept override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
#endif

// Installs the OTLP/HTTP exporter when observability.metrics_enabled is set.
// Returns false when metrics stay disabled.
bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// OTEL sink when metrics were initialized, Noop otherwise.
std::shared_ptr<MetricsSink> MakeMetricsSink(const buildq::runtime::config::RuntimeConfig& config);

} // namespace buildq::observability

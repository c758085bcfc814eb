#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/job.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/container_runtime.hpp"

namespace buildq::jobs {

/*
  Rolls a service onto a new image.

  Progress milestones: 10 started, 20 service found, 30 marked deploying,
  60 image available locally, 90 service updated, 100 done.

  Every failure path persists the deployment as failed with a reason and
  records exactly one deployment metric.
*/
class DeployJobHandler {
 public:
  DeployJobHandler(std::shared_ptr<runtime::ContainerRuntime> runtime, std::shared_ptr<db::DeployStore> store,
                   std::shared_ptr<observability::MetricsSink> metrics);

  void Handle(JobContext& ctx);

 private:
  // Persists the failure, records the metric, then throws E(message).
  template <typename E>
  [[noreturn]] void Fail(const db::model::DeploymentRecord& deployment, std::chrono::steady_clock::time_point start, const std::string& reason,
                         const std::string& message);

  std::shared_ptr<runtime::ContainerRuntime>  runtime_;
  std::shared_ptr<db::DeployStore>            store_;
  std::shared_ptr<observability::MetricsSink> metrics_;
};

} // namespace buildq::jobs

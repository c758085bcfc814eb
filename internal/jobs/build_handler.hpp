#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/job.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/container_runtime.hpp"

namespace buildq::jobs {

struct BuildHandlerOptions {
  std::string log_dir;
  // Used when the payload carries no estimate; 0 disables log progress.
  int estimated_log_lines = 500;
};

/*
  Runs one image build.

  Progress milestones: 10 log file ready, 20 build marked building,
  30-90 driven by build log lines, 100 final status stored.

  Store bookkeeping failures are logged and never fail the job. A failed
  build is persisted as failed before the job fails with
  "build failed: <reason>".
*/
class BuildJobHandler {
 public:
  BuildJobHandler(std::shared_ptr<runtime::ContainerRuntime> runtime, std::shared_ptr<db::BuildStore> store,
                  std::shared_ptr<observability::MetricsSink> metrics, BuildHandlerOptions options);

  void Handle(JobContext& ctx);

  // <log_dir>/build_<id>.log
  std::string LogPathFor(uint64_t build_id) const;

 private:
  std::shared_ptr<runtime::ContainerRuntime>  runtime_;
  std::shared_ptr<db::BuildStore>             store_;
  std::shared_ptr<observability::MetricsSink> metrics_;
  BuildHandlerOptions                         options_;
};

} // namespace buildq::jobs

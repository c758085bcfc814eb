#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/db/model/build_record.hpp"
#include "internal/db/model/deployment_record.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace buildq::jobs {

enum class JobKind {
  kBuild,
  kDeploy,
};

enum class JobStatus {
  kQueued,
  kRunning,
  kSuccess,
  kFailed,
};

std::string_view ToString(JobKind kind);
std::string_view ToString(JobStatus status);

bool IsTerminal(JobStatus status);

struct BuildPayload {
  db::model::BuildRecord build;
  // Expected build log length; unset falls back to the handler default,
  // 0 disables log-driven progress.
  std::optional<int> estimated_log_lines;
};

struct DeployPayload {
  db::model::DeploymentRecord deployment;
};

// One alternative per JobKind.
using JobPayload = std::variant<BuildPayload, DeployPayload>;

bool PayloadMatchesKind(JobKind kind, const JobPayload& payload);

/*
  One unit of asynchronous work.

  Status moves forward only: queued -> running -> success|failed, or
  queued -> failed when the queue is shutting down. Callers always get
  copies; the queue owns the live record.
*/
struct Job {
  std::string id;
  JobKind     kind   = JobKind::kBuild;
  JobStatus   status = JobStatus::kQueued;
  JobPayload  payload;
  int         progress = 0;

  util::TimePoint                created_at;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;

  // Empty unless status is failed.
  std::string error;
};

/*
  What a handler sees while it runs: a snapshot of its job taken at start,
  the execution context bounding it, and a progress callback.
*/
class JobContext {
 public:
  using ProgressFn = std::function<void(int)>;

  JobContext(Job job, const util::ExecutionContext& execution, ProgressFn progress)
      : job_(std::move(job)), execution_(execution), progress_(std::move(progress)) {
  }

  const Job& job() const {
    return job_;
  }

  const util::ExecutionContext& execution() const {
    return execution_;
  }

  void ReportProgress(int percent) const {
    if (progress_) progress_(percent);
  }

  const ProgressFn& progress_fn() const {
    return progress_;
  }

 private:
  Job                           job_;
  const util::ExecutionContext& execution_;
  ProgressFn                    progress_;
};

// Returning normally means success; throwing means failure with what().
using JobHandler = std::function<void(JobContext&)>;

} // namespace buildq::jobs

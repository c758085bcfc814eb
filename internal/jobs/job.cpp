#include "internal/jobs/job.hpp"

namespace buildq::jobs {

std::string_view ToString(JobKind kind) {
  switch (kind) {
    case JobKind::kBuild:
      return "build";
    case JobKind::kDeploy:
      return "deploy";
  }
  return "unknown";
}

std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:
      return "queued";
    case JobStatus::kRunning:
      return "running";
    case JobStatus::kSuccess:
      return "success";
    case JobStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

bool IsTerminal(JobStatus status) {
  return status == JobStatus::kSuccess || status == JobStatus::kFailed;
}

bool PayloadMatchesKind(JobKind kind, const JobPayload& payload) {
  switch (kind) {
    case JobKind::kBuild:
      return std::holds_alternative<BuildPayload>(payload);
    case JobKind::kDeploy:
      return std::holds_alternative<DeployPayload>(payload);
  }
  return false;
}

} // namespace buildq::jobs

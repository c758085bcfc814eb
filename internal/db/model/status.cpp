#include "internal/db/model/build_record.hpp"
#include "internal/db/model/deployment_record.hpp"

namespace buildq::db::model {

std::string_view ToString(BuildStatus status) {
  switch (status) {
    case BuildStatus::kQueued:
      return "queued";
    case BuildStatus::kBuilding:
      return "building";
    case BuildStatus::kSuccess:
      return "success";
    case BuildStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<BuildStatus> ParseBuildStatus(std::string_view text) {
  if (text == "queued") return BuildStatus::kQueued;
  if (text == "building") return BuildStatus::kBuilding;
  if (text == "success") return BuildStatus::kSuccess;
  if (text == "failed") return BuildStatus::kFailed;
  return std::nullopt;
}

std::string_view ToString(DeploymentStatus status) {
  switch (status) {
    case DeploymentStatus::kQueued:
      return "queued";
    case DeploymentStatus::kDeploying:
      return "deploying";
    case DeploymentStatus::kSuccess:
      return "success";
    case DeploymentStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<DeploymentStatus> ParseDeploymentStatus(std::string_view text) {
  if (text == "queued") return DeploymentStatus::kQueued;
  if (text == "deploying") return DeploymentStatus::kDeploying;
  if (text == "success") return DeploymentStatus::kSuccess;
  if (text == "failed") return DeploymentStatus::kFailed;
  return std::nullopt;
}

} // namespace buildq::db::model

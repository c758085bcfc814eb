#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace buildq::db::model {

enum class DeploymentStatus {
  kQueued,
  kDeploying,
  kSuccess,
  kFailed,
};

std::string_view                ToString(DeploymentStatus status);
std::optional<DeploymentStatus> ParseDeploymentStatus(std::string_view text);

struct DeploymentRecord {
  uint64_t         id         = 0;
  uint64_t         project_id = 0;
  uint64_t         service_id = 0;
  std::string      image_tag;
  DeploymentStatus status = DeploymentStatus::kQueued;
  std::string      reason; // why it was triggered, or why it failed
  uint64_t         created_at_ms = 0;
};

} // namespace buildq::db::model

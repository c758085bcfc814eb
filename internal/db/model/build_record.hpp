#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace buildq::db::model {

enum class BuildStatus {
  kQueued,
  kBuilding,
  kSuccess,
  kFailed,
};

std::string_view           ToString(BuildStatus status);
std::optional<BuildStatus>    ParseBuildStatus(std::string_view text);

/*
  Persistent build row.

  Timestamps are unix milliseconds; 0 means "not set".
*/
struct BuildRecord {
  uint64_t    id         = 0;
  uint64_t    project_id = 0;
  uint64_t    service_id = 0;

  std::string git_url;
  std::string git_ref;
  std::string commit_sha;
  std::string context_path;
  std::string dockerfile;
  std::string image_tag;

  BuildStatus status = BuildStatus::kQueued;
  std::string log_path;
  std::string triggered_by;

  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;
  uint64_t created_at_ms  = 0;
};

} // namespace buildq::db::model

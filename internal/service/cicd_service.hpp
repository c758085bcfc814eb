#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/build_record.hpp"
#include "internal/db/model/deployment_record.hpp"
#include "internal/db/model/service_record.hpp"
#include "internal/jobs/job.hpp"
#include "service_context.hpp"

namespace buildq::service {

struct BuildRequest {
  std::string git_url;
  std::string git_ref;
  std::string context_path; // empty -> "."
  std::string dockerfile;   // empty -> "Dockerfile"
  std::string triggered_by;
  // Unset uses the handler default.
  std::optional<int> estimated_log_lines;
};

struct BuildTicket {
  db::model::BuildRecord build;
  jobs::Job              job;
};

struct DeploymentTicket {
  db::model::DeploymentRecord deployment;
  jobs::Job                   job;
};

/*
  CI/CD entry points: records the build or deployment, then enqueues the
  job that carries it out.

  Errors:
    util::NotFound         unknown service
    util::InvalidArgument  bad request
    util::InvalidState     rollback has nothing to roll back to
    util::ExternalError    store write failed
*/
class CicdService {
 public:
  explicit CicdService(ServiceContext ctx);

  db::model::ServiceRecord CreateService(uint64_t project_id, const std::string& name, const std::string& image);

  BuildTicket TriggerBuild(uint64_t service_id, const BuildRequest& request);

  DeploymentTicket TriggerDeployment(uint64_t service_id, const std::string& image_tag, const std::string& reason);

  // Redeploys the newest successful deployment older than the latest one.
  DeploymentTicket Rollback(uint64_t service_id);

  std::vector<db::model::BuildRecord>      ListBuilds(uint64_t service_id);
  std::vector<db::model::DeploymentRecord> ListDeployments(uint64_t service_id);

  std::optional<jobs::Job> GetJob(const std::string& job_id) const;

  // "<service>:<ref>-<unix seconds>", with '/' in the ref replaced by '-'.
  static std::string MakeImageTag(const std::string& service_name, const std::string& git_ref, std::int64_t unix_seconds);

 private:
  db::model::ServiceRecord RequireService(uint64_t service_id);

  ServiceContext ctx_;
};

} // namespace buildq::service

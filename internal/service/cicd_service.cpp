#include "cicd_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace buildq::service {

using observability::IntField;
using observability::StringField;

CicdService::CicdService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string CicdService::MakeImageTag(const std::string& service_name, const std::string& git_ref, std::int64_t unix_seconds) {
  std::string ref = git_ref;
  std::replace(ref.begin(), ref.end(), '/', '-');
  return service_name + ":" + ref + "-" + std::to_string(unix_seconds);
}

db::model::ServiceRecord CicdService::RequireService(uint64_t service_id) {
  auto service = ctx_.repository->GetService(service_id);
  if (!service) {
    throw util::NotFound("service not found: " + std::to_string(service_id));
  }
  return *service;
}

db::model::ServiceRecord CicdService::CreateService(uint64_t project_id, const std::string& name, const std::string& image) {
  if (name.empty()) {
    throw util::InvalidArgument("service name must not be empty");
  }

  db::model::ServiceRecord record;
  record.project_id = project_id;
  record.name       = name;
  record.image      = image;

  if (auto r = ctx_.repository->CreateService(record); !r) {
    throw util::ExternalError("failed to create service: " + db::Describe(r));
  }

  BUILDQ_LOG_INFO("service created", {IntField("service_id", static_cast<std::int64_t>(record.id)), StringField("name", name)});
  return record;
}

BuildTicket CicdService::TriggerBuild(uint64_t service_id, const BuildRequest& request) {
  if (request.git_url.empty() || request.git_ref.empty()) {
    throw util::InvalidArgument("invalid build specification: git_url and git_ref are required");
  }

  auto service = RequireService(service_id);

  db::model::BuildRecord build;
  build.project_id   = service.project_id;
  build.service_id   = service_id;
  build.git_url      = request.git_url;
  build.git_ref      = request.git_ref;
  build.context_path = request.context_path.empty() ? "." : request.context_path;
  build.dockerfile   = request.dockerfile.empty() ? "Dockerfile" : request.dockerfile;
  build.image_tag    = MakeImageTag(service.name, request.git_ref, util::ToUnixSeconds(util::Now()));
  build.status       = db::model::BuildStatus::kQueued;
  build.triggered_by = request.triggered_by;

  if (auto r = ctx_.repository->CreateBuild(build); !r) {
    BUILDQ_LOG_ERROR("failed to create build record", {StringField("error", db::Describe(r))});
    throw util::ExternalError("failed to create build: " + db::Describe(r));
  }

  auto job = ctx_.queue->Enqueue(jobs::JobKind::kBuild, jobs::BuildPayload{build, request.estimated_log_lines});

  BUILDQ_LOG_INFO("build triggered",
                  {IntField("build_id", static_cast<std::int64_t>(build.id)), StringField("job_id", job.id), StringField("image_tag", build.image_tag)});
  return {std::move(build), std::move(job)};
}

DeploymentTicket CicdService::TriggerDeployment(uint64_t service_id, const std::string& image_tag, const std::string& reason) {
  if (image_tag.empty()) {
    throw util::InvalidArgument("invalid deployment specification: image_tag is required");
  }

  auto service = RequireService(service_id);

  db::model::DeploymentRecord deployment;
  deployment.project_id = service.project_id;
  deployment.service_id = service_id;
  deployment.image_tag  = image_tag;
  deployment.status     = db::model::DeploymentStatus::kQueued;
  deployment.reason     = reason;

  if (auto r = ctx_.repository->CreateDeployment(deployment); !r) {
    throw util::ExternalError("failed to create deployment: " + db::Describe(r));
  }

  auto job = ctx_.queue->Enqueue(jobs::JobKind::kDeploy, jobs::DeployPayload{deployment});

  BUILDQ_LOG_INFO("deployment triggered", {IntField("deployment_id", static_cast<std::int64_t>(deployment.id)), StringField("job_id", job.id),
                                           StringField("image_tag", image_tag)});
  return {std::move(deployment), std::move(job)};
}

DeploymentTicket CicdService::Rollback(uint64_t service_id) {
  auto history = ctx_.repository->ListDeployments(service_id);
  if (history.size() < 2) {
    throw util::InvalidState("no previous deployment to rollback to");
  }

  // history[0] is the current deployment.
  auto previous = std::find_if(history.begin() + 1, history.end(),
                               [](const auto& d) { return d.status == db::model::DeploymentStatus::kSuccess; });
  if (previous == history.end()) {
    throw util::InvalidState("no previous successful deployment found");
  }

  return TriggerDeployment(service_id, previous->image_tag, "Rollback to deployment " + std::to_string(previous->id));
}

std::vector<db::model::BuildRecord> CicdService::ListBuilds(uint64_t service_id) {
  return ctx_.repository->ListBuilds(service_id);
}

std::vector<db::model::DeploymentRecord> CicdService::ListDeployments(uint64_t service_id) {
  return ctx_.repository->ListDeployments(service_id);
}

std::optional<jobs::Job> CicdService::GetJob(const std::string& job_id) const {
  return ctx_.queue->GetJob(job_id);
}

} // namespace buildq::service

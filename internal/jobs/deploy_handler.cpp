#include "internal/jobs/deploy_handler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace buildq::jobs {

using observability::IntField;
using observability::StringField;

DeployJobHandler::DeployJobHandler(std::shared_ptr<runtime::ContainerRuntime> runtime, std::shared_ptr<db::DeployStore> store,
                                   std::shared_ptr<observability::MetricsSink> metrics)
    : runtime_(std::move(runtime)),
      store_(std::move(store)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<observability::NoopMetricsSink>()) {
}

template <typename E>
void DeployJobHandler::Fail(const db::model::DeploymentRecord& deployment, std::chrono::steady_clock::time_point start, const std::string& reason,
                            const std::string& message) {
  if (auto r = store_->UpdateDeploymentStatus(deployment.id, db::model::DeploymentStatus::kFailed, reason); !r) {
    BUILDQ_LOG_ERROR("failed to persist deployment failure",
                     {IntField("deployment_id", static_cast<std::int64_t>(deployment.id)), StringField("error", db::Describe(r))});
  }
  metrics_->RecordDeployment(false, std::chrono::steady_clock::now() - start);
  throw E(message);
}

void DeployJobHandler::Handle(JobContext& ctx) {
  const auto* payload = std::get_if<DeployPayload>(&ctx.job().payload);
  if (!payload) {
    throw util::InvalidArgument("invalid deployment data in job");
  }
  const auto& deployment = payload->deployment;
  const auto  start      = std::chrono::steady_clock::now();
  const auto  deploy_id  = static_cast<std::int64_t>(deployment.id);

  ctx.ReportProgress(10);

  std::optional<db::model::ServiceRecord> service;
  try {
    service = store_->GetService(deployment.service_id);
  } catch (const util::IoError& e) {
    Fail<util::IoError>(deployment, start, std::string("Failed to get service: ") + e.what(), std::string("failed to get service: ") + e.what());
  }
  if (!service) {
    const auto err = "service " + std::to_string(deployment.service_id) + " not found";
    Fail<util::NotFound>(deployment, start, "Failed to get service: " + err, "failed to get service: " + err);
  }

  ctx.ReportProgress(20);

  if (auto r = store_->UpdateDeploymentStatus(deployment.id, db::model::DeploymentStatus::kDeploying, std::nullopt); !r) {
    BUILDQ_LOG_ERROR("failed to update deployment status", {IntField("deployment_id", deploy_id), StringField("error", db::Describe(r))});
  }

  ctx.ReportProgress(30);

  bool exists = false;
  try {
    exists = runtime_->ImageExists(ctx.execution(), deployment.image_tag);
  } catch (const std::exception& e) {
    Fail<util::ExternalError>(deployment, start, std::string("Failed to check image existence: ") + e.what(),
                              std::string("failed to check image existence: ") + e.what());
  }

  if (!exists) {
    BUILDQ_LOG_INFO("pulling image for deployment", {IntField("deployment_id", deploy_id), StringField("image_tag", deployment.image_tag)});
    try {
      runtime_->PullImage(ctx.execution(), deployment.image_tag);
    } catch (const std::exception& e) {
      Fail<util::ExternalError>(deployment, start, std::string("Failed to pull image: ") + e.what(),
                                "failed to pull image " + deployment.image_tag + ": " + e.what());
    }
  }

  ctx.ReportProgress(60);

  db::ServiceUpdate update;
  update.image = deployment.image_tag;
  if (auto r = store_->UpdateService(deployment.service_id, update); !r) {
    Fail<util::ExternalError>(deployment, start, "Failed to update service: " + db::Describe(r), "failed to update service: " + db::Describe(r));
  }

  ctx.ReportProgress(90);

  if (auto r = store_->UpdateDeploymentStatus(deployment.id, db::model::DeploymentStatus::kSuccess, std::nullopt); !r) {
    BUILDQ_LOG_ERROR("failed to update deployment status to success", {IntField("deployment_id", deploy_id), StringField("error", db::Describe(r))});
  }

  ctx.ReportProgress(100);

  metrics_->RecordDeployment(true, std::chrono::steady_clock::now() - start);

  BUILDQ_LOG_INFO("deployment completed successfully",
                  {IntField("deployment_id", deploy_id), IntField("service_id", static_cast<std::int64_t>(deployment.service_id)),
                   StringField("image_tag", deployment.image_tag)});
}

} // namespace buildq::jobs

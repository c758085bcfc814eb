#include "internal/jobs/deploy_handler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using buildq::db::model::DeploymentRecord;
using buildq::db::model::DeploymentStatus;
using buildq::db::model::ServiceRecord;
using buildq::jobs::BuildPayload;
using buildq::jobs::DeployJobHandler;
using buildq::jobs::DeployPayload;
using buildq::jobs::Job;
using buildq::jobs::JobContext;
using buildq::jobs::JobKind;
using buildq::testing::FakeRuntime;
using buildq::testing::FlakyRepository;
using buildq::testing::RecordingMetricsSink;
using buildq::util::ExecutionContext;
using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<FakeRuntime>          runtime = std::make_shared<FakeRuntime>();
  std::shared_ptr<FlakyRepository>      store   = std::make_shared<FlakyRepository>();
  std::shared_ptr<RecordingMetricsSink> metrics = std::make_shared<RecordingMetricsSink>();
  ServiceRecord                         service;
  DeploymentRecord                      deployment;
  std::vector<int>                      progress;

  Fixture() {
    service.project_id = 1;
    service.name       = "api";
    service.image      = "api:v1";
    auto created       = store->CreateService(service);
    assert(created);

    deployment.project_id = 1;
    deployment.service_id = service.id;
    deployment.image_tag  = "api:v2";
    deployment.status     = DeploymentStatus::kQueued;
    deployment.reason     = "release";
    created               = store->CreateDeployment(deployment);
    assert(created);
  }

  DeployJobHandler Handler() {
    return DeployJobHandler(runtime, store, metrics);
  }

  Job MakeJob() const {
    Job job;
    job.id      = "job-1";
    job.kind    = JobKind::kDeploy;
    job.payload = DeployPayload{deployment};
    return job;
  }

  // Runs the handler; returns the thrown message, empty on success.
  template <typename E = std::exception>
  std::string Run() {
    ExecutionContext execution(30s);
    JobContext       ctx(MakeJob(), execution, [this](int p) { progress.push_back(p); });
    auto             handler = Handler();
    try {
      handler.Handle(ctx);
    } catch (const E& e) {
      return e.what();
    }
    return {};
  }

  DeploymentRecord Stored() const {
    return *store->inner.GetDeployment(deployment.id);
  }
};

void TestDeployWithLocalImage() {
  Fixture fx;
  auto    error = fx.Run();

  assert(error.empty());
  assert((fx.progress == std::vector<int>{10, 20, 30, 60, 90, 100}));
  assert(fx.runtime->exists_calls == 1);
  assert(fx.runtime->pull_calls == 0);
  assert(fx.store->GetService(fx.service.id)->image == "api:v2");
  assert(fx.Stored().status == DeploymentStatus::kSuccess);
  assert(fx.Stored().reason == "release");

  auto deployments = fx.metrics->Deployments();
  assert(deployments.size() == 1);
  assert(deployments[0].success);
}

void TestDeployPullsMissingImage() {
  Fixture fx;
  fx.runtime->image_exists = false;

  assert(fx.Run().empty());
  assert(fx.runtime->pull_calls == 1);
  assert(fx.Stored().status == DeploymentStatus::kSuccess);
  assert(fx.store->GetService(fx.service.id)->image == "api:v2");
}

void TestMissingServiceFailsFast() {
  Fixture fx;
  fx.deployment.service_id = 999;

  auto error = fx.Run<buildq::util::NotFound>();
  assert(error == "failed to get service: service 999 not found");
  assert(fx.runtime->exists_calls == 0);
  assert(fx.Stored().status == DeploymentStatus::kFailed);
  assert(fx.Stored().reason == "Failed to get service: service 999 not found");
  assert((fx.progress == std::vector<int>{10}));

  auto deployments = fx.metrics->Deployments();
  assert(deployments.size() == 1);
  assert(!deployments[0].success);
}

void TestServiceReadFailureIsNotReportedAsMissing() {
  Fixture fx;
  fx.store->fail_service_reads = true;

  auto error = fx.Run<buildq::util::IoError>();
  assert(error == "failed to get service: sqlite read from services failed: disk I/O error");
  assert(error.find("not found") == std::string::npos);
  assert(fx.runtime->exists_calls == 0);
  assert(fx.Stored().status == DeploymentStatus::kFailed);
  assert(fx.Stored().reason.rfind("Failed to get service: sqlite read from services failed", 0) == 0);
  assert(fx.metrics->Deployments().size() == 1);
}

void TestPullFailureRecordsReason() {
  Fixture fx;
  fx.runtime->image_exists = false;
  fx.runtime->pull_throws  = "manifest unknown";

  auto error = fx.Run<buildq::util::ExternalError>();
  assert(error == "failed to pull image api:v2: manifest unknown");
  assert(fx.Stored().status == DeploymentStatus::kFailed);
  assert(fx.Stored().reason == "Failed to pull image: manifest unknown");
  assert(fx.store->GetService(fx.service.id)->image == "api:v1");
  assert(fx.metrics->Deployments().size() == 1);
  assert(!fx.metrics->Deployments()[0].success);
}

void TestImageCheckFailure() {
  Fixture fx;
  fx.runtime->exists_throws = "Cannot connect to the Docker daemon";

  auto error = fx.Run<buildq::util::ExternalError>();
  assert(error == "failed to check image existence: Cannot connect to the Docker daemon");
  assert(fx.runtime->pull_calls == 0);
  assert(fx.Stored().status == DeploymentStatus::kFailed);
  assert(fx.Stored().reason.rfind("Failed to check image existence:", 0) == 0);
  assert(fx.metrics->Deployments().size() == 1);
}

void TestServiceUpdateFailure() {
  Fixture fx;
  fx.store->fail_service_updates = true;

  auto error = fx.Run<buildq::util::ExternalError>();
  assert(error.rfind("failed to update service:", 0) == 0);
  assert(fx.Stored().status == DeploymentStatus::kFailed);
  assert(fx.Stored().reason.rfind("Failed to update service:", 0) == 0);
  assert(fx.store->GetService(fx.service.id)->image == "api:v1");
  assert((fx.progress == std::vector<int>{10, 20, 30, 60}));
  assert(fx.metrics->Deployments().size() == 1);
  assert(!fx.metrics->Deployments()[0].success);
}

void TestStatusWriteFailuresAreNotFatal() {
  Fixture fx;
  fx.store->fail_deployment_updates = true;

  assert(fx.Run().empty());
  assert(fx.Stored().status == DeploymentStatus::kQueued);
  assert(fx.store->GetService(fx.service.id)->image == "api:v2");
  assert(fx.metrics->Deployments().size() == 1);
  assert(fx.metrics->Deployments()[0].success);
}

void TestWrongPayloadRejected() {
  Fixture fx;

  Job job;
  job.id      = "job-2";
  job.kind    = JobKind::kDeploy;
  job.payload = BuildPayload{};

  ExecutionContext execution(30s);
  JobContext       ctx(job, execution, nullptr);
  auto             handler = fx.Handler();

  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::InvalidArgument& e) {
    error = e.what();
  }
  assert(error == "invalid deployment data in job");
  assert(fx.metrics->Deployments().empty());
}

} // namespace

int main() {
  TestDeployWithLocalImage();
  TestDeployPullsMissingImage();
  TestMissingServiceFailsFast();
  TestServiceReadFailureIsNotReportedAsMissing();
  TestPullFailureRecordsReason();
  TestImageCheckFailure();
  TestServiceUpdateFailure();
  TestStatusWriteFailuresAreNotFatal();
  TestWrongPayloadRejected();

  std::cout << "buildq_unit_deploy_handler: pass\n";
  return 0;
}

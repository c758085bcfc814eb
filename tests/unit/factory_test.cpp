#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using buildq::config::ConfigLoader;
using buildq::db::model::BuildStatus;
using buildq::db::model::DeploymentStatus;
using buildq::jobs::JobStatus;
using buildq::testing::FakeRuntime;
using buildq::testing::TempDir;
using buildq::testing::WaitUntil;

buildq::runtime::config::RuntimeConfig Config(const std::filesystem::path& dir, const std::string& database) {
  return ConfigLoader::LoadFromYamlString("queue:\n  workers: 2\nbuilds:\n  log_dir: \"" + (dir / "logs").string() +
                                          "\"\n  estimated_log_lines: 3\n" + database + "logging:\n  level: warn\n");
}

void RunPipeline(buildq::factory::Application& app, FakeRuntime& runtime) {
  runtime.build_log_lines = 3;
  runtime.image_exists    = false;

  auto service = app.cicd->CreateService(1, "shop", "");

  buildq::service::BuildRequest request;
  request.git_url = "https://example.com/shop.git";
  request.git_ref = "main";
  auto build      = app.cicd->TriggerBuild(service.id, request);

  app.queue->Start();
  assert(WaitUntil([&] { return buildq::jobs::IsTerminal(app.cicd->GetJob(build.job.id)->status); }));
  assert(app.cicd->GetJob(build.job.id)->status == JobStatus::kSuccess);

  auto stored = app.cicd->ListBuilds(service.id);
  assert(stored.size() == 1);
  assert(stored[0].status == BuildStatus::kSuccess);
  assert(std::filesystem::exists(stored[0].log_path));

  auto deploy = app.cicd->TriggerDeployment(service.id, build.build.image_tag, "ship it");
  assert(WaitUntil([&] { return buildq::jobs::IsTerminal(app.cicd->GetJob(deploy.job.id)->status); }));
  assert(app.cicd->GetJob(deploy.job.id)->status == JobStatus::kSuccess);
  assert(runtime.pull_calls == 1);
  assert(app.repository->GetService(service.id)->image == build.build.image_tag);
  assert(app.cicd->ListDeployments(service.id)[0].status == DeploymentStatus::kSuccess);

  app.queue->Stop();
}

void TestMemoryBackedApplication() {
  const auto dir    = TempDir("factory_memory");
  const auto config = Config(dir, "");
  buildq::observability::InitializeLogging(config);

  auto runtime = std::make_shared<FakeRuntime>();
  auto app     = buildq::factory::Build(config, runtime);
  assert(app.repository && app.metrics && app.queue && app.cicd);
  assert(app.queue->Options().workers == 2);
  assert(std::filesystem::is_directory(dir / "logs"));

  RunPipeline(app, *runtime);
}

void TestDeployJobForMissingServiceFailsThroughQueue() {
  const auto dir = TempDir("factory_missing_service");
  auto       app = buildq::factory::Build(Config(dir, ""), std::make_shared<FakeRuntime>());

  buildq::db::model::DeploymentRecord deployment;
  deployment.project_id = 1;
  deployment.service_id = 999;
  deployment.image_tag  = "shop:main-1";
  auto created          = app.repository->CreateDeployment(deployment);
  assert(created);

  app.queue->Start();
  auto job = app.queue->Enqueue(buildq::jobs::JobKind::kDeploy, buildq::jobs::DeployPayload{deployment});
  assert(WaitUntil([&] { return buildq::jobs::IsTerminal(app.queue->GetJob(job.id)->status); }));

  auto done = *app.queue->GetJob(job.id);
  assert(done.status == JobStatus::kFailed);
  assert(done.error.find("failed to get service") != std::string::npos);
  assert(done.progress == 100);

  auto stored = app.repository->GetDeployment(deployment.id);
  assert(stored);
  assert(stored->status == DeploymentStatus::kFailed);
  assert(stored->reason == "Failed to get service: service 999 not found");
  app.queue->Stop();
}

#if BUILDQ_DB_SQLITE
void TestSqliteBackedApplication() {
  const auto dir    = TempDir("factory_sqlite");
  const auto config = Config(dir, "database:\n  sqlite:\n    path: \"" + (dir / "state" / "buildq.db").string() + "\"\n");

  auto runtime = std::make_shared<FakeRuntime>();
  auto app     = buildq::factory::Build(config, runtime);
  RunPipeline(app, *runtime);
  assert(std::filesystem::exists(dir / "state" / "buildq.db"));
}
#endif

void TestUnusableLogDirIsFatal() {
  const auto dir = TempDir("factory_bad_log_dir");
  // A regular file where the log directory should go.
  const auto blocker = dir / "logs";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  bool threw = false;
  try {
    buildq::factory::Build(Config(dir, ""), std::make_shared<FakeRuntime>());
  } catch (const buildq::util::IoError& e) {
    threw = std::string(e.what()).find("failed to create log dir") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMemoryBackedApplication();
  TestDeployJobForMissingServiceFailsThroughQueue();
#if BUILDQ_DB_SQLITE
  TestSqliteBackedApplication();
#endif
  TestUnusableLogDirIsFatal();

  buildq::observability::ShutdownLogging();
  std::cout << "buildq_unit_factory: pass\n";
  return 0;
}

#include "internal/jobs/build_handler.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stop_token>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using buildq::db::model::BuildRecord;
using buildq::db::model::BuildStatus;
using buildq::jobs::BuildHandlerOptions;
using buildq::jobs::BuildJobHandler;
using buildq::jobs::BuildPayload;
using buildq::jobs::DeployPayload;
using buildq::jobs::Job;
using buildq::jobs::JobContext;
using buildq::jobs::JobKind;
using buildq::testing::FakeRuntime;
using buildq::testing::FlakyRepository;
using buildq::testing::RecordingMetricsSink;
using buildq::testing::TempDir;
using buildq::util::ExecutionContext;
using namespace std::chrono_literals;

struct Fixture {
  std::filesystem::path                 log_dir;
  std::shared_ptr<FakeRuntime>          runtime = std::make_shared<FakeRuntime>();
  std::shared_ptr<FlakyRepository>      store   = std::make_shared<FlakyRepository>();
  std::shared_ptr<RecordingMetricsSink> metrics = std::make_shared<RecordingMetricsSink>();
  BuildRecord                           build;

  explicit Fixture(const std::string& name) : log_dir(TempDir(name)) {
    buildq::db::model::ServiceRecord service;
    service.project_id = 1;
    service.name       = "web";
    service.image      = "web:old";
    auto created = store->CreateService(service);
    assert(created);

    build.project_id = 1;
    build.service_id = service.id;
    build.git_url    = "https://example.com/web.git";
    build.git_ref    = "main";
    build.image_tag  = "web:main-1700000000";
    build.status     = BuildStatus::kQueued;
    created = store->CreateBuild(build);
    assert(created);
  }

  BuildJobHandler Handler(int estimated_lines = 500) {
    BuildHandlerOptions options;
    options.log_dir             = log_dir.string();
    options.estimated_log_lines = estimated_lines;
    return BuildJobHandler(runtime, store, metrics, options);
  }

  Job MakeJob(std::optional<int> estimate = std::nullopt) const {
    Job job;
    job.id      = "job-1";
    job.kind    = JobKind::kBuild;
    job.payload = BuildPayload{build, estimate};
    return job;
  }
};

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestSuccessfulBuild() {
  Fixture fx("build_success");
  fx.runtime->build_log_lines = 4;

  std::vector<int> progress;
  ExecutionContext execution(30s);
  JobContext       ctx(fx.MakeJob(4), execution, [&](int p) { progress.push_back(p); });

  auto handler = fx.Handler();
  handler.Handle(ctx);

  assert(fx.runtime->build_calls == 1);
  assert(fx.runtime->last_spec->context_path == ".");
  assert(fx.runtime->last_spec->dockerfile == "Dockerfile");
  assert(fx.runtime->last_spec->image_tag == fx.build.image_tag);

  // Milestones plus one report per log line, never decreasing.
  assert((progress == std::vector<int>{10, 20, 30, 45, 60, 75, 90, 90, 100}));

  const auto log_path = handler.LogPathFor(fx.build.id);
  assert(log_path == (fx.log_dir / ("build_" + std::to_string(fx.build.id) + ".log")).string());
  assert(ReadFile(log_path) == "step 1\nstep 2\nstep 3\nstep 4\n");

  auto stored = *fx.store->GetBuild(fx.build.id);
  assert(stored.status == BuildStatus::kSuccess);
  assert(stored.log_path == log_path);
  assert(stored.started_at_ms > 0);
  assert(stored.finished_at_ms >= stored.started_at_ms);

  auto builds = fx.metrics->Builds();
  assert(builds.size() == 1);
  assert(builds[0].success);
  assert(builds[0].duration.count() >= 0);
}

void TestFailedBuildIsPersisted() {
  Fixture fx("build_failed");
  fx.runtime->build_success = false;
  fx.runtime->build_error   = "exit status 2";

  std::vector<int> progress;
  ExecutionContext execution(30s);
  JobContext       ctx(fx.MakeJob(), execution, [&](int p) { progress.push_back(p); });

  auto        handler = fx.Handler();
  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::ExternalError& e) {
    error = e.what();
  }

  assert(error == "build failed: exit status 2");
  assert(fx.runtime->build_calls == 1);
  assert(progress.back() == 100);
  assert(fx.store->GetBuild(fx.build.id)->status == BuildStatus::kFailed);
  assert(fx.store->GetBuild(fx.build.id)->finished_at_ms > 0);

  auto builds = fx.metrics->Builds();
  assert(builds.size() == 1);
  assert(!builds[0].success);
}

void TestRuntimeExceptionIsWrapped() {
  Fixture fx("build_throws");
  fx.runtime->build_throws = "failed to clone repository: exit status 128";

  ExecutionContext execution(30s);
  JobContext       ctx(fx.MakeJob(), execution, nullptr);

  auto        handler = fx.Handler();
  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::ExternalError& e) {
    error = e.what();
  }

  assert(error == "build failed: failed to clone repository: exit status 128");
  assert(fx.store->GetBuild(fx.build.id)->status == BuildStatus::kFailed);
  assert(fx.metrics->Builds().size() == 1);
}

void TestUnwritableLogDirFailsBeforeBuilding() {
  Fixture fx("build_bad_log_dir");

  BuildHandlerOptions options;
  options.log_dir = (fx.log_dir / "missing" / "nested").string();
  BuildJobHandler handler(fx.runtime, fx.store, fx.metrics, options);

  ExecutionContext execution(30s);
  JobContext       ctx(fx.MakeJob(), execution, nullptr);

  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::IoError& e) {
    error = e.what();
  }

  assert(error.rfind("failed to create log file:", 0) == 0);
  assert(fx.runtime->build_calls == 0);
  assert(fx.store->GetBuild(fx.build.id)->status == BuildStatus::kQueued);
}

void TestStoreFailuresDoNotFailBuild() {
  Fixture fx("build_store_down");
  fx.store->fail_build_updates = true;

  std::vector<int> progress;
  ExecutionContext execution(30s);
  JobContext       ctx(fx.MakeJob(), execution, [&](int p) { progress.push_back(p); });

  auto handler = fx.Handler();
  handler.Handle(ctx);

  assert(progress.back() == 100);
  assert(fx.store->GetBuild(fx.build.id)->status == BuildStatus::kQueued);
  assert(fx.metrics->Builds().size() == 1);
  assert(fx.metrics->Builds()[0].success);
}

void TestCancellationReachesRuntime() {
  Fixture fx("build_cancel");
  fx.runtime->wait_for_cancel = true;

  std::stop_source stop;
  ExecutionContext execution(stop.get_token(), 30s);
  JobContext       ctx(fx.MakeJob(), execution, nullptr);

  std::thread canceller([&] {
    std::this_thread::sleep_for(30ms);
    stop.request_stop();
  });

  auto        handler = fx.Handler();
  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::ExternalError& e) {
    error = e.what();
  }
  canceller.join();

  assert(error == "build failed: context canceled");
  assert(fx.runtime->cancel_reason == "context canceled");
  assert(fx.store->GetBuild(fx.build.id)->status == BuildStatus::kFailed);
}

void TestWrongPayloadRejected() {
  Fixture fx("build_wrong_payload");

  Job job;
  job.id      = "job-2";
  job.kind    = JobKind::kBuild;
  job.payload = DeployPayload{};

  ExecutionContext execution(30s);
  JobContext       ctx(job, execution, nullptr);

  auto        handler = fx.Handler();
  std::string error;
  try {
    handler.Handle(ctx);
  } catch (const buildq::util::InvalidArgument& e) {
    error = e.what();
  }
  assert(error == "invalid build data in job");
  assert(fx.runtime->build_calls == 0);
  assert(fx.metrics->Builds().empty());
}

} // namespace

int main() {
  TestSuccessfulBuild();
  TestFailedBuildIsPersisted();
  TestRuntimeExceptionIsWrapped();
  TestUnwritableLogDirFailsBeforeBuilding();
  TestStoreFailuresDoNotFailBuild();
  TestCancellationReachesRuntime();
  TestWrongPayloadRejected();

  std::cout << "buildq_unit_build_handler: pass\n";
  return 0;
}

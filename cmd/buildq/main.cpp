#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/time.hpp"

using buildq::factory::Application;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitJobFailed = 3;

void Usage() {
  std::cerr << "Usage:\n"
            << "  buildq --config <config.yaml> service-add <project_id> <name> [image]\n"
            << "  buildq --config <config.yaml> build <service_id> <git_url> <git_ref> [context] [dockerfile]\n"
            << "  buildq --config <config.yaml> deploy <service_id> <image_tag> [reason]\n"
            << "  buildq --config <config.yaml> rollback <service_id>\n"
            << "  buildq --config <config.yaml> builds <service_id>\n"
            << "  buildq --config <config.yaml> deployments <service_id>\n";
}

int UsageError() {
  Usage();
  return kExitUsage;
}

std::optional<uint64_t> ParseId(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return std::stoull(s);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string FormatMs(uint64_t ms) {
  if (ms == 0) return "-";
  return buildq::util::FormatTimestamp(buildq::util::FromUnixMillis(static_cast<std::int64_t>(ms)));
}

// Runs the queue until the job is terminal or a signal arrives.
int WaitForJob(Application& app, const std::string& job_id) {
  app.queue->Start();

  int last_progress = -1;
  for (;;) {
    auto job = app.queue->GetJob(job_id);
    if (!job) {
      std::cerr << "job " << job_id << " disappeared\n";
      app.queue->Stop();
      return kExitFatal;
    }

    if (job->progress != last_progress) {
      last_progress = job->progress;
      std::cout << "[" << job_id << "] " << buildq::jobs::ToString(job->status) << " " << job->progress << "%" << std::endl;
    }

    if (buildq::jobs::IsTerminal(job->status)) {
      app.queue->Stop();
      if (job->status == buildq::jobs::JobStatus::kSuccess) {
        std::cout << "job " << job_id << " succeeded" << std::endl;
        return kExitOk;
      }
      std::cout << "job " << job_id << " failed: " << job->error << std::endl;
      return kExitJobFailed;
    }

    if (!g_running) {
      BUILDQ_LOG_WARN("interrupted, stopping queue", {buildq::observability::StringField("job_id", job_id)});
      // Stop cancels the handler; the job ends up failed.
      app.queue->Stop();
      auto final_job = app.queue->GetJob(job_id);
      std::cout << "job " << job_id << " interrupted: " << (final_job ? final_job->error : std::string("unknown")) << std::endl;
      return kExitJobFailed;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
}

int RunCommand(Application& app, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "service-add") {
    if (args.size() < 3 || args.size() > 4) return UsageError();
    auto project_id = ParseId(args[1]);
    if (!project_id) return UsageError();
    auto service = app.cicd->CreateService(*project_id, args[2], args.size() == 4 ? args[3] : std::string{});
    std::cout << "service " << service.id << " created" << std::endl;
    return kExitOk;
  }

  if (cmd == "build") {
    if (args.size() < 4 || args.size() > 6) return UsageError();
    auto service_id = ParseId(args[1]);
    if (!service_id) return UsageError();

    buildq::service::BuildRequest request;
    request.git_url      = args[2];
    request.git_ref      = args[3];
    request.context_path = args.size() > 4 ? args[4] : std::string{};
    request.dockerfile   = args.size() > 5 ? args[5] : std::string{};
    request.triggered_by = "cli";

    auto ticket = app.cicd->TriggerBuild(*service_id, request);
    std::cout << "build " << ticket.build.id << " queued as job " << ticket.job.id << " (" << ticket.build.image_tag << ")" << std::endl;
    return WaitForJob(app, ticket.job.id);
  }

  if (cmd == "deploy") {
    if (args.size() < 3 || args.size() > 4) return UsageError();
    auto service_id = ParseId(args[1]);
    if (!service_id) return UsageError();

    auto ticket = app.cicd->TriggerDeployment(*service_id, args[2], args.size() == 4 ? args[3] : std::string("manual deploy"));
    std::cout << "deployment " << ticket.deployment.id << " queued as job " << ticket.job.id << std::endl;
    return WaitForJob(app, ticket.job.id);
  }

  if (cmd == "rollback") {
    if (args.size() != 2) return UsageError();
    auto service_id = ParseId(args[1]);
    if (!service_id) return UsageError();

    auto ticket = app.cicd->Rollback(*service_id);
    std::cout << "rollback deployment " << ticket.deployment.id << " (" << ticket.deployment.image_tag << ") queued as job " << ticket.job.id << std::endl;
    return WaitForJob(app, ticket.job.id);
  }

  if (cmd == "builds") {
    if (args.size() != 2) return UsageError();
    auto service_id = ParseId(args[1]);
    if (!service_id) return UsageError();

    for (const auto& b : app.cicd->ListBuilds(*service_id)) {
      std::cout << b.id << "\t" << buildq::db::model::ToString(b.status) << "\t" << b.image_tag << "\t" << b.git_ref << "\t" << FormatMs(b.created_at_ms)
                << "\t" << b.log_path << "\n";
    }
    return kExitOk;
  }

  if (cmd == "deployments") {
    if (args.size() != 2) return UsageError();
    auto service_id = ParseId(args[1]);
    if (!service_id) return UsageError();

    for (const auto& d : app.cicd->ListDeployments(*service_id)) {
      std::cout << d.id << "\t" << buildq::db::model::ToString(d.status) << "\t" << d.image_tag << "\t" << FormatMs(d.created_at_ms) << "\t" << d.reason
                << "\n";
    }
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  int rc = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = buildq::config::ConfigLoader::LoadFromYaml(config_path);

    buildq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = buildq::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    rc = RunCommand(app, args);

    app.queue->Stop();
    buildq::observability::ShutdownMetrics();
    buildq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BUILDQ_LOG_ERROR("Fatal error", {buildq::observability::StringField("error", e.what())});
    buildq::observability::ShutdownMetrics();
    buildq::observability::ShutdownLogging();
    return kExitFatal;
  }

  return rc;
}

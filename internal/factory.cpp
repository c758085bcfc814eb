#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/jobs/build_handler.hpp"
#include "internal/jobs/deploy_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/docker_cli_runtime.hpp"
#include "internal/util/errors.hpp"
#if BUILDQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace buildq::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const buildq::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BUILDQ_DB_SQLITE
    const auto& path = database.sqlite().path();
    if (path != ":memory:") {
      const auto parent = std::filesystem::path(path).parent_path();
      std::error_code ec;
      if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    db::sqlite::BootstrapSchema(*sqlite_db);
    BUILDQ_LOG_INFO("using sqlite store", {StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  BUILDQ_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const buildq::runtime::config::RuntimeConfig& config, std::shared_ptr<runtime::ContainerRuntime> container_runtime) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.runtime    = std::move(container_runtime);
  app.metrics    = observability::MakeMetricsSink(config);

  const auto& builds = config.builds();
  std::error_code ec;
  std::filesystem::create_directories(builds.log_dir(), ec);
  if (ec) {
    throw util::IoError("failed to create log dir " + builds.log_dir() + ": " + ec.message());
  }

  // ------------------------------------------------------------------
  // Queue + handlers
  // ------------------------------------------------------------------
  jobs::QueueOptions queue_options;
  queue_options.workers     = config.queue().workers();
  queue_options.capacity    = static_cast<std::size_t>(config.queue().capacity());
  queue_options.job_timeout = std::chrono::seconds(config.queue().job_timeout_seconds());
  app.queue                 = std::make_shared<jobs::Queue>(queue_options, app.metrics);

  jobs::BuildHandlerOptions build_options;
  build_options.log_dir             = builds.log_dir();
  build_options.estimated_log_lines = builds.estimated_log_lines();

  auto build_handler  = std::make_shared<jobs::BuildJobHandler>(app.runtime, app.repository, app.metrics, build_options);
  auto deploy_handler = std::make_shared<jobs::DeployJobHandler>(app.runtime, app.repository, app.metrics);

  app.queue->RegisterHandler(jobs::JobKind::kBuild, [build_handler](jobs::JobContext& ctx) { build_handler->Handle(ctx); });
  app.queue->RegisterHandler(jobs::JobKind::kDeploy, [deploy_handler](jobs::JobContext& ctx) { deploy_handler->Handle(ctx); });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.queue      = app.queue;
  app.cicd       = std::make_shared<service::CicdService>(ctx);

  return app;
}

Application Build(const buildq::runtime::config::RuntimeConfig& config) {
  const auto&               runtime_config = config.runtime();
  runtime::DockerCliOptions options;
  options.docker_binary = runtime_config.docker_binary();
  options.git_binary    = runtime_config.git_binary();
  options.platform      = runtime_config.platform();
  options.work_dir      = runtime_config.work_dir();

  return Build(config, std::make_shared<runtime::DockerCliRuntime>(options));
}

} // namespace buildq::factory

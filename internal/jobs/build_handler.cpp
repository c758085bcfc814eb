#include "internal/jobs/build_handler.hpp"

#include <chrono>
#include <filesystem>

#include "internal/jobs/progress_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/log_sink.hpp"
#include "internal/util/errors.hpp"

namespace buildq::jobs {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kLogProgressBase = 30;
constexpr int kLogProgressMax  = 90;

uint64_t NowMs() {
  return static_cast<uint64_t>(util::ToUnixMillis(util::Now()));
}

} // namespace

BuildJobHandler::BuildJobHandler(std::shared_ptr<runtime::ContainerRuntime> runtime, std::shared_ptr<db::BuildStore> store,
                                 std::shared_ptr<observability::MetricsSink> metrics, BuildHandlerOptions options)
    : runtime_(std::move(runtime)),
      store_(std::move(store)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<observability::NoopMetricsSink>()),
      options_(std::move(options)) {
}

std::string BuildJobHandler::LogPathFor(uint64_t build_id) const {
  return (std::filesystem::path(options_.log_dir) / ("build_" + std::to_string(build_id) + ".log")).string();
}

void BuildJobHandler::Handle(JobContext& ctx) {
  const auto* payload = std::get_if<BuildPayload>(&ctx.job().payload);
  if (!payload) {
    throw util::InvalidArgument("invalid build data in job");
  }
  const auto& build = payload->build;
  const auto  start = std::chrono::steady_clock::now();

  ctx.ReportProgress(10);

  const auto                            log_path = LogPathFor(build.id);
  std::unique_ptr<runtime::FileLogSink> log_file;
  try {
    log_file = std::make_unique<runtime::FileLogSink>(log_path);
  } catch (const util::IoError& e) {
    throw util::IoError(std::string("failed to create log file: ") + e.what());
  }

  if (auto r = store_->UpdateBuildStatus(build.id, db::model::BuildStatus::kBuilding, log_path, NowMs(), std::nullopt); !r) {
    BUILDQ_LOG_ERROR("failed to update build status", {IntField("build_id", static_cast<std::int64_t>(build.id)), StringField("error", db::Describe(r))});
  }

  ctx.ReportProgress(20);

  const int estimated = payload->estimated_log_lines.value_or(options_.estimated_log_lines);
  ProgressWriter progress(*log_file, ctx.progress_fn(), kLogProgressBase, kLogProgressMax, estimated);

  runtime::BuildSpec spec;
  spec.git_url      = build.git_url;
  spec.git_ref      = build.git_ref;
  spec.context_path = build.context_path.empty() ? "." : build.context_path;
  spec.dockerfile   = build.dockerfile.empty() ? "Dockerfile" : build.dockerfile;
  spec.image_tag    = build.image_tag;
  spec.log          = &progress;

  ctx.ReportProgress(30);

  runtime::BuildResult result;
  std::string          failure;
  try {
    result = runtime_->BuildImage(ctx.execution(), spec);
    if (!result.success) {
      failure = result.error.empty() ? "build unsuccessful" : result.error;
    }
  } catch (const std::exception& e) {
    failure = e.what();
  }

  ctx.ReportProgress(90);

  const bool success = failure.empty();
  metrics_->RecordBuild(success, std::chrono::steady_clock::now() - start);

  const auto final_status = success ? db::model::BuildStatus::kSuccess : db::model::BuildStatus::kFailed;
  if (auto r = store_->UpdateBuildStatus(build.id, final_status, log_path, std::nullopt, NowMs()); !r) {
    BUILDQ_LOG_ERROR("failed to update final build status",
                     {IntField("build_id", static_cast<std::int64_t>(build.id)), StringField("error", db::Describe(r))});
  }

  ctx.ReportProgress(100);

  if (!success) {
    throw util::ExternalError("build failed: " + failure);
  }

  BUILDQ_LOG_INFO("build completed successfully",
                  {IntField("build_id", static_cast<std::int64_t>(build.id)), StringField("image_tag", build.image_tag),
                   StringField("image_id", result.image_id), IntField("log_lines", progress.Lines())});
}

} // namespace buildq::jobs

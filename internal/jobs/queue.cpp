#include "internal/jobs/queue.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace buildq::jobs {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kShuttingDown = "queue is shutting down";

// Set for the lifetime of a worker thread; lets Stop recognise a call
// coming from inside one of its own handlers.
thread_local const Queue* tls_worker_owner = nullptr;

QueueOptions Checked(QueueOptions options) {
  if (options.workers < 1) {
    throw util::InvalidArgument("queue workers must be >= 1, got " + std::to_string(options.workers));
  }
  if (options.capacity < 1) {
    throw util::InvalidArgument("queue capacity must be >= 1");
  }
  if (options.job_timeout.count() <= 0) {
    throw util::InvalidArgument("queue job timeout must be positive");
  }
  if (options.job_timeout > kMaxJobTimeout) {
    throw util::InvalidArgument("queue job timeout must be <= " + std::to_string(kMaxJobTimeout.count()) + "s");
  }
  return options;
}

std::int64_t ElapsedMs(const Job& job) {
  if (!job.started_at || !job.finished_at) return 0;
  return std::chrono::duration_cast<std::chrono::milliseconds>(*job.finished_at - *job.started_at).count();
}

} // namespace

Queue::Queue(QueueOptions options, std::shared_ptr<observability::MetricsSink> metrics)
    : options_(Checked(options)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<observability::NoopMetricsSink>()),
      channel_(options_.capacity) {
}

Queue::~Queue() {
  Stop();
}

void Queue::RegisterHandler(JobKind kind, JobHandler handler) {
  std::lock_guard lock(handlers_mutex_);
  handlers_[kind] = std::move(handler);
}

void Queue::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (started_ || stopped_) {
    BUILDQ_LOG_WARN("queue start ignored", {StringField("reason", stopped_ ? "stopped" : "already started")});
    return;
  }
  started_ = true;

  workers_.reserve(static_cast<std::size_t>(options_.workers));
  for (int i = 0; i < options_.workers; ++i) {
    workers_.emplace_back(&Queue::WorkerLoop, this, i);
  }

  BUILDQ_LOG_INFO("job queue started", {IntField("workers", options_.workers), IntField("capacity", static_cast<std::int64_t>(options_.capacity))});
}

void Queue::Stop() {
  if (tls_worker_owner == this) {
    // A worker cannot join itself: cancel and fail the backlog now, the
    // joins happen at the next Stop from outside or in the destructor.
    auto abandoned = Cancel();
    BUILDQ_LOG_INFO("job queue stopping from handler", {IntField("abandoned", static_cast<std::int64_t>(abandoned))});
    return;
  }

  std::lock_guard lock(lifecycle_mutex_);
  if (stopped_) return;

  auto abandoned = Cancel();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  // Anything a worker left behind between Close and its exit.
  abandoned += FailBacklog();
  stopped_ = true;

  BUILDQ_LOG_INFO("job queue stopped", {IntField("abandoned", static_cast<std::int64_t>(abandoned))});
}

std::size_t Queue::Cancel() {
  stop_source_.request_stop();
  channel_.Close();
  return FailBacklog();
}

std::size_t Queue::FailBacklog() {
  auto backlog = channel_.Drain();
  for (const auto& id : backlog) {
    FailWithoutRunning(id, kShuttingDown);
    metrics_->DecActiveJobs();
  }
  return backlog.size();
}

Job Queue::Enqueue(JobKind kind, JobPayload payload) {
  if (!PayloadMatchesKind(kind, payload)) {
    throw util::InvalidArgument("payload does not match job type: " + std::string(ToString(kind)));
  }

  Job job;
  job.id         = util::NextJobId();
  job.kind       = kind;
  job.status     = JobStatus::kQueued;
  job.payload    = std::move(payload);
  job.created_at = util::Now();

  {
    std::unique_lock lock(jobs_mutex_);
    jobs_[job.id] = job;
  }

  bool dispatched = false;
  if (!stop_source_.stop_requested()) {
    metrics_->IncActiveJobs();
    BUILDQ_LOG_INFO("job enqueued", {StringField("job_id", job.id), StringField("type", ToString(kind))});
    dispatched = channel_.Send(job.id);
    if (!dispatched) metrics_->DecActiveJobs();
  }

  if (!dispatched) {
    FailWithoutRunning(job.id, kShuttingDown);
    BUILDQ_LOG_WARN("job rejected", {StringField("job_id", job.id), StringField("type", ToString(kind)), StringField("reason", kShuttingDown)});
    return *GetJob(job.id);
  }
  return job;
}

std::optional<Job> Queue::GetJob(const std::string& id) const {
  std::shared_lock lock(jobs_mutex_);
  auto             it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second;
}

std::vector<Job> Queue::ListJobs(std::optional<JobStatus> status) const {
  std::shared_lock lock(jobs_mutex_);
  std::vector<Job> out;
  out.reserve(jobs_.size());
  for (const auto& [_, job] : jobs_) {
    if (!status || job.status == *status) out.push_back(job);
  }
  return out;
}

void Queue::UpdateProgress(const std::string& id, int percent) {
  std::unique_lock lock(jobs_mutex_);
  auto             it = jobs_.find(id);
  if (it == jobs_.end() || it->second.status != JobStatus::kRunning) return;
  it->second.progress = percent;
}

// ---------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------

void Queue::WorkerLoop(int worker_index) {
  tls_worker_owner = this;
  BUILDQ_LOG_INFO("worker started", {IntField("worker", worker_index)});

  while (auto id = channel_.Receive()) {
    if (stop_source_.stop_requested()) {
      FailWithoutRunning(*id, kShuttingDown);
      metrics_->DecActiveJobs();
      continue;
    }
    ProcessJob(*id);
  }

  BUILDQ_LOG_INFO("worker stopped", {IntField("worker", worker_index)});
  tls_worker_owner = nullptr;
}

void Queue::ProcessJob(const std::string& id) {
  Job snapshot;
  {
    std::unique_lock lock(jobs_mutex_);
    auto             it = jobs_.find(id);
    if (it == jobs_.end()) return;
    it->second.status     = JobStatus::kRunning;
    it->second.started_at = util::Now();
    it->second.progress   = 0;
    snapshot              = it->second;
  }

  BUILDQ_LOG_INFO("job started", {StringField("job_id", id), StringField("type", ToString(snapshot.kind))});

  JobHandler handler;
  {
    std::lock_guard lock(handlers_mutex_);
    auto            it = handlers_.find(snapshot.kind);
    if (it != handlers_.end()) handler = it->second;
  }

  if (!handler) {
    Finish(id, false, "no handler registered for job type: " + std::string(ToString(snapshot.kind)));
    return;
  }

  util::ExecutionContext execution(stop_source_.get_token(), options_.job_timeout);
  JobContext             context(std::move(snapshot), execution, [this, id](int percent) { UpdateProgress(id, percent); });

  try {
    handler(context);
  } catch (const std::exception& e) {
    Finish(id, false, e.what());
    return;
  } catch (...) {
    Finish(id, false, "unknown error");
    return;
  }
  Finish(id, true, {});
}

void Queue::FailWithoutRunning(const std::string& id, const std::string& reason) {
  std::unique_lock lock(jobs_mutex_);
  auto             it = jobs_.find(id);
  if (it == jobs_.end() || IsTerminal(it->second.status)) return;
  it->second.status      = JobStatus::kFailed;
  it->second.progress    = 100;
  it->second.error       = reason;
  it->second.finished_at = util::Now();
}

void Queue::Finish(const std::string& id, bool success, const std::string& error) {
  Job done;
  {
    std::unique_lock lock(jobs_mutex_);
    auto             it = jobs_.find(id);
    if (it == jobs_.end()) return;
    auto& job       = it->second;
    job.finished_at = util::Now();
    job.progress    = 100;
    job.status      = success ? JobStatus::kSuccess : JobStatus::kFailed;
    job.error       = success ? std::string{} : error;
    done            = job;
  }

  metrics_->DecActiveJobs();

  if (success) {
    BUILDQ_LOG_INFO("job completed", {StringField("job_id", id), StringField("type", ToString(done.kind)), IntField("duration_ms", ElapsedMs(done))});
  } else {
    BUILDQ_LOG_ERROR("job failed",
                     {StringField("job_id", id), StringField("type", ToString(done.kind)), IntField("duration_ms", ElapsedMs(done)), StringField("error", error)});
  }
}

} // namespace buildq::jobs

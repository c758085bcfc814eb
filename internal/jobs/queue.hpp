#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/jobs/dispatch_channel.hpp"
#include "internal/jobs/job.hpp"
#include "internal/observability/metrics.hpp"

namespace buildq::jobs {

// Upper bound on a per-job timeout.
inline constexpr std::chrono::seconds kMaxJobTimeout{7 * 24 * 60 * 60};

struct QueueOptions {
  int                  workers  = 1;
  std::size_t          capacity = 100;
  std::chrono::seconds job_timeout{30 * 60};
};

/*
  In-process job queue with a fixed worker pool.

  Lifecycle:
    RegisterHandler* -> Start -> Enqueue/GetJob/ListJobs... -> Stop

  Jobs are dispatched FIFO and finish in any order. Every job reaches
  success or failed: jobs still buffered at Stop are failed with
  "queue is shutting down" instead of being run.

  Timeouts are cooperative. Each handler gets an ExecutionContext that
  expires after job_timeout or at Stop; a handler that never looks at it
  keeps its worker until it returns.

  Thread-safety: every public method may be called from any thread.
*/
class Queue {
 public:
  // Throws util::InvalidArgument for workers < 1, capacity < 1 or a
  // timeout outside (0, kMaxJobTimeout]. A null sink records nothing.
  Queue(QueueOptions options, std::shared_ptr<observability::MetricsSink> metrics);
  ~Queue();

  Queue(const Queue&)            = delete;
  Queue& operator=(const Queue&) = delete;

  // Last registration for a kind wins. Register before Start.
  void RegisterHandler(JobKind kind, JobHandler handler);

  void Start();

  // Cancels running handlers, waits for them, fails the backlog. Idempotent.
  // From inside a handler it only cancels and fails the backlog; the
  // workers are joined by a later Stop from another thread or by the
  // destructor.
  void Stop();

  // Blocks while the buffer is full. Throws util::InvalidArgument when the
  // payload does not match the kind.
  Job Enqueue(JobKind kind, JobPayload payload);

  std::optional<Job> GetJob(const std::string& id) const;

  // No ordering guarantee.
  std::vector<Job> ListJobs(std::optional<JobStatus> status = std::nullopt) const;

  // Ignored unless the job is running.
  void UpdateProgress(const std::string& id, int percent);

  const QueueOptions& Options() const {
    return options_;
  }

 private:
  void WorkerLoop(int worker_index);
  void ProcessJob(const std::string& id);
  std::size_t Cancel();
  std::size_t FailBacklog();
  void FailWithoutRunning(const std::string& id, const std::string& reason);
  void Finish(const std::string& id, bool success, const std::string& error);

  QueueOptions                                options_;
  std::shared_ptr<observability::MetricsSink> metrics_;

  mutable std::shared_mutex            jobs_mutex_;
  std::unordered_map<std::string, Job> jobs_;

  mutable std::mutex                       handlers_mutex_;
  std::unordered_map<JobKind, JobHandler> handlers_;

  DispatchChannel channel_;

  std::mutex               lifecycle_mutex_;
  bool                     started_ = false;
  bool                     stopped_ = false;
  std::stop_source         stop_source_;
  std::vector<std::thread> workers_;
};

} // namespace buildq::jobs

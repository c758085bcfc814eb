#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "internal/runtime/container_runtime.hpp"
#include "internal/util/context.hpp"

namespace buildq::runtime {

struct ProcessResult {
  int  exit_code   = -1;
  bool signaled    = false;
  int  term_signal = 0;
  // Killed because the execution context was cancelled.
  bool cancelled = false;

  bool Ok() const {
    return !signaled && !cancelled && exit_code == 0;
  }
};

/*
  Child process with merged stdout/stderr captured through a pipe.

  The child runs in its own session so a kill reaches everything it spawned
  (docker buildx forks helpers). The destructor kills and reaps a child that
  is still running.
*/
class Subprocess {
 public:
  Subprocess() = default;
  ~Subprocess();

  Subprocess(const Subprocess&)            = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // argv[0] is resolved through PATH. Throws util::ExternalError when the
  // process cannot be spawned; a missing binary shows up as exit code 127.
  void Start(const std::vector<std::string>& argv, const std::string& working_dir = {});

  // Pumps output into `output` (may be null) until the child exits, killing
  // it when `ctx` is cancelled.
  ProcessResult Wait(const util::ExecutionContext& ctx, LogSink* output);

 private:
  void Kill();

  pid_t pid_    = -1;
  int   out_fd_ = -1;
};

// Start + Wait.
ProcessResult RunProcess(const util::ExecutionContext& ctx, const std::vector<std::string>& argv, LogSink* output,
                         const std::string& working_dir = {});

// Runs and returns the captured output; `result` receives the exit status.
std::string CaptureProcess(const util::ExecutionContext& ctx, const std::vector<std::string>& argv, ProcessResult& result);

} // namespace buildq::runtime

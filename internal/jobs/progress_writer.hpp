#pragma once

#include <functional>
#include <mutex>

#include "internal/runtime/container_runtime.hpp"

namespace buildq::jobs {

/*
  LogSink decorator that turns build log lines into job progress.

  Each write is forwarded unchanged; newlines are counted and mapped
  linearly from `base` to `max` over `estimated_lines`, never past `max`.
  Purely advisory: builds that log more than estimated simply sit at `max`.
*/
class ProgressWriter final : public runtime::LogSink {
 public:
  ProgressWriter(runtime::LogSink& inner, std::function<void(int)> report, int base, int max, int estimated_lines);

  void Write(std::string_view data) override;

  long Lines() const;

 private:
  runtime::LogSink&        inner_;
  std::function<void(int)> report_;
  const int                base_;
  const int                max_;
  const int                estimated_lines_;

  mutable std::mutex mutex_;
  long               lines_ = 0;
};

} // namespace buildq::jobs

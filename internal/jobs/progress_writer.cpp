#include "internal/jobs/progress_writer.hpp"

#include <algorithm>

namespace buildq::jobs {

ProgressWriter::ProgressWriter(runtime::LogSink& inner, std::function<void(int)> report, int base, int max, int estimated_lines)
    : inner_(inner), report_(std::move(report)), base_(base), max_(max), estimated_lines_(estimated_lines) {
}

void ProgressWriter::Write(std::string_view data) {
  inner_.Write(data);

  int progress = -1;
  {
    std::lock_guard lock(mutex_);
    lines_ += std::count(data.begin(), data.end(), '\n');
    if (estimated_lines_ > 0) {
      const long value = base_ + lines_ * (max_ - base_) / estimated_lines_;
      progress         = static_cast<int>(std::min<long>(value, max_));
    }
  }

  if (progress >= 0 && report_) report_(progress);
}

long ProgressWriter::Lines() const {
  std::lock_guard lock(mutex_);
  return lines_;
}

} // namespace buildq::jobs

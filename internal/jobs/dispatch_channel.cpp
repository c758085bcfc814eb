#include "internal/jobs/dispatch_channel.hpp"

#include "internal/util/errors.hpp"

namespace buildq::jobs {

DispatchChannel::DispatchChannel(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw util::InvalidArgument("dispatch channel capacity must be >= 1");
  }
}

bool DispatchChannel::Send(std::string job_id) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || buffer_.size() < capacity_; });
    if (closed_) return false;
    buffer_.push_back(std::move(job_id));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<std::string> DispatchChannel::Receive() {
  std::string job_id;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return closed_ || !buffer_.empty(); });

    // Closing abandons the backlog; Drain hands it to whoever closed us.
    if (closed_) return std::nullopt;

    job_id = std::move(buffer_.front());
    buffer_.pop_front();
  }
  not_full_.notify_one();
  return job_id;
}

void DispatchChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::vector<std::string> DispatchChannel::Drain() {
  std::vector<std::string> out;
  {
    std::lock_guard lock(mutex_);
    out.assign(std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
    buffer_.clear();
  }
  not_full_.notify_all();
  return out;
}

std::size_t DispatchChannel::Size() const {
  std::lock_guard lock(mutex_);
  return buffer_.size();
}

bool DispatchChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

} // namespace buildq::jobs

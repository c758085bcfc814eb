#include "context.hpp"

#include <condition_variable>
#include <mutex>

namespace buildq::util {

namespace {

// now + timeout, clamped to time_point::max() instead of overflowing.
ExecutionContext::SteadyClock::time_point SaturatedDeadline(ExecutionContext::SteadyClock::duration timeout) {
  using SteadyClock = ExecutionContext::SteadyClock;
  const auto now    = SteadyClock::now();
  if (timeout > SteadyClock::time_point::max() - now) return SteadyClock::time_point::max();
  return now + timeout;
}

} // namespace

ExecutionContext::ExecutionContext(std::stop_token parent, SteadyClock::duration timeout)
    : parent_(std::move(parent)), deadline_(SaturatedDeadline(timeout)) {
}

ExecutionContext::ExecutionContext(SteadyClock::duration timeout) : ExecutionContext(std::stop_token{}, timeout) {
}

bool ExecutionContext::Cancelled() const {
  return parent_.stop_requested() || DeadlineExceeded();
}

bool ExecutionContext::DeadlineExceeded() const {
  return SteadyClock::now() >= deadline_;
}

std::string ExecutionContext::Reason() const {
  if (parent_.stop_requested()) {
    return "context canceled";
  }
  if (DeadlineExceeded()) {
    return "context deadline exceeded";
  }
  return {};
}

bool ExecutionContext::WaitFor(SteadyClock::duration duration) const {
  const auto now     = SteadyClock::now();
  const auto wake_at = duration > deadline_ - now ? deadline_ : now + duration;

  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            lock(mutex);
  cv.wait_until(lock, parent_, wake_at, [] { return false; });

  return !Cancelled();
}

} // namespace buildq::util

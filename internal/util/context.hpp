#pragma once

#include <chrono>
#include <stop_token>
#include <string>

namespace buildq::util {

/*
  Bounded-lifetime execution context handed to job handlers.

  Cancelled once the parent stop token is triggered (queue shutdown) or the
  deadline passes. Cancellation is cooperative: nothing interrupts a handler,
  it has to poll Cancelled() or block through WaitFor().
*/
class ExecutionContext {
 public:
  using SteadyClock = std::chrono::steady_clock;

  ExecutionContext(std::stop_token parent, SteadyClock::duration timeout);

  // No parent: only the deadline can cancel it.
  explicit ExecutionContext(SteadyClock::duration timeout);

  bool Cancelled() const;
  bool DeadlineExceeded() const;

  // "context canceled", "context deadline exceeded", or empty while live.
  std::string Reason() const;

  SteadyClock::time_point Deadline() const {
    return deadline_;
  }

  // Sleeps for `duration` unless cancelled first. Returns false when the
  // context was cancelled before the full duration elapsed.
  bool WaitFor(SteadyClock::duration duration) const;

 private:
  std::stop_token         parent_;
  SteadyClock::time_point deadline_;
};

} // namespace buildq::util

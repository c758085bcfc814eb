#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace buildq::jobs {

/*
  Bounded, thread-safe FIFO of job ids between Enqueue and the workers.

  Send blocks while the buffer is full. After Close, Send fails at once and
  Receive keeps returning nothing; ids still buffered stay until Drain.
*/
class DispatchChannel {
 public:
  explicit DispatchChannel(std::size_t capacity);

  // false when the channel is closed (including while blocked on a full buffer)
  bool Send(std::string job_id);

  // blocking wait; nullopt once closed
  std::optional<std::string> Receive();

  void Close();

  // Removes and returns whatever is still buffered.
  std::vector<std::string> Drain();

  std::size_t Size() const;
  bool IsClosed() const;

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::string> buffer_;
  bool                    closed_ = false;
};

} // namespace buildq::jobs

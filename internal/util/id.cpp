#include "id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace buildq::util {

std::string NextJobId() {
  static std::atomic<std::int64_t> last{0};

  const std::int64_t now =
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();

  std::int64_t prev = last.load(std::memory_order_relaxed);
  std::int64_t next = 0;
  do {
    next = now > prev ? now : prev + 1;
  } while (!last.compare_exchange_weak(prev, next, std::memory_order_relaxed));

  return std::to_string(next);
}

} // namespace buildq::util

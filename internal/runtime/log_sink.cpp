#include "internal/runtime/log_sink.hpp"

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace buildq::runtime {

FileLogSink::FileLogSink(std::string path) : path_(std::move(path)) {
  out_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out_) {
    throw util::IoError("open " + path_ + ": " + std::strerror(errno));
  }
}

void FileLogSink::Write(std::string_view data) {
  std::lock_guard lock(mutex_);
  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  out_.flush();
}

} // namespace buildq::runtime

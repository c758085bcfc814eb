#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "internal/runtime/container_runtime.hpp"

namespace buildq::runtime {

// Appends build output to a file, flushing after every write.
class FileLogSink final : public LogSink {
 public:
  // Truncates an existing file. Throws util::IoError when it cannot be opened.
  explicit FileLogSink(std::string path);

  void Write(std::string_view data) override;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string   path_;
  std::ofstream out_;
  std::mutex    mutex_;
};

} // namespace buildq::runtime

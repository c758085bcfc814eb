#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/context.hpp"

namespace buildq::runtime {

/*
  Byte sink for build output. Write may be called from the thread running
  the build only; implementations decide whether they need locking.
*/
class LogSink {
 public:
  virtual ~LogSink()                        = default;
  virtual void Write(std::string_view data) = 0;
};

struct BuildSpec {
  std::string git_url;
  std::string git_ref;
  std::string context_path = ".";
  std::string dockerfile   = "Dockerfile";
  std::string image_tag;

  // Not owned. Null discards build output.
  LogSink* log = nullptr;
};

struct BuildResult {
  std::string              image_tag;
  std::string              image_id;
  bool                     success = false;
  std::string              error;
  std::chrono::nanoseconds duration{0};
};

/*
  Container engine client.

  BuildImage reports an unsuccessful build through BuildResult; all three
  calls throw util::ExternalError when the engine itself cannot be driven.
  Every call must give up once the context is cancelled.
*/
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  virtual BuildResult BuildImage(const util::ExecutionContext& ctx, const BuildSpec& spec) = 0;

  virtual bool ImageExists(const util::ExecutionContext& ctx, const std::string& image_tag) = 0;

  virtual void PullImage(const util::ExecutionContext& ctx, const std::string& image_tag) = 0;
};

} // namespace buildq::runtime

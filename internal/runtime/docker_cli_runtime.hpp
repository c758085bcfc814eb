#pragma once

#include <string>
#include <vector>

#include "internal/runtime/container_runtime.hpp"

namespace buildq::runtime {

struct DockerCliOptions {
  std::string docker_binary = "docker";
  std::string git_binary    = "git";
  std::string platform      = "linux/amd64";
  // Parent directory for per-build checkouts; empty uses the system temp dir.
  std::string work_dir;
};

/*
  ContainerRuntime driven through the docker and git command line tools.

  BuildImage clones the repository into a scratch directory, runs
  `docker buildx build` against it and removes the checkout afterwards.
*/
class DockerCliRuntime final : public ContainerRuntime {
 public:
  explicit DockerCliRuntime(DockerCliOptions options);

  BuildResult BuildImage(const util::ExecutionContext& ctx, const BuildSpec& spec) override;

  bool ImageExists(const util::ExecutionContext& ctx, const std::string& image_tag) override;

  void PullImage(const util::ExecutionContext& ctx, const std::string& image_tag) override;

  // Exposed for tests and for logging the exact command.
  std::vector<std::string> BuildCommand(const std::string& checkout_dir, const BuildSpec& spec) const;

 private:
  // Returns an empty string on success, otherwise the failure text.
  std::string Clone(const util::ExecutionContext& ctx, const BuildSpec& spec, const std::string& dir);

  std::string ImageId(const util::ExecutionContext& ctx, const std::string& image_tag);

  DockerCliOptions options_;
};

} // namespace buildq::runtime

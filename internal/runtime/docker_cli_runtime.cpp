#include "internal/runtime/docker_cli_runtime.hpp"

#include <cstdlib>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/runtime/subprocess.hpp"
#include "internal/util/errors.hpp"

namespace buildq::runtime {

namespace fs = std::filesystem;

namespace {

std::string Trim(std::string s) {
  const auto end = s.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) return {};
  s.erase(end + 1);
  const auto begin = s.find_first_not_of(" \t\r\n");
  return s.substr(begin);
}

std::string Describe(const ProcessResult& r) {
  if (r.cancelled) return "cancelled";
  if (r.signaled) return "killed by signal " + std::to_string(r.term_signal);
  return "exit status " + std::to_string(r.exit_code);
}

// Removes the checkout when the build returns, whichever way it returns.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& parent) {
    fs::path base = parent.empty() ? fs::temp_directory_path() : fs::path(parent);
    std::error_code ec;
    fs::create_directories(base, ec);

    std::string templ = (base / "buildq-build-XXXXXX").string();
    if (mkdtemp(templ.data()) == nullptr) {
      throw util::IoError("failed to create temp directory under " + base.string());
    }
    path_ = templ;
  }

  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      BUILDQ_LOG_WARN("failed to remove build checkout",
                      {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
    }
  }

  ScratchDir(const ScratchDir&)            = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const fs::path& Path() const {
    return path_;
  }

 private:
  fs::path path_;
};

void Note(LogSink* log, const std::string& line) {
  if (log) log->Write(line + "\n");
}

} // namespace

DockerCliRuntime::DockerCliRuntime(DockerCliOptions options) : options_(std::move(options)) {
}

std::vector<std::string> DockerCliRuntime::BuildCommand(const std::string& checkout_dir, const BuildSpec& spec) const {
  const fs::path context    = fs::path(checkout_dir) / spec.context_path;
  const fs::path dockerfile = context / spec.dockerfile;

  return {options_.docker_binary, "buildx", "build", "--platform", options_.platform, "-t", spec.image_tag, "-f", dockerfile.lexically_normal().string(),
          context.lexically_normal().string()};
}

std::string DockerCliRuntime::Clone(const util::ExecutionContext& ctx, const BuildSpec& spec, const std::string& dir) {
  auto shallow = RunProcess(ctx, {options_.git_binary, "clone", "--depth=1", "-b", spec.git_ref, spec.git_url, dir}, spec.log);
  if (shallow.Ok()) return {};
  if (shallow.cancelled) return "failed to clone repository: " + ctx.Reason();

  // Refs that are commits cannot be cloned with -b; fall back to a full clone.
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);

  auto full = RunProcess(ctx, {options_.git_binary, "clone", spec.git_url, dir}, spec.log);
  if (!full.Ok()) {
    return "failed to clone repository: git clone " + Describe(full);
  }

  auto checkout = RunProcess(ctx, {options_.git_binary, "-C", dir, "checkout", spec.git_ref}, spec.log);
  if (!checkout.Ok()) {
    return "failed to checkout ref " + spec.git_ref + ": " + Describe(checkout);
  }
  return {};
}

BuildResult DockerCliRuntime::BuildImage(const util::ExecutionContext& ctx, const BuildSpec& spec) {
  const auto  start = std::chrono::steady_clock::now();
  BuildResult result;
  result.image_tag = spec.image_tag;

  auto finish = [&](std::string error) {
    result.error    = std::move(error);
    result.success  = result.error.empty();
    result.duration = std::chrono::steady_clock::now() - start;
    return result;
  };

  ScratchDir checkout(options_.work_dir);
  const auto dir = checkout.Path().string();

  Note(spec.log, "==> cloning " + spec.git_url + " (" + spec.git_ref + ")");
  if (auto err = Clone(ctx, spec, dir); !err.empty()) {
    Note(spec.log, "==> " + err);
    return finish(std::move(err));
  }

  auto argv = BuildCommand(dir, spec);
  Note(spec.log, "==> building " + spec.image_tag + " for " + options_.platform);

  auto build = RunProcess(ctx, argv, spec.log);
  if (build.cancelled) {
    return finish("docker build failed: " + ctx.Reason());
  }
  if (!build.Ok()) {
    Note(spec.log, "==> build failed: " + Describe(build));
    return finish("docker build failed: " + Describe(build));
  }

  try {
    result.image_id = ImageId(ctx, spec.image_tag);
  } catch (const util::ExternalError& e) {
    BUILDQ_LOG_WARN("failed to get image ID", {observability::StringField("tag", spec.image_tag), observability::StringField("error", e.what())});
  }

  Note(spec.log, "==> built " + spec.image_tag);
  return finish({});
}

std::string DockerCliRuntime::ImageId(const util::ExecutionContext& ctx, const std::string& image_tag) {
  ProcessResult r;
  auto          out = CaptureProcess(ctx, {options_.docker_binary, "image", "inspect", "--format={{.Id}}", image_tag}, r);
  if (!r.Ok()) {
    throw util::ExternalError("failed to get image ID: " + Describe(r));
  }
  return Trim(out);
}

bool DockerCliRuntime::ImageExists(const util::ExecutionContext& ctx, const std::string& image_tag) {
  ProcessResult r;
  auto          out = CaptureProcess(ctx, {options_.docker_binary, "image", "inspect", image_tag}, r);
  if (r.Ok()) return true;
  // docker exits 1 for "No such image".
  if (!r.cancelled && !r.signaled && r.exit_code == 1) return false;
  if (r.cancelled) throw util::ExternalError(ctx.Reason());
  throw util::ExternalError(Describe(r) + ": " + Trim(out));
}

void DockerCliRuntime::PullImage(const util::ExecutionContext& ctx, const std::string& image_tag) {
  ProcessResult r;
  auto          out = CaptureProcess(ctx, {options_.docker_binary, "pull", image_tag}, r);
  if (r.Ok()) return;
  if (r.cancelled) throw util::ExternalError(ctx.Reason());
  throw util::ExternalError(Describe(r) + "\nOutput: " + Trim(out));
}

} // namespace buildq::runtime

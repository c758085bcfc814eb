#include "internal/runtime/docker_cli_runtime.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "internal/runtime/subprocess.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using buildq::runtime::BuildSpec;
using buildq::runtime::DockerCliOptions;
using buildq::runtime::DockerCliRuntime;
using buildq::testing::StringLogSink;
using buildq::testing::TempDir;
using buildq::util::ExecutionContext;
using namespace std::chrono_literals;

// Stand-in for git: shallow clones of "deadbeef" fail so the full-clone
// fallback runs.
constexpr const char* kFakeGit = R"(#!/bin/sh
for a; do last=$a; done
case "$1" in
  clone)
    if [ "$2" = "--depth=1" ] && [ "$4" = "deadbeef" ]; then
      echo "fatal: Remote branch deadbeef not found" >&2
      exit 128
    fi
    mkdir -p "$last" && echo "FROM scratch" > "$last/Dockerfile"
    echo "Cloning into '$last'..."
    ;;
  -C)
    echo "HEAD is now at $last"
    ;;
esac
exit 0
)";

// Stand-in for docker. Behaviour keys off the image tag.
constexpr const char* kFakeDocker = R"(#!/bin/sh
for a; do last=$a; done
case "$1 $2" in
  "image inspect")
    case "$3" in
      --format=*) echo "sha256:0123abcd"; exit 0 ;;
    esac
    case "$last" in
      present:*) echo "[{}]"; exit 0 ;;
      broken:*) echo "Cannot connect to the Docker daemon" >&2; exit 2 ;;
      *) echo "Error: No such image: $last" >&2; exit 1 ;;
    esac
    ;;
  "pull "*)
    case "$last" in
      bad:*) echo "manifest unknown"; exit 1 ;;
    esac
    echo "Status: Downloaded newer image for $last"
    exit 0
    ;;
  "buildx build")
    tag=""
    prev=""
    for a; do
      if [ "$prev" = "-t" ]; then tag=$a; fi
      prev=$a
    done
    [ -f "$last/Dockerfile" ] || { echo "no Dockerfile in $last"; exit 4; }
    echo "#1 [internal] load build definition"
    echo "#2 DONE"
    case "$tag" in
      *fail*) echo "ERROR: failed to solve"; exit 3 ;;
      *slow*) sleep 10 ;;
    esac
    exit 0
    ;;
esac
exit 0
)";

fs::path WriteScript(const fs::path& dir, const std::string& name, const char* body) {
  const auto    path = dir / name;
  std::ofstream out(path);
  out << body;
  out.close();
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec, fs::perm_options::replace);
  return path;
}

struct Fixture {
  fs::path         root;
  fs::path         work_dir;
  DockerCliOptions options;

  explicit Fixture(const std::string& name) : root(TempDir(name)), work_dir(root / "work") {
    options.docker_binary = WriteScript(root, "docker", kFakeDocker).string();
    options.git_binary    = WriteScript(root, "git", kFakeGit).string();
    options.platform      = "linux/amd64";
    options.work_dir      = work_dir.string();
  }

  bool WorkDirEmpty() const {
    return !fs::exists(work_dir) || fs::is_empty(work_dir);
  }
};

BuildSpec Spec(const std::string& tag, const std::string& ref, buildq::runtime::LogSink* log) {
  BuildSpec spec;
  spec.git_url   = "https://example.com/app.git";
  spec.git_ref   = ref;
  spec.image_tag = tag;
  spec.log       = log;
  return spec;
}

void TestBuildCommandShape() {
  DockerCliOptions options;
  options.platform = "linux/arm64";
  DockerCliRuntime runtime(options);

  BuildSpec spec;
  spec.image_tag    = "web:main-1";
  spec.context_path = "services/web";
  spec.dockerfile   = "Dockerfile.prod";

  auto argv = runtime.BuildCommand("/tmp/checkout", spec);
  assert((argv == std::vector<std::string>{"docker", "buildx", "build", "--platform", "linux/arm64", "-t", "web:main-1", "-f",
                                            "/tmp/checkout/services/web/Dockerfile.prod", "/tmp/checkout/services/web"}));

  spec.context_path = ".";
  spec.dockerfile   = "Dockerfile";
  argv              = runtime.BuildCommand("/tmp/checkout", spec);
  assert(argv[8] == "/tmp/checkout/Dockerfile");
  assert(argv[9] == "/tmp/checkout/");
}

void TestBuildSuccess() {
  Fixture          fx("docker_build_ok");
  DockerCliRuntime runtime(fx.options);
  StringLogSink    log;
  ExecutionContext ctx(30s);

  auto result = runtime.BuildImage(ctx, Spec("app:main-1", "main", &log));
  assert(result.success);
  assert(result.error.empty());
  assert(result.image_tag == "app:main-1");
  assert(result.image_id == "sha256:0123abcd");
  assert(result.duration.count() > 0);

  const auto text = log.Text();
  assert(text.find("Cloning into") != std::string::npos);
  assert(text.find("#2 DONE") != std::string::npos);
  assert(text.find("==> built app:main-1") != std::string::npos);
  assert(fx.WorkDirEmpty());
}

void TestBuildFallsBackToFullClone() {
  Fixture          fx("docker_build_commit_ref");
  DockerCliRuntime runtime(fx.options);
  StringLogSink    log;
  ExecutionContext ctx(30s);

  auto result = runtime.BuildImage(ctx, Spec("app:deadbeef-1", "deadbeef", &log));
  assert(result.success);
  assert(log.Text().find("Remote branch deadbeef not found") != std::string::npos);
  assert(log.Text().find("HEAD is now at deadbeef") != std::string::npos);
}

void TestBuildFailureReportsExitStatus() {
  Fixture          fx("docker_build_fail");
  DockerCliRuntime runtime(fx.options);
  StringLogSink    log;
  ExecutionContext ctx(30s);

  auto result = runtime.BuildImage(ctx, Spec("app:fail-1", "main", &log));
  assert(!result.success);
  assert(result.error == "docker build failed: exit status 3");
  assert(result.image_id.empty());
  assert(log.Text().find("ERROR: failed to solve") != std::string::npos);
  assert(fx.WorkDirEmpty());
}

void TestMissingGitFailsClone() {
  Fixture fx("docker_build_no_git");
  fx.options.git_binary = (fx.root / "no-such-git").string();
  DockerCliRuntime runtime(fx.options);
  ExecutionContext ctx(30s);

  auto result = runtime.BuildImage(ctx, Spec("app:main-1", "main", nullptr));
  assert(!result.success);
  assert(result.error == "failed to clone repository: git clone exit status 127");
}

void TestBuildHonoursDeadline() {
  Fixture          fx("docker_build_deadline");
  DockerCliRuntime runtime(fx.options);
  ExecutionContext ctx(1s);

  const auto start  = std::chrono::steady_clock::now();
  auto       result = runtime.BuildImage(ctx, Spec("app:slow-1", "main", nullptr));
  const auto took   = std::chrono::steady_clock::now() - start;

  assert(!result.success);
  assert(result.error == "docker build failed: context deadline exceeded");
  assert(took < 8s);
}

void TestImageExists() {
  Fixture          fx("docker_image_exists");
  DockerCliRuntime runtime(fx.options);
  ExecutionContext ctx(30s);

  assert(runtime.ImageExists(ctx, "present:v1"));
  assert(!runtime.ImageExists(ctx, "absent:v1"));

  std::string error;
  try {
    runtime.ImageExists(ctx, "broken:v1");
  } catch (const buildq::util::ExternalError& e) {
    error = e.what();
  }
  assert(error.find("exit status 2") != std::string::npos);
  assert(error.find("Cannot connect to the Docker daemon") != std::string::npos);
}

void TestPullImage() {
  Fixture          fx("docker_pull");
  DockerCliRuntime runtime(fx.options);
  ExecutionContext ctx(30s);

  runtime.PullImage(ctx, "good:v1");

  std::string error;
  try {
    runtime.PullImage(ctx, "bad:v1");
  } catch (const buildq::util::ExternalError& e) {
    error = e.what();
  }
  assert(error == "exit status 1\nOutput: manifest unknown");
}

void TestRunProcessCapturesOutput() {
  ExecutionContext ctx(30s);
  StringLogSink    out;

  auto r = buildq::runtime::RunProcess(ctx, {"sh", "-c", "echo out; echo err >&2; exit 4"}, &out);
  assert(!r.Ok());
  assert(r.exit_code == 4);
  assert(!r.signaled && !r.cancelled);
  assert(out.Text().find("out\n") != std::string::npos);
  assert(out.Text().find("err\n") != std::string::npos);

  buildq::runtime::ProcessResult captured;
  auto text = buildq::runtime::CaptureProcess(ctx, {"sh", "-c", "pwd"}, captured);
  assert(captured.Ok());
  assert(!text.empty());
}

void TestRunProcessStopsOnCancel() {
  std::stop_source stop;
  ExecutionContext ctx(stop.get_token(), 30s);

  std::thread canceller([&] {
    std::this_thread::sleep_for(100ms);
    stop.request_stop();
  });

  const auto start = std::chrono::steady_clock::now();
  auto       r     = buildq::runtime::RunProcess(ctx, {"sleep", "10"}, nullptr);
  canceller.join();

  assert(r.cancelled);
  assert(!r.Ok());
  assert(std::chrono::steady_clock::now() - start < 5s);
}

} // namespace

int main() {
  TestBuildCommandShape();
  TestBuildSuccess();
  TestBuildFallsBackToFullClone();
  TestBuildFailureReportsExitStatus();
  TestMissingGitFailsClone();
  TestBuildHonoursDeadline();
  TestImageExists();
  TestPullImage();
  TestRunProcessCapturesOutput();
  TestRunProcessStopsOnCancel();

  std::cout << "buildq_unit_docker_cli_runtime: pass\n";
  return 0;
}

#include "internal/runtime/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

#include "internal/util/errors.hpp"

namespace buildq::runtime {

namespace {

constexpr int  kPollIntervalMs = 50;
constexpr auto kReapInterval   = std::chrono::milliseconds(20);

class Pipe {
 public:
  Pipe() {
    if (pipe2(fd_, O_CLOEXEC) != 0) {
      throw util::ExternalError(std::string("pipe: ") + std::strerror(errno));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReadEnd() const {
    return fd_[0];
  }
  int WriteEnd() const {
    return fd_[1];
  }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);
      fd_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);
      fd_[1] = -1;
    }
  }
  int ReleaseRead() {
    int r  = fd_[0];
    fd_[0] = -1;
    return r;
  }

 private:
  int fd_[2] = {-1, -1};
};

void FillResult(int status, ProcessResult& result) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled    = true;
    result.term_signal = WTERMSIG(status);
  }
}

class StringSink final : public LogSink {
 public:
  void Write(std::string_view data) override {
    text.append(data);
  }
  std::string text;
};

} // namespace

Subprocess::~Subprocess() {
  if (out_fd_ >= 0) close(out_fd_);
  Kill();
}

void Subprocess::Start(const std::vector<std::string>& argv, const std::string& working_dir) {
  if (argv.empty() || argv.front().empty()) {
    throw util::InvalidArgument("subprocess: empty argv");
  }
  if (pid_ > 0) {
    throw util::InvalidState("subprocess: already started");
  }

  // Everything the child touches is prepared before fork.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    args.push_back(const_cast<char*>(a.c_str()));
  }
  args.push_back(nullptr);
  const char* dir = working_dir.empty() ? nullptr : working_dir.c_str();

  Pipe  out;
  pid_t child = fork();
  if (child < 0) {
    throw util::ExternalError(std::string("fork: ") + std::strerror(errno));
  }

  if (child == 0) {
    setsid();

    struct sigaction sa_dfl;
    std::memset(&sa_dfl, 0, sizeof(sa_dfl));
    sa_dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < 32; ++sig) {
      sigaction(sig, &sa_dfl, nullptr);
    }
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    if (dir && chdir(dir) != 0) _exit(127);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(out.WriteEnd(), STDOUT_FILENO);
    dup2(out.WriteEnd(), STDERR_FILENO);

    execvp(args[0], args.data());
    _exit(127);
  }

  pid_ = child;
  out.CloseWrite();
  out_fd_ = out.ReleaseRead();
}

ProcessResult Subprocess::Wait(const util::ExecutionContext& ctx, LogSink* output) {
  ProcessResult result;
  if (pid_ <= 0) {
    throw util::InvalidState("subprocess: not started");
  }

  char buf[4096];
  while (out_fd_ >= 0) {
    if (ctx.Cancelled()) {
      Kill();
      result.cancelled = true;
      close(out_fd_);
      out_fd_ = -1;
      return result;
    }

    pollfd pfd{out_fd_, POLLIN, 0};
    int    rc = poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    ssize_t n = read(out_fd_, buf, sizeof(buf));
    if (n > 0) {
      if (output) output->Write(std::string_view(buf, static_cast<size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;

    // EOF or read error: the child closed its side.
    close(out_fd_);
    out_fd_ = -1;
  }

  // The child may outlive its stdout; keep honouring cancellation while reaping.
  for (;;) {
    int   status = 0;
    pid_t w      = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
      pid_ = -1;
      FillResult(status, result);
      return result;
    }
    if (w < 0 && errno != EINTR) {
      pid_ = -1;
      throw util::ExternalError(std::string("waitpid: ") + std::strerror(errno));
    }
    if (!ctx.WaitFor(kReapInterval)) {
      Kill();
      result.cancelled = true;
      return result;
    }
  }
}

void Subprocess::Kill() {
  if (pid_ <= 0) return;
  // Negative pid: the whole session group started by setsid().
  kill(-pid_, SIGKILL);
  kill(pid_, SIGKILL);
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

ProcessResult RunProcess(const util::ExecutionContext& ctx, const std::vector<std::string>& argv, LogSink* output,
                         const std::string& working_dir) {
  Subprocess process;
  process.Start(argv, working_dir);
  return process.Wait(ctx, output);
}

std::string CaptureProcess(const util::ExecutionContext& ctx, const std::vector<std::string>& argv, ProcessResult& result) {
  StringSink sink;
  result = RunProcess(ctx, argv, &sink);
  return std::move(sink.text);
}

} // namespace buildq::runtime

#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <kj/debug.h>
#include <kj/exception.h>

#include "sandbox/resource_limits.hpp"
#include "sandbox/signal.hpp"
#include "sandbox/wait.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

ExecutionInfo Unix::Execute(const ExecutionOptions& options) {
  options_ = &options;
  Setup();
  DoFork();
  return Wait();
}

void Unix::Setup() {
  KJ_REQUIRE(!options_->executable.empty(), "No executable given");
  KJ_REQUIRE(options_->wall_limit_millis <= kMaxWallLimitMillis,
             "Wall time limit too large", options_->wall_limit_millis);
  args_.clear();
  auto add_arg = [this](const std::string& s) {
    std::vector<char> arg(s.size() + 1);
    std::copy(s.begin(), s.end(), arg.begin());
    arg.back() = '\0';
    args_.push_back(std::move(arg));
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  argv_.assign(args_.size() + 1, nullptr);
  for (size_t i = 0; i < args_.size(); i++) argv_[i] = args_[i].data();

  KJ_SYSCALL(pipe(pipe_fds_));  // NOLINT
  KJ_ON_SCOPE_FAILURE({
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
  });
  KJ_SYSCALL(fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC));
  KJ_SYSCALL(fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC));
}

void Unix::DoFork() {
  int fork_result = fork();
  if (fork_result == -1) {
    int error = errno;
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    KJ_FAIL_SYSCALL("fork", error, options_->executable.c_str());
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    KJ_LOG(INFO, "Started child", child_pid_, options_->executable.c_str());
    return;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    // Nothing sensible can be done if the parent is not listening.
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd == -1) die("open", errno);
  }
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  kj::Maybe<kj::Exception> limits_error = kj::runCatchingExceptions(
      [this]() { SetupResourceLimits(options_->limits); });
  KJ_IF_MAYBE(exception, limits_error) {
    die2("setrlimit", exception->getDescription().cStr());
  }

  execv(argv_[0], argv_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

ExecutionInfo Unix::Wait() {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= static_cast<ssize_t>(sizeof(error))) {
      error_len = sizeof(error) - 1;
    }
    ssize_t num_read = read(pipe_fds_[0], error, error_len);
    close(pipe_fds_[0]);
    // The child exits right after reporting, reap it.
    sandbox::Wait(child_pid_);
    KJ_REQUIRE(num_read >= 0, "Child failed without a reason");
    std::string message(error, num_read);
    KJ_FAIL_REQUIRE("Failed to start the child", message.c_str());
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::high_resolution_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::high_resolution_clock::now() - program_start)
        .count();
  };

  // Wait() has no timeout: the wall time limit is enforced by killing the
  // child from another thread. The child is only reaped after the watchdog is
  // stopped, so the pid it kills cannot have been reused.
  std::mutex watchdog_mutex;
  std::condition_variable watchdog_cv;
  bool done = false;
  bool wall_limit_exceeded = false;
  std::thread watchdog;
  if (options_->wall_limit_millis != 0) {
    watchdog = std::thread([&]() {
      std::unique_lock<std::mutex> lck(watchdog_mutex);
      if (watchdog_cv.wait_for(
              lck, std::chrono::milliseconds(options_->wall_limit_millis),
              [&done]() { return done; })) {
        return;
      }
      KJ_LOG(INFO, "Wall time limit exceeded, killing child", child_pid_);
      wall_limit_exceeded = true;
      if (kill(child_pid_, SIGKILL) == -1) {
        KJ_LOG(ERROR, "Failed to kill child", child_pid_, errno);
      }
    });
  }
  auto stop_watchdog = [&]() {
    if (!watchdog.joinable()) return;
    {
      std::lock_guard<std::mutex> lck(watchdog_mutex);
      done = true;
    }
    watchdog_cv.notify_all();
    watchdog.join();
  };
  KJ_DEFER(stop_watchdog());

  // Wait for termination without reaping the child.
  siginfo_t siginfo;
  memset(&siginfo, 0, sizeof(siginfo));
  KJ_SYSCALL(waitid(P_PID, child_pid_, &siginfo, WEXITED | WNOWAIT),
             child_pid_);
  double wall_time = elapsed_millis() / 1000.0;
  stop_watchdog();

  ExecutionInfo info(sandbox::Wait(child_pid_));
  info.usage.wall_time_usage = wall_time;
  if (info.status.Signaled()) {
    int signal = info.status.GetSignal();
    // If the child received a KILL or XCPU signal, assume we killed it
    // because of memory or time limits.
    info.killed = signal == SIGKILL || signal == SIGXCPU;
    if (wall_limit_exceeded && signal == SIGKILL) {
      info.message = "Wall time limit exceeded";
    } else {
      kj::Maybe<std::string> description = StrSignal(signal);
      KJ_IF_MAYBE(d, description) {
        info.message = *d;
      } else {
        info.message = "Killed by signal " + std::to_string(signal);
      }
    }
  } else if (info.status.GetExitCode() != 0) {
    info.message = "Non-zero return code";
  }
  KJ_LOG(INFO, "Child terminated", child_pid_, info.status.ToString().c_str(),
         info.usage.ToString().c_str());
  return info;
}

}  // namespace sandbox

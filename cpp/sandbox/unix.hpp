#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/configuration.hpp"
#include "sandbox/result.hpp"

namespace sandbox {

// Longest wall time limit accepted, one year.
static const constexpr uint64_t kMaxWallLimitMillis =
    365ULL * 24 * 60 * 60 * 1000;

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Required values
  std::string executable;

  // Optional values
  std::vector<std::string> args;
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  SandboxConfiguration limits;
  // 0 means no wall time limit.
  uint64_t wall_limit_millis = 0;

  explicit ExecutionOptions(std::string executable_)
      : executable(std::move(executable_)) {}
  void SetArgs(std::vector<std::string> a_) { args = std::move(a_); }
};

// Results of the execution.
struct ExecutionInfo {
  ExitStatus status;
  ResourceUsage usage;
  // True if the process was killed by a signal that is sent when a limit is
  // exceeded.
  bool killed = false;
  std::string message;

  explicit ExecutionInfo(const WaitResult& result)
      : status(result.status), usage(result.usage) {}
};

// Runs a program in a forked child with resource limits applied. Failures to
// start the program (fork, redirection, limits, exec) and to wait for it are
// reported by throwing. Not thread safe.
class Unix {
 public:
  Unix() = default;
  Unix(const Unix&) = delete;
  Unix& operator=(const Unix&) = delete;

  ExecutionInfo Execute(const ExecutionOptions& options);

 private:
  void Setup();
  void DoFork();
  [[noreturn]] void Child();
  ExecutionInfo Wait();

  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> args_;
  std::vector<char*> argv_;
  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
};

}  // namespace sandbox

#endif

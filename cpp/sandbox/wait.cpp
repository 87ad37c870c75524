#include "sandbox/wait.hpp"

#include <sys/time.h>
#include <sys/wait.h>
#include <cerrno>

#include <kj/debug.h>

namespace sandbox {

namespace {
// Unit of ru_maxrss, in bytes.
#ifdef __APPLE__
static const constexpr uint64_t kMaxRssUnit = 1;
#else
static const constexpr uint64_t kMaxRssUnit = 1024;
#endif

double ToSeconds(const struct timeval& tv) {
  return tv.tv_sec + tv.tv_usec / 1000000.0;
}
}  // namespace

WaitResult Wait(pid_t pid) {
  int status = 0;
  struct rusage rusage {};
  pid_t ret = wait4(pid, &status, 0, &rusage);
  if (ret == -1) {
    KJ_FAIL_SYSCALL("wait4", errno, pid);
  }
  KJ_REQUIRE(ret == pid, "Error waiting for child completion", ret, pid);
  return WaitResult{ClassifyWaitStatus(status),
                    ResourceUsageFromRusage(rusage)};
}

ExitStatus ClassifyWaitStatus(int raw_status) {
  if (WIFEXITED(raw_status)) {
    return ExitStatus::ExitCode(WEXITSTATUS(raw_status));
  }
  if (WIFSIGNALED(raw_status)) {
    return ExitStatus::Signal(WTERMSIG(raw_status));
  }
  KJ_FAIL_REQUIRE("Child terminated with unknown status", raw_status);
}

ResourceUsage ResourceUsageFromRusage(const struct rusage& rusage) {
  ResourceUsage usage;
  usage.memory_usage = static_cast<uint64_t>(rusage.ru_maxrss) * kMaxRssUnit;
  usage.user_cpu_time = ToSeconds(rusage.ru_utime);
  usage.system_cpu_time = ToSeconds(rusage.ru_stime);
  usage.wall_time_usage = 0;
  return usage;
}

}  // namespace sandbox

#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <vector>
#include <kj/exception.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/signal.hpp"
#include "sandbox/wait.hpp"

namespace {

using namespace sandbox;  // NOLINT

pid_t ForkExit(int code) {
  pid_t pid = fork();
  if (pid == 0) _Exit(code);
  return pid;
}

// NOLINTNEXTLINE
TEST(WaitTest, TestExitCode) {
  for (int code : {0, 1, 42, 255}) {
    pid_t pid = ForkExit(code);
    ASSERT_GT(pid, 0);
    WaitResult result = Wait(pid);
    EXPECT_EQ(result.status, ExitStatus::ExitCode(code));
    EXPECT_GE(result.usage.user_cpu_time, 0);
    EXPECT_GE(result.usage.system_cpu_time, 0);
    EXPECT_EQ(result.usage.wall_time_usage, 0.0);
  }
}

// NOLINTNEXTLINE
TEST(WaitTest, TestKilledBySignal) {
  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    while (true) pause();
  }
  ASSERT_EQ(kill(pid, SIGTERM), 0);
  WaitResult result = Wait(pid);
  ASSERT_TRUE(result.status.Signaled());
  EXPECT_EQ(result.status.GetSignal(), SIGTERM);
  EXPECT_EQ(result.usage.wall_time_usage, 0.0);
#ifdef SANDBOX_HAVE_STRSIGNAL
  kj::Maybe<std::string> name = StrSignal(result.status.GetSignal());
  KJ_IF_MAYBE(n, name) {
    EXPECT_FALSE(n->empty());
  } else {
    ADD_FAILURE() << "No description for SIGTERM";
  }
#endif
}

// NOLINTNEXTLINE
TEST(WaitTest, TestRaisedSignal) {
  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    signal(SIGUSR1, SIG_DFL);
    raise(SIGUSR1);
    _Exit(0);
  }
  EXPECT_EQ(Wait(pid).status, ExitStatus::Signal(SIGUSR1));
}

// NOLINTNEXTLINE
TEST(WaitTest, TestCpuTime) {
  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    std::clock_t start = std::clock();
    volatile uint64_t counter = 0;
    while (std::clock() - start < CLOCKS_PER_SEC / 2) counter = counter + 1;
    _Exit(0);
  }
  WaitResult result = Wait(pid);
  EXPECT_EQ(result.status, ExitStatus::ExitCode(0));
  EXPECT_GE(result.usage.user_cpu_time + result.usage.system_cpu_time, 0.4);
  EXPECT_LE(result.usage.user_cpu_time + result.usage.system_cpu_time, 2.0);
}

// NOLINTNEXTLINE
TEST(WaitTest, TestMemoryUsage) {
  const size_t size = 64 * 1024 * 1024;
  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    std::vector<char> data(size, 1);
    _Exit(data[size / 2] == 1 ? 0 : 1);
  }
  WaitResult result = Wait(pid);
  EXPECT_EQ(result.status, ExitStatus::ExitCode(0));
  EXPECT_GE(result.usage.memory_usage, size);
}

// NOLINTNEXTLINE
TEST(WaitTest, TestNotAChild) {
  EXPECT_THROW(Wait(getpid()), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(WaitTest, TestAlreadyReaped) {
  pid_t pid = ForkExit(0);
  ASSERT_GT(pid, 0);
  Wait(pid);
  EXPECT_THROW(Wait(pid), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(WaitTest, TestClassifyWaitStatus) {
  EXPECT_EQ(ClassifyWaitStatus(W_EXITCODE(3, 0)), ExitStatus::ExitCode(3));
  EXPECT_EQ(ClassifyWaitStatus(W_EXITCODE(0, 0)), ExitStatus::ExitCode(0));
  EXPECT_EQ(ClassifyWaitStatus(W_EXITCODE(0, SIGSEGV)),
            ExitStatus::Signal(SIGSEGV));
  EXPECT_THROW(ClassifyWaitStatus(W_STOPCODE(SIGSTOP)),  // NOLINT
               kj::Exception);
  EXPECT_THROW(ClassifyWaitStatus(0xffff), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(WaitTest, TestResourceUsageFromRusage) {
  struct rusage rusage {};
  rusage.ru_maxrss = 2048;
  rusage.ru_utime.tv_sec = 1;
  rusage.ru_utime.tv_usec = 500000;
  rusage.ru_stime.tv_sec = 0;
  rusage.ru_stime.tv_usec = 250000;
  ResourceUsage usage = ResourceUsageFromRusage(rusage);
#ifdef __APPLE__
  EXPECT_EQ(usage.memory_usage, 2048u);
#else
  EXPECT_EQ(usage.memory_usage, 2048u * 1024);
#endif
  EXPECT_DOUBLE_EQ(usage.user_cpu_time, 1.5);
  EXPECT_DOUBLE_EQ(usage.system_cpu_time, 0.25);
  EXPECT_EQ(usage.wall_time_usage, 0.0);
}

}  // namespace

#include "sandbox/result.hpp"

#include <cinttypes>
#include <cstdio>

#include <kj/debug.h>

namespace sandbox {

int ExitStatus::GetExitCode() const {
  KJ_REQUIRE(kind_ == Kind::EXIT_CODE, "Process was killed by a signal",
             value_);
  return value_;
}

int ExitStatus::GetSignal() const {
  KJ_REQUIRE(kind_ == Kind::SIGNAL, "Process exited normally", value_);
  return value_;
}

std::string ExitStatus::ToString() const {
  if (Exited()) return "exited with code " + std::to_string(value_);
  return "killed by signal " + std::to_string(value_);
}

std::string ResourceUsage::ToString() const {
  char buf[256] = {};
  snprintf(buf, sizeof(buf),  // NOLINT
           "user %.3fs, sys %.3fs, wall %.3fs, memory %" PRIu64 " KiB",
           user_cpu_time, system_cpu_time, wall_time_usage,
           memory_usage / 1024);
  return buf;
}

}  // namespace sandbox

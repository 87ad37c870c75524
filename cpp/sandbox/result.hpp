#ifndef SANDBOX_RESULT_HPP
#define SANDBOX_RESULT_HPP

#include <cstdint>
#include <string>

namespace sandbox {

// How a process terminated: either it exited with a code, or it was killed by
// a signal.
class ExitStatus {
 public:
  enum class Kind { EXIT_CODE, SIGNAL };

  static ExitStatus ExitCode(int code) {
    return ExitStatus(Kind::EXIT_CODE, code);
  }
  static ExitStatus Signal(int signal) {
    return ExitStatus(Kind::SIGNAL, signal);
  }

  Kind GetKind() const { return kind_; }
  bool Exited() const { return kind_ == Kind::EXIT_CODE; }
  bool Signaled() const { return kind_ == Kind::SIGNAL; }

  // Both require the status to be of the matching kind.
  int GetExitCode() const;
  int GetSignal() const;

  std::string ToString() const;

  bool operator==(const ExitStatus& other) const {
    return kind_ == other.kind_ && value_ == other.value_;
  }
  bool operator!=(const ExitStatus& other) const { return !(*this == other); }

 private:
  ExitStatus(Kind kind, int value) : kind_(kind), value_(value) {}

  Kind kind_;
  int value_;
};

// Resources used by a terminated process.
struct ResourceUsage {
  // Peak resident set size, in bytes.
  uint64_t memory_usage = 0;
  // CPU times, in seconds.
  double user_cpu_time = 0;
  double system_cpu_time = 0;
  // Wall time, in seconds. Not computed by Wait(), since it requires knowing
  // when the process was started.
  double wall_time_usage = 0;

  std::string ToString() const;
};

struct WaitResult {
  ExitStatus status;
  ResourceUsage usage;
};

}  // namespace sandbox

#endif

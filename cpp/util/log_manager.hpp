#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Formats one log line as "<date> <severity letter> <file>:<line>: <text>",
// with terminal colors if color is true.
std::string FormatLogLine(kj::LogSeverity severity, const char* file, int line,
                          const std::string& text, bool color);

// Writes kj log messages and exceptions to out for the duration of its
// lifetime. Stack traces of exceptions are printed when INFO messages are
// logged.
class LogManager : public kj::ExceptionCallback {
 public:
  LogManager(std::ostream& out, bool color) : out_(out), color_(color) {}
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out_;
  bool color_;
  backward::SignalHandling sh_;  // Override kj's signal handling.
};
}  // namespace util

#endif

#include "util/log_manager.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <kj/debug.h>

namespace util {
namespace {
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

const char* SeverityColor(kj::LogSeverity severity) {
  switch (severity) {
    case kj::LogSeverity::INFO:
      return "\e[0;32m";
    case kj::LogSeverity::WARNING:
      return "\e[0;33m";
    case kj::LogSeverity::ERROR:
      return "\e[0;31m";
    case kj::LogSeverity::FATAL:
      return "\e[7;31m";
    case kj::LogSeverity::DBG:
      return "\e[0;35m";
  }
  return reset_color;
}

char SeverityLetter(kj::LogSeverity severity) {
  switch (severity) {
    case kj::LogSeverity::INFO:
      return 'I';
    case kj::LogSeverity::WARNING:
      return 'W';
    case kj::LogSeverity::ERROR:
      return 'E';
    case kj::LogSeverity::FATAL:
      return 'F';
    case kj::LogSeverity::DBG:
      return 'D';
  }
  return '?';
}

const char* BaseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p != '\0'; p++) {
    if (*p == '/') base = p + 1;
  }
  return base;
}
}  // namespace

std::string FormatLogLine(kj::LogSeverity severity, const char* file, int line,
                          const std::string& text, bool color) {
  auto paint = [color](const char* code, const std::string& s) {
    return color ? code + s + reset_color : s;
  };
  std::time_t t = std::time(nullptr);
  struct tm tm {};
  localtime_r(&t, &tm);
  std::ostringstream date;
  date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");

  std::string letter(1, SeverityLetter(severity));
  std::string location =
      std::string(BaseName(file)) + ":" + std::to_string(line);
  return paint(date_color, date.str()) + " " +
         paint(SeverityColor(severity), letter) + " " +
         paint(file_color, location) + ": " + text;
}

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      color_ ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out_);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int /*contextDepth*/, kj::String&& text) {
  out_ << FormatLogLine(severity, file, line, text.cStr(), color_)
       << std::endl;
}
}  // namespace util

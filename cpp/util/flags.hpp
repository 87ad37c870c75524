#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Logging flags
  static std::string log_file;
  static bool verbose;

  // Limits, 0 means no limit
  static uint64_t memory_limit;
  static uint64_t time_limit;
  static uint64_t wall_limit_millis;

  // I/O redirection, empty means inherited
  static std::string stdin_file;
  static std::string stdout_file;
  static std::string stderr_file;
};

#endif

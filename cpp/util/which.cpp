#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "util/misc.hpp"

namespace util {

std::string which(const std::string& cmd) {
  if (cmd.find('/') != std::string::npos) return cmd;
  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = dir.back() == '/' ? dir + cmd : dir + "/" + cmd;
    if (access(fullpath.c_str(), X_OK) == 0) return fullpath;
  }

  return "";
}

}  // namespace util

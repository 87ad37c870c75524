#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Commands containing a slash
// are returned as they are. Returns an empty string if the command is not
// found in any of the directories of PATH.
std::string which(const std::string& cmd);

}  // namespace util

#endif

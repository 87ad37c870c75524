#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Callbacks for kj::MainBuilder that store the option value in var.
std::function<kj::MainBuilder::Validity()> setBool(bool& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var);
// setUint64 rejects values larger than max.
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setUint64(
    uint64_t& var, uint64_t max = UINT64_MAX);

}  // namespace util
#endif

#include "util/misc.hpp"

#include <cerrno>
#include <cstdlib>
#include <iterator>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<kj::MainBuilder::Validity()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setUint64(
    uint64_t& var, uint64_t max) {
  return [&var, max](kj::StringPtr p) -> kj::MainBuilder::Validity {
    if (p.size() == 0 || p[0] < '0' || p[0] > '9') {
      return kj::str("not a non-negative integer: ", p);
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(p.cStr(), &end, 10);  // NOLINT
    if (errno != 0 || *end != '\0') {
      return kj::str("not a valid integer: ", p);
    }
    if (value > max) return kj::str("at most ", max, " allowed: ", p);
    var = value;
    return true;
  };
}

}  // namespace util

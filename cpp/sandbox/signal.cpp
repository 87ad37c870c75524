#include "sandbox/signal.hpp"

#include <csignal>
#include <cstring>

namespace sandbox {

#ifdef SANDBOX_HAVE_STRSIGNAL
kj::Maybe<std::string> StrSignal(int signal) {
  // strsignal happily describes any integer as "Unknown signal".
  if (signal <= 0 || signal >= NSIG) return nullptr;
  const char* description = strsignal(signal);
  if (description == nullptr || description[0] == '\0') return nullptr;
  return std::string(description);
}
#else
kj::Maybe<std::string> StrSignal(int /*signal*/) { return nullptr; }
#endif

}  // namespace sandbox

#ifndef SANDBOX_SIGNAL_HPP
#define SANDBOX_SIGNAL_HPP

#include <string>

#include <kj/common.h>

namespace sandbox {

// Returns the textual description of a signal, or nullptr if the platform
// cannot describe it (no strsignal(), not a valid signal number, or an empty
// description).
kj::Maybe<std::string> StrSignal(int signal);

}  // namespace sandbox

#endif

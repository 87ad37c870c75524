#ifndef SANDBOX_CONFIGURATION_HPP
#define SANDBOX_CONFIGURATION_HPP

#include <cstdint>

#include <kj/common.h>

namespace sandbox {

// Limits to be enforced on a sandboxed process. A missing value means that the
// corresponding limit is inherited from the parent process.
struct SandboxConfiguration {
  // Maximum size of the address space, in bytes.
  kj::Maybe<uint64_t> memory_limit = nullptr;
  // Maximum CPU time, in seconds.
  kj::Maybe<uint64_t> time_limit = nullptr;
};

}  // namespace sandbox

#endif

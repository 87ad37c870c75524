#include "sandbox/resource_limits.hpp"

#include <sys/resource.h>
#include <sys/time.h>

#include <kj/debug.h>

namespace sandbox {

namespace {
// glibc declares setrlimit with its own resource type.
#ifdef __GLIBC__
using native_resource_t = __rlimit_resource_t;
#else
using native_resource_t = int;
#endif

native_resource_t NativeResource(Resource resource) {
  switch (resource) {
    case Resource::ADDRESS_SPACE:
      return RLIMIT_AS;
    case Resource::CPU_TIME:
      return RLIMIT_CPU;
    case Resource::CORE_SIZE:
      return RLIMIT_CORE;
  }
  KJ_FAIL_REQUIRE("Unknown resource", static_cast<int>(resource));
}
}  // namespace

const char* ResourceName(Resource resource) {
  switch (resource) {
    case Resource::ADDRESS_SPACE:
      return "AS";
    case Resource::CPU_TIME:
      return "CPU";
    case Resource::CORE_SIZE:
      return "CORE";
  }
  return "UNKNOWN";
}

void SetResourceLimit(Resource resource, uint64_t limit) {
  struct rlimit rlim {};
  rlim.rlim_cur = static_cast<rlim_t>(limit);
  rlim.rlim_max = static_cast<rlim_t>(limit);
  KJ_SYSCALL(setrlimit(NativeResource(resource), &rlim),
             ResourceName(resource), limit);
}

void SetupResourceLimits(const SandboxConfiguration& config) {
  KJ_IF_MAYBE(memory_limit, config.memory_limit) {
    SetResourceLimit(Resource::ADDRESS_SPACE, *memory_limit);
  }
  KJ_IF_MAYBE(time_limit, config.time_limit) {
    SetResourceLimit(Resource::CPU_TIME, *time_limit);
  }
  // No core dumps.
  SetResourceLimit(Resource::CORE_SIZE, 0);
}

}  // namespace sandbox

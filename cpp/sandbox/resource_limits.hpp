#ifndef SANDBOX_RESOURCE_LIMITS_HPP
#define SANDBOX_RESOURCE_LIMITS_HPP

#include <cstdint>

#include "sandbox/configuration.hpp"

namespace sandbox {

enum class Resource { ADDRESS_SPACE, CPU_TIME, CORE_SIZE };

const char* ResourceName(Resource resource);

// Sets both the soft and the hard limit of the given resource of the calling
// process. Throws on failure.
void SetResourceLimit(Resource resource, uint64_t limit);

// Applies the limits in config to the calling process, in this order: address
// space, CPU time, core size. Core dumps are always disabled. Limits that were
// set before a failure are not restored.
// Meant to be called in a forked child right before exec: the limits cannot be
// raised again afterwards.
void SetupResourceLimits(const SandboxConfiguration& config);

}  // namespace sandbox

#endif

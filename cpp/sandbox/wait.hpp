#ifndef SANDBOX_WAIT_HPP
#define SANDBOX_WAIT_HPP

#include <sys/resource.h>
#include <sys/types.h>

#include "sandbox/result.hpp"

namespace sandbox {

// Blocks until the child pid terminates, reaps it and returns how it
// terminated together with the resources it used. Stopped and continued
// children are not reported. Throws if wait4 fails or is interrupted (there
// are no retries), or if the child did not exit nor was killed by a signal.
WaitResult Wait(pid_t pid);

// Decodes a status as returned by wait4. Throws if the status describes
// neither a normal exit nor a termination by signal.
ExitStatus ClassifyWaitStatus(int raw_status);

// Converts the accounting data returned by wait4. Memory is in bytes and
// times in seconds; wall_time_usage is left at zero.
ResourceUsage ResourceUsageFromRusage(const struct rusage& rusage);

}  // namespace sandbox

#endif

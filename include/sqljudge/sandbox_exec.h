#ifndef INCLUDE_SQLJUDGE_SANDBOX_EXEC_H_
#define INCLUDE_SQLJUDGE_SANDBOX_EXEC_H_

#include "sandbox.h"

// Extra wall time given to the helper process for startup and dataset loading
extern int64_t kSandboxGrace; // us

// Run the query in a separate sqljudge-sandbox process with rlimits applied.
// The helper interrupts itself at time_limit; if it is still running at
// time_limit + kSandboxGrace it is killed with SIGKILL and TIMEOUT is returned.
SandboxResult SandboxExec(const SandboxOptions&);

#endif  // INCLUDE_SQLJUDGE_SANDBOX_EXEC_H_

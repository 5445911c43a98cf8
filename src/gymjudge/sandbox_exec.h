#ifndef GYMJUDGE_SANDBOX_EXEC_H_
#define GYMJUDGE_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox_options.h"

// We separate this from sandbox_options.h because it needs logging,
//   while sandbox_options.h is also linked into the small sandbox-exec helper

// The jail's stdout & stderr, as seen by the helper
constexpr int kHelperLogFd = 3;

struct SandboxProcess {
  pid_t pid;
  int result_fd; // the helper writes one cjail_result here, then exits
};

// Spawn the sandbox-exec helper as the leader of a new process group and hand it the options.
// log_fd becomes kHelperLogFd in the helper; opt.fd_output/fd_error should refer to it.
// Only async-signal-safe calls happen between fork and exec, so this is safe from any thread.
bool SpawnSandboxExec(const SandboxOptions& opt, int log_fd, SandboxProcess& proc);

// false if the helper exited without a complete result
bool ReadSandboxResult(int fd, struct cjail_result& res);

#endif  // GYMJUDGE_SANDBOX_EXEC_H_

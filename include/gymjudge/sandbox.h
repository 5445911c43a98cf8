#ifndef INCLUDE_GYMJUDGE_SANDBOX_H_
#define INCLUDE_GYMJUDGE_SANDBOX_H_

#include <mutex>
#include <chrono>
#include <string>
#include <unordered_map>
#include <condition_variable>

#include <gymjudge/submission.h>
#include <gymjudge/tracker.h>

struct SandboxHandle {
  long id;
};

struct RunResult {
  int exit_code;
  std::string logs;
  double execution_time_ms;
};

// Capability interface of an isolation backend (jail, container engine, micro-VM...)
class SandboxBackend {
 public:
  using Clock = std::chrono::steady_clock;

  virtual ~SandboxBackend() = default;

  // Whether a runtime image exists for the language
  virtual bool HasImage(const std::string& language) const = 0;
  // Create the isolated runtime and begin execution; throws SandboxError
  virtual SandboxHandle Start(const ExecutionSpec&) = 0;
  // Block until the runtime exits.
  // Throws TimeoutError if the deadline passes first, SandboxError on internal faults.
  virtual RunResult Wait(const SandboxHandle&, Clock::time_point deadline) = 0;
  // Force-terminate; best effort and idempotent. May be called concurrently with Wait.
  virtual void Kill(const SandboxHandle&) = 0;
  // Release every resource of the runtime; must not throw
  virtual void Release(const SandboxHandle&) noexcept = 0;
};

// Owns one started runtime; Release runs exactly once when it goes out of scope
class ScopedSandbox {
  SandboxBackend& backend_;
  SandboxHandle handle_;
 public:
  ScopedSandbox(SandboxBackend& backend, const ExecutionSpec& spec) :
      backend_(backend), handle_(backend.Start(spec)) {}
  ~ScopedSandbox() { backend_.Release(handle_); }
  ScopedSandbox(const ScopedSandbox&) = delete;
  ScopedSandbox& operator=(const ScopedSandbox&) = delete;

  const SandboxHandle& Handle() const { return handle_; }
};

// Throws ValidationError on malformed input
void ValidateExecutionSpec(const ExecutionSpec&);

class SandboxManager {
  using Clock = std::chrono::steady_clock;

  SubmissionTracker& tracker_;
  SandboxBackend& backend_;
  int max_parallel_; // 0 = unlimited

  std::mutex mtx_;
  std::condition_variable cv_;
  int running_; // monitors holding an execution slot
  int monitors_; // live monitor threads
  bool stopping_;
  std::unordered_map<std::string, SandboxHandle> live_; // started runtimes

  bool AcquireSlot_(const std::string& id);
  void ReleaseSlot_();
  void Execute_(const ExecutionSpec& spec);
  void Monitor_(const std::string& id);

 public:
  SandboxManager(SubmissionTracker& tracker, SandboxBackend& backend, int max_parallel = 0);
  // Kills every live runtime and waits for all monitors to finish
  ~SandboxManager();
  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;

  // Returns as soon as the submission is tracked; execution happens on its own thread.
  // Throws ValidationError (ConflictError for a duplicate id) or SandboxError.
  std::string Start(const ExecutionSpec& spec);

  // Cancels a non-terminal submission. Unknown or terminal ids are a no-op
  //  returning the current (or not-found) snapshot.
  ExecutionOutcome Stop(const std::string& id);

  int RunningCount();
};

#endif  // INCLUDE_GYMJUDGE_SANDBOX_H_

#ifndef INCLUDE_GYMJUDGE_ORCHESTRATOR_H_
#define INCLUDE_GYMJUDGE_ORCHESTRATOR_H_

#include <chrono>
#include <string>
#include <optional>

#include <gymjudge/backoff.h>
#include <gymjudge/submission.h>

// Client side of the runner's delivery surface
class RunnerClient {
 public:
  using Clock = std::chrono::steady_clock;

  virtual ~RunnerClient() = default;

  virtual bool Health() = 0;
  // Returns the immediate reply (usually QUEUED/RUNNING).
  // Throws ValidationError (ConflictError for 409), SandboxError if the runner refused
  //  to create the runtime, TransientDeliveryError on transport failure.
  virtual ExecutionOutcome Submit(const ExecutionSpec&) = 0;
  // Throws TransientDeliveryError
  virtual ExecutionOutcome Snapshot(const std::string& id) = 0;
  // Waits on the push stream until a terminal (or NOT_FOUND) snapshot arrives.
  // Returns std::nullopt if the stream is unavailable or the deadline passed;
  //  throws TransientDeliveryError if an open stream broke before the terminal snapshot.
  virtual std::optional<ExecutionOutcome> Subscribe(const std::string& id, Clock::time_point deadline) = 0;
  // Throws TransientDeliveryError
  virtual ExecutionOutcome Cancel(const std::string& id) = 0;
};

BackoffPolicy DefaultPollPolicy();

class JudgeOrchestrator {
  using Clock = std::chrono::steady_clock;

  RunnerClient& client_;
  BackoffPolicy poll_policy_;
  std::chrono::milliseconds grace_;

  ExecutionOutcome Await_(const ExecutionSpec& spec, Clock::time_point deadline);
  ExecutionOutcome Expire_(const std::string& id, const std::string& transport_error);

 public:
  static constexpr std::chrono::seconds kDefaultGrace{5};

  explicit JudgeOrchestrator(RunnerClient& client,
                             BackoffPolicy poll_policy = DefaultPollPolicy(),
                             std::chrono::milliseconds grace = kDefaultGrace) :
      client_(client), poll_policy_(poll_policy), grace_(grace) {}

  // Always returns a terminal outcome, except that ValidationError from submission
  //  propagates to the caller. The local deadline (time_limit_sec + grace) governs.
  ExecutionOutcome Run(const ExecutionSpec& spec);
};

#endif  // INCLUDE_GYMJUDGE_ORCHESTRATOR_H_

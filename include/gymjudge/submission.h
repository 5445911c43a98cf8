#ifndef INCLUDE_GYMJUDGE_SUBMISSION_H_
#define INCLUDE_GYMJUDGE_SUBMISSION_H_

#include <string>
#include <cstdint>

// Lifecycle: QUEUED -> RUNNING -> {COMPLETED, ERRORED, TIMED_OUT}
// NOT_FOUND is never stored; it is only reported for unknown ids
#define ENUM_SUBMISSION_STATUS_ \
  X(QUEUED, "queued") \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(ERRORED, "error") \
  X(TIMED_OUT, "timeout") \
  X(NOT_FOUND, "not_found")
enum class SubmissionStatus {
#define X(name, abr) name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

inline bool IsTerminal(SubmissionStatus status) {
  return status == SubmissionStatus::COMPLETED ||
         status == SubmissionStatus::ERRORED ||
         status == SubmissionStatus::TIMED_OUT;
}

// One request to execute a code artifact
struct ExecutionSpec {
  std::string submission_id; // caller-supplied, must be unique while tracked
  std::string code;
  std::string language;
  long memory_limit_mb;
  int time_limit_sec;
  bool network_disabled;

  ExecutionSpec() : memory_limit_mb(128), time_limit_sec(10), network_disabled(true) {}
};

// largest limits a single submission may request
constexpr int kMaxTimeLimitSec = 3600;
constexpr long kMaxMemoryLimitMb = 64 * 1024;

// Snapshot of a submission; exit_code/logs/execution_time_ms/error
//  are only meaningful in terminal states
struct ExecutionOutcome {
  std::string submission_id;
  SubmissionStatus status;
  int exit_code;
  std::string logs;
  double execution_time_ms;
  std::string error;

  ExecutionOutcome() : status(SubmissionStatus::QUEUED), exit_code(-1), execution_time_ms(0) {}
  ExecutionOutcome(const std::string& id, SubmissionStatus status) :
      submission_id(id), status(status), exit_code(-1), execution_time_ms(0) {}

  bool IsTerminal() const { return ::IsTerminal(status); }

  static ExecutionOutcome NotFound(const std::string& id) {
    return ExecutionOutcome(id, SubmissionStatus::NOT_FOUND);
  }
  static ExecutionOutcome Errored(const std::string& id, const std::string& error) {
    ExecutionOutcome ret(id, SubmissionStatus::ERRORED);
    ret.error = error;
    return ret;
  }
  static ExecutionOutcome TimedOut(const std::string& id, const std::string& error) {
    ExecutionOutcome ret(id, SubmissionStatus::TIMED_OUT);
    ret.error = error;
    return ret;
  }
};

extern const char kTimedOutMessage[];
extern const char kCancelledMessage[];

#endif  // INCLUDE_GYMJUDGE_SUBMISSION_H_

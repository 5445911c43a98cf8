#ifndef INCLUDE_GYMJUDGE_ERRORS_H_
#define INCLUDE_GYMJUDGE_ERRORS_H_

#include <stdexcept>

class JudgeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Unknown task, malformed submission; surfaced to the caller, never retried
class ValidationError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

// Submission id already tracked
class ConflictError : public ValidationError {
 public:
  using ValidationError::ValidationError;
};

// Isolated runtime could not be created or crashed abnormally
class SandboxError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

class TimeoutError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

// Transport hiccup while awaiting a result; retried under a backoff policy
class TransientDeliveryError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

// Failed to upsert a JudgeResult; the upsert is idempotent and may be retried
class PersistenceError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

#endif  // INCLUDE_GYMJUDGE_ERRORS_H_

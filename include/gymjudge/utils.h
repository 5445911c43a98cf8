#ifndef INCLUDE_GYMJUDGE_UTILS_H_
#define INCLUDE_GYMJUDGE_UTILS_H_

#include <string>
#include <nlohmann/json_fwd.hpp>

#include "submission.h"
#include "task_spec.h"
#include "scoring.h"

long GetUniqueSandboxId();

const char* StatusToAbr(SubmissionStatus);
SubmissionStatus AbrToStatus(const std::string&); // NOT_FOUND if unrecognized
// Throws ValidationError if unrecognized
RubricKind GetRubricKind(const std::string&);

// wire format
nlohmann::json SnapshotJSON(const ExecutionOutcome&);
ExecutionOutcome ParseSnapshot(const nlohmann::json&);
nlohmann::json ExecutionSpecJSON(const ExecutionSpec&);
// Throws ValidationError
ExecutionSpec ParseExecutionSpec(const nlohmann::json&);
nlohmann::json JudgeResultJSON(const JudgeResult&);
// Integer field within [1, max], or def if absent; throws ValidationError
long LimitField(const nlohmann::json& body, const char* key, long def, long max);

std::string ToLower(std::string);

#endif  // INCLUDE_GYMJUDGE_UTILS_H_

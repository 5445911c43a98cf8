#include <gymjudge/scoring.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>

double ExecutionCorrectnessStrategy::Score(
    const RubricItem&, const TaskSpec& spec, const ExecutionOutcome& outcome) const {
  if (outcome.exit_code != 0) return 0.0;
  return outcome.logs.find(spec.success_marker) != std::string::npos ? 1.0 : 0.0;
}

double PerformanceStrategy::Score(
    const RubricItem&, const TaskSpec&, const ExecutionOutcome& outcome) const {
  double ms = outcome.execution_time_ms;
  if (ms < 100) return 1.0;
  if (ms < 500) return 0.7;
  if (ms < 1000) return 0.4;
  return 0.1;
}

double StyleComplianceStrategy::Score(
    const RubricItem&, const TaskSpec& spec, const ExecutionOutcome& outcome) const {
  if (spec.style_violation_marker.empty()) return 1.0;
  bool violated = ToLower(outcome.logs).find(ToLower(spec.style_violation_marker)) != std::string::npos;
  return violated ? 0.5 : 1.0;
}

double GenericStrategy::Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const {
  return 0.5;
}

const ScoringStrategy& StrategyFor(RubricKind kind) {
  static const ExecutionCorrectnessStrategy kExecutionCorrectness;
  static const PerformanceStrategy kPerformance;
  static const StyleComplianceStrategy kStyleCompliance;
  static const GenericStrategy kGeneric;
  switch (kind) {
    case RubricKind::EXECUTION_CORRECTNESS: return kExecutionCorrectness;
    case RubricKind::PERFORMANCE: return kPerformance;
    case RubricKind::STYLE_COMPLIANCE: return kStyleCompliance;
    case RubricKind::GENERIC: return kGeneric;
  }
  __builtin_unreachable();
}

std::string FeedbackRationale(const RubricItem& item, double score) {
  if (score > 0.8) return "Excellent work on: " + item.description;
  if (score > 0.6) return "Good job on: " + item.description + ", but room for improvement";
  if (score > 0.3) return "Needs work on: " + item.description;
  return "Failed to meet criteria: " + item.description;
}

JudgeResult ScoreOutcome(const std::string& episode_id, const TaskSpec& spec,
                         const ExecutionOutcome& outcome) {
  JudgeResult ret;
  ret.episode_id = episode_id;
  ret.task_id = spec.task_id;
  if (outcome.status != SubmissionStatus::COMPLETED) {
    std::string error = outcome.error;
    if (error.empty()) error = std::string("submission ended in state ") + StatusToAbr(outcome.status);
    ret.metrics = {{"error", error}};
    ret.feedback.push_back({"judge", 0.0, "Execution error: " + error, "execution"});
    spdlog::info("Episode {} of {}: execution failed: {}", episode_id, spec.task_id, error);
    return ret;
  }

  double total_weight = spec.TotalWeight();
  if (!(total_weight > 0)) throw ValidationError("rubric of " + spec.task_id + " has no weight");
  double weighted = 0;
  for (auto& item : spec.rubric) {
    double score = StrategyFor(item.kind).Score(item, spec, outcome);
    weighted += score * item.weight;
    ret.feedback.push_back({"judge", score, FeedbackRationale(item, score), item.description});
  }
  ret.score = std::clamp(weighted / total_weight, 0.0, 1.0);
  ret.success = IsSuccess(ret.score);
  ret.metrics = {
    {"exit_code", outcome.exit_code},
    {spec.metric, outcome.execution_time_ms},
  };
  spdlog::info("Episode {} of {}: score={:.4f} success={}", episode_id, spec.task_id,
               ret.score, ret.success);
  return ret;
}

JudgeResult RubricScorer::Score(const std::string& episode_id, const std::string& task_id,
                                const ExecutionOutcome& outcome) const {
  auto spec = registry_.Get(task_id);
  if (!spec) throw ValidationError("unknown task " + task_id);
  return ScoreOutcome(episode_id, *spec, outcome);
}

#ifndef INCLUDE_GYMJUDGE_SCORING_H_
#define INCLUDE_GYMJUDGE_SCORING_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <gymjudge/task_spec.h>
#include <gymjudge/submission.h>

constexpr double kSuccessThreshold = 0.6;

struct FeedbackItem {
  std::string source;
  double rating;
  std::string rationale;
  std::string rubric_section;
};

struct JudgeResult {
  std::string episode_id;
  std::string task_id;
  bool success;
  double score; // [0, 1]
  nlohmann::json metrics;
  std::vector<FeedbackItem> feedback; // rubric order

  JudgeResult() : success(false), score(0), metrics(nlohmann::json::object()) {}
};

class ScoringStrategy {
 public:
  virtual ~ScoringStrategy() = default;
  virtual double Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const = 0;
};

class ExecutionCorrectnessStrategy : public ScoringStrategy {
 public:
  double Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const override;
};

// Absolute thresholds, independent of the task's time limit
class PerformanceStrategy : public ScoringStrategy {
 public:
  double Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const override;
};

class StyleComplianceStrategy : public ScoringStrategy {
 public:
  double Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const override;
};

class GenericStrategy : public ScoringStrategy {
 public:
  double Score(const RubricItem&, const TaskSpec&, const ExecutionOutcome&) const override;
};

const ScoringStrategy& StrategyFor(RubricKind kind);

inline bool IsSuccess(double score) { return score >= kSuccessThreshold; }
std::string FeedbackRationale(const RubricItem& item, double score);

// Pure scoring of one outcome; errored and timed-out outcomes short-circuit to zero
JudgeResult ScoreOutcome(const std::string& episode_id, const TaskSpec& spec,
                         const ExecutionOutcome& outcome);

class RubricScorer {
  const TaskSpecRegistry& registry_;
 public:
  explicit RubricScorer(const TaskSpecRegistry& registry) : registry_(registry) {}
  // Throws ValidationError if no spec is registered for task_id
  JudgeResult Score(const std::string& episode_id, const std::string& task_id,
                    const ExecutionOutcome& outcome) const;
};

#endif  // INCLUDE_GYMJUDGE_SCORING_H_

#ifndef INCLUDE_GYMJUDGE_JUDGE_H_
#define INCLUDE_GYMJUDGE_JUDGE_H_

#include <string>

#include <gymjudge/scoring.h>
#include <gymjudge/task_spec.h>
#include <gymjudge/orchestrator.h>
#include <gymjudge/episode_store.h>

// Evaluates one submission end to end: registry lookup, execution through the
//  orchestrator, rubric scoring, and persistence.
class JudgeService {
  const TaskSpecRegistry& registry_;
  JudgeOrchestrator& orchestrator_;
  EpisodeStore* store_; // nullable

 public:
  JudgeService(const TaskSpecRegistry& registry, JudgeOrchestrator& orchestrator,
               EpisodeStore* store = nullptr) :
      registry_(registry), orchestrator_(orchestrator), store_(store) {}

  // Throws ValidationError for an unknown task or a rejected submission; every other
  //  failure is folded into a zero-score result.
  JudgeResult Evaluate(const std::string& episode_id, const std::string& task_id,
                       const std::string& code);
};

#endif  // INCLUDE_GYMJUDGE_JUDGE_H_

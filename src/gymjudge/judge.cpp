#include <gymjudge/judge.h>

#include <spdlog/spdlog.h>
#include <gymjudge/errors.h>

void PersistResult(EpisodeStore& store, const JudgeResult& result) {
  store.UpdateResult(result.episode_id, result.task_id, result.success, result.score, result.metrics);
  for (size_t i = 0; i < result.feedback.size(); i++) {
    store.AppendFeedback(result.episode_id, i, result.feedback[i]);
  }
}

JudgeResult JudgeService::Evaluate(const std::string& episode_id, const std::string& task_id,
                                   const std::string& code) {
  auto spec = registry_.Get(task_id);
  if (!spec) throw ValidationError("unknown task " + task_id);

  ExecutionSpec exec;
  exec.submission_id = episode_id;
  exec.code = code;
  exec.language = LanguageForCategory(spec->category);
  exec.memory_limit_mb = spec->memory_limit_mb;
  exec.time_limit_sec = spec->time_limit_sec;
  exec.network_disabled = true;
  spdlog::info("Evaluating episode {} on task {} (language {})", episode_id, task_id, exec.language);

  ExecutionOutcome outcome;
  try {
    outcome = orchestrator_.Run(exec);
  } catch (ValidationError&) {
    throw;
  } catch (std::exception& e) {
    spdlog::error("Execution of episode {} failed unexpectedly: {}", episode_id, e.what());
    outcome = ExecutionOutcome::Errored(episode_id, e.what());
  }

  JudgeResult result;
  try {
    result = ScoreOutcome(episode_id, *spec, outcome);
  } catch (std::exception& e) {
    spdlog::error("Scoring of episode {} failed: {}", episode_id, e.what());
    result = ScoreOutcome(episode_id, *spec, ExecutionOutcome::Errored(episode_id, e.what()));
  }

  if (store_) {
    try {
      PersistResult(*store_, result);
    } catch (PersistenceError& e) {
      spdlog::error("Failed to persist result of episode {}: {}", episode_id, e.what());
    }
  }
  return result;
}

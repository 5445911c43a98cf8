#ifndef INCLUDE_GYMJUDGE_EPISODE_STORE_H_
#define INCLUDE_GYMJUDGE_EPISODE_STORE_H_

#include <string>

#include <gymjudge/scoring.h>

// Persistence of judge results. Both operations are idempotent upserts,
//  so delivering the same result more than once leaves the same stored state.
// Implementations throw PersistenceError.
class EpisodeStore {
 public:
  virtual ~EpisodeStore() = default;
  virtual void UpdateResult(const std::string& episode_id, const std::string& task_id,
                            bool success, double score, const nlohmann::json& metrics) = 0;
  // position is the item's index in the feedback list
  virtual void AppendFeedback(const std::string& episode_id, int position, const FeedbackItem& item) = 0;
};

// Throws PersistenceError
void PersistResult(EpisodeStore& store, const JudgeResult& result);

#endif  // INCLUDE_GYMJUDGE_EPISODE_STORE_H_

#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <optional>
#include <sqlite_orm/sqlite_orm.h>
#include <gymjudge/episode_store.h>

struct EpisodeRow {
  std::string episode_id;
  std::string task_id;
  bool success;
  double score;
  std::string metrics; // JSON
};

struct FeedbackRow {
  std::string episode_id;
  int position;
  std::string source;
  double rating;
  std::string rationale;
  std::string rubric_section;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_table("episodes",
                 make_column("episode_id", &EpisodeRow::episode_id, primary_key()),
                 make_column("task_id", &EpisodeRow::task_id),
                 make_column("success", &EpisodeRow::success),
                 make_column("score", &EpisodeRow::score),
                 make_column("metrics", &EpisodeRow::metrics, default_value("{}"))),
      make_table("feedback",
                 make_column("episode_id", &FeedbackRow::episode_id),
                 make_column("position", &FeedbackRow::position),
                 make_column("source", &FeedbackRow::source),
                 make_column("rating", &FeedbackRow::rating),
                 make_column("rationale", &FeedbackRow::rationale),
                 make_column("rubric_section", &FeedbackRow::rubric_section),
                 primary_key(&FeedbackRow::episode_id, &FeedbackRow::position)));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Episode store in SQLite; both writes are REPLACE upserts
class SqliteEpisodeStore : public EpisodeStore {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  std::string path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

  void Init_();

 public:
  explicit SqliteEpisodeStore(const std::string& path) : path_(path) {}

  void UpdateResult(const std::string& episode_id, const std::string& task_id,
                    bool success, double score, const nlohmann::json& metrics) override;
  void AppendFeedback(const std::string& episode_id, int position, const FeedbackItem& item) override;

  std::optional<EpisodeRow> GetEpisode(const std::string& episode_id);
  std::vector<FeedbackRow> Feedback(const std::string& episode_id);
};

#endif  // DATABASE_H_

#include "database.h"

#include <system_error>
#include <spdlog/spdlog.h>
#include <gymjudge/errors.h>

void SqliteEpisodeStore::Init_() {
  if (!db_) {
    db_ = std::make_unique<Storage>(InitStorage(path_));
    spdlog::debug("Episode store opened: {}", path_);
  }
}

void SqliteEpisodeStore::UpdateResult(const std::string& episode_id, const std::string& task_id,
                                      bool success, double score, const nlohmann::json& metrics) {
  std::lock_guard lck(mtx_);
  try {
    Init_();
    db_->replace(EpisodeRow{episode_id, task_id, success, score,
                            metrics.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)});
  } catch (std::system_error& e) {
    throw PersistenceError("update result of " + episode_id + ": " + e.what());
  }
}

void SqliteEpisodeStore::AppendFeedback(const std::string& episode_id, int position, const FeedbackItem& item) {
  std::lock_guard lck(mtx_);
  try {
    Init_();
    db_->replace(FeedbackRow{episode_id, position, item.source, item.rating,
                             item.rationale, item.rubric_section});
  } catch (std::system_error& e) {
    throw PersistenceError("append feedback of " + episode_id + ": " + e.what());
  }
}

std::optional<EpisodeRow> SqliteEpisodeStore::GetEpisode(const std::string& episode_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  try {
    Init_();
    auto rows = db_->get_all<EpisodeRow>(where(c(&EpisodeRow::episode_id) == episode_id));
    if (rows.empty()) return std::nullopt;
    return rows.front();
  } catch (std::system_error& e) {
    throw PersistenceError("read episode " + episode_id + ": " + e.what());
  }
}

std::vector<FeedbackRow> SqliteEpisodeStore::Feedback(const std::string& episode_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  try {
    Init_();
    return db_->get_all<FeedbackRow>(where(c(&FeedbackRow::episode_id) == episode_id),
                                     order_by(&FeedbackRow::position));
  } catch (std::system_error& e) {
    throw PersistenceError("read feedback of " + episode_id + ": " + e.what());
  }
}

#include <gymjudge/tracker.h>

#include <spdlog/spdlog.h>
#include <gymjudge/utils.h>

bool IsValidTransition(SubmissionStatus from, SubmissionStatus to) {
  switch (from) {
    case SubmissionStatus::QUEUED:
      return to == SubmissionStatus::RUNNING || to == SubmissionStatus::ERRORED;
    case SubmissionStatus::RUNNING:
      return to == SubmissionStatus::COMPLETED || to == SubmissionStatus::ERRORED ||
             to == SubmissionStatus::TIMED_OUT;
    default:
      return false;
  }
}

std::shared_ptr<SubmissionTracker::Record> SubmissionTracker::Find_(const std::string& id) const {
  std::shared_lock lck(map_mtx_);
  auto it = records_.find(id);
  if (it == records_.end()) return nullptr;
  return it->second;
}

bool SubmissionTracker::Put(const ExecutionSpec& spec) {
  auto record = std::make_shared<Record>();
  record->spec = spec;
  record->state = ExecutionOutcome(spec.submission_id, SubmissionStatus::QUEUED);
  std::unique_lock lck(map_mtx_);
  bool inserted = records_.try_emplace(spec.submission_id, std::move(record)).second;
  lck.unlock();
  if (!inserted) {
    spdlog::info("Submission {} already tracked", spec.submission_id);
  }
  return inserted;
}

std::optional<ExecutionOutcome> SubmissionTracker::Get(const std::string& id) const {
  auto record = Find_(id);
  if (!record) return std::nullopt;
  std::lock_guard lck(record->mtx);
  return record->state;
}

std::optional<ExecutionSpec> SubmissionTracker::GetSpec(const std::string& id) const {
  auto record = Find_(id);
  if (!record) return std::nullopt;
  std::lock_guard lck(record->mtx);
  return record->spec;
}

bool SubmissionTracker::Update(const std::string& id, const Mutator& mutator) {
  auto record = Find_(id);
  if (!record) return false;
  std::lock_guard lck(record->mtx);
  if (record->state.IsTerminal()) return false;
  ExecutionOutcome next = record->state;
  mutator(next);
  if (!IsValidTransition(record->state.status, next.status)) {
    spdlog::debug("Rejected transition of {}: {} -> {}", id,
                  StatusToAbr(record->state.status), StatusToAbr(next.status));
    return false;
  }
  spdlog::info("Submission {}: {} -> {}", id,
               StatusToAbr(record->state.status), StatusToAbr(next.status));
  next.submission_id = id;
  record->state = std::move(next);
  if (record->state.IsTerminal()) record->terminal_at = Clock::now();
  return true;
}

void SubmissionTracker::Evict(const std::string& id) {
  std::unique_lock lck(map_mtx_);
  if (records_.erase(id)) spdlog::debug("Submission {} evicted", id);
}

size_t SubmissionTracker::EvictExpired(Clock::duration retention) {
  auto now = Clock::now();
  std::unique_lock lck(map_mtx_);
  size_t evicted = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    bool expired;
    {
      std::lock_guard record_lck(it->second->mtx);
      expired = it->second->state.IsTerminal() && it->second->subscribers == 0 &&
                now - it->second->terminal_at >= retention;
    }
    if (expired) {
      spdlog::debug("Submission {} expired", it->first);
      it = records_.erase(it);
      evicted++;
    } else {
      ++it;
    }
  }
  return evicted;
}

bool SubmissionTracker::AddSubscriber(const std::string& id) {
  auto record = Find_(id);
  if (!record) return false;
  std::lock_guard lck(record->mtx);
  record->subscribers++;
  return true;
}

void SubmissionTracker::RemoveSubscriber(const std::string& id) {
  auto record = Find_(id);
  if (!record) return;
  std::lock_guard lck(record->mtx);
  if (record->subscribers > 0) record->subscribers--;
}

size_t SubmissionTracker::Size() const {
  std::shared_lock lck(map_mtx_);
  return records_.size();
}

std::vector<std::string> SubmissionTracker::ActiveIds() const {
  std::vector<std::string> ret;
  std::shared_lock lck(map_mtx_);
  for (auto& i : records_) {
    std::lock_guard record_lck(i.second->mtx);
    if (!i.second->state.IsTerminal()) ret.push_back(i.first);
  }
  return ret;
}

#include "utils.h"

#include <thread>
#include <algorithm>

#include <gymjudge/errors.h>

void FakeBackend::SetScript(const std::string& id, const Script& script) {
  std::lock_guard lck(mtx_);
  scripts_[id] = script;
}

void FakeBackend::SetDefaultScript(const Script& script) {
  std::lock_guard lck(mtx_);
  default_script_ = script;
}

int FakeBackend::Starts(const std::string& id) const {
  std::lock_guard lck(mtx_);
  auto it = starts_.find(id);
  return it == starts_.end() ? 0 : it->second;
}

int FakeBackend::Releases(const std::string& id) const {
  std::lock_guard lck(mtx_);
  auto it = releases_.find(id);
  return it == releases_.end() ? 0 : it->second;
}

int FakeBackend::TotalReleases() const {
  std::lock_guard lck(mtx_);
  int ret = 0;
  for (auto& i : releases_) ret += i.second;
  return ret;
}

int FakeBackend::Kills() const {
  std::lock_guard lck(mtx_);
  return kills_;
}

int FakeBackend::Running() const {
  std::lock_guard lck(mtx_);
  return running_;
}

int FakeBackend::MaxRunning() const {
  std::lock_guard lck(mtx_);
  return max_running_;
}

bool FakeBackend::HasImage(const std::string& language) const {
  return images.count(language);
}

SandboxHandle FakeBackend::Start(const ExecutionSpec& spec) {
  std::lock_guard lck(mtx_);
  auto it = scripts_.find(spec.submission_id);
  const Script& script = it == scripts_.end() ? default_script_ : it->second;
  if (script.fail_start) throw SandboxError("cannot create runtime");
  long id = ++next_id_;
  handles_[id] = spec.submission_id;
  starts_[spec.submission_id]++;
  max_running_ = std::max(max_running_, ++running_);
  return SandboxHandle{id};
}

RunResult FakeBackend::Wait(const SandboxHandle& handle, Clock::time_point deadline) {
  std::unique_lock lck(mtx_);
  auto start = Clock::now();
  auto it = scripts_.find(handles_.at(handle.id));
  Script script = it == scripts_.end() ? default_script_ : it->second;
  auto done_at = start + script.delay;
  bool finishes = !script.hang && done_at <= deadline;
  cv_.wait_until(lck, finishes ? done_at : deadline, [&]{ return killed_.count(handle.id) > 0; });
  if (killed_.count(handle.id)) throw SandboxError("runtime killed");
  if (!finishes) throw TimeoutError(kTimedOutMessage);
  if (script.fail_wait) throw SandboxError("runtime crashed");
  return script.result;
}

void FakeBackend::Kill(const SandboxHandle& handle) {
  std::lock_guard lck(mtx_);
  if (!handles_.count(handle.id)) return;
  kills_++;
  killed_.insert(handle.id);
  cv_.notify_all();
}

void FakeBackend::Release(const SandboxHandle& handle) noexcept {
  std::lock_guard lck(mtx_);
  auto it = handles_.find(handle.id);
  if (it == handles_.end()) return;
  releases_[it->second]++;
  running_--;
  handles_.erase(it);
}

FakeRunnerClient::FakeRunnerClient() {
  on_submit = [](const ExecutionSpec& spec) {
    return ExecutionOutcome(spec.submission_id, SubmissionStatus::QUEUED);
  };
  on_snapshot = [](const std::string& id) {
    return ExecutionOutcome(id, SubmissionStatus::RUNNING);
  };
  on_subscribe = [](const std::string&, Clock::time_point) -> std::optional<ExecutionOutcome> {
    return std::nullopt;
  };
  on_cancel = [](const std::string& id) {
    return ExecutionOutcome::Errored(id, kCancelledMessage);
  };
}

ExecutionOutcome FakeRunnerClient::Submit(const ExecutionSpec& spec) {
  submits++;
  last_spec = spec;
  return on_submit(spec);
}

ExecutionOutcome FakeRunnerClient::Snapshot(const std::string& id) {
  snapshots++;
  return on_snapshot(id);
}

std::optional<ExecutionOutcome> FakeRunnerClient::Subscribe(const std::string& id, Clock::time_point deadline) {
  subscribes++;
  return on_subscribe(id, deadline);
}

ExecutionOutcome FakeRunnerClient::Cancel(const std::string& id) {
  cancels++;
  return on_cancel(id);
}

void FakeEpisodeStore::UpdateResult(const std::string& episode_id, const std::string& task_id,
                                    bool success, double score, const nlohmann::json& metrics) {
  if (fail) throw PersistenceError("database is locked");
  writes++;
  results[episode_id] = {task_id, success, score, metrics};
}

void FakeEpisodeStore::AppendFeedback(const std::string& episode_id, int position, const FeedbackItem& item) {
  if (fail) throw PersistenceError("database is locked");
  writes++;
  feedback[{episode_id, position}] = item;
}

ExecutionSpec MakeExecutionSpec(const std::string& id, int time_limit_sec, const std::string& language) {
  ExecutionSpec spec;
  spec.submission_id = id;
  spec.code = "print('sorted')";
  spec.language = language;
  spec.time_limit_sec = time_limit_sec;
  return spec;
}

ExecutionOutcome MakeCompleted(const std::string& id, int exit_code, const std::string& logs,
                               double execution_time_ms) {
  ExecutionOutcome ret(id, SubmissionStatus::COMPLETED);
  ret.exit_code = exit_code;
  ret.logs = logs;
  ret.execution_time_ms = execution_time_ms;
  return ret;
}

TaskSpec MakeTaskSpec(const std::string& task_id, std::vector<RubricItem> rubric,
                      const std::string& category, int time_limit_sec) {
  TaskSpec spec;
  spec.task_id = task_id;
  spec.category = category;
  spec.time_limit_sec = time_limit_sec;
  spec.rubric = std::move(rubric);
  return spec;
}

std::optional<ExecutionOutcome> WaitForTerminal(SubmissionTracker& tracker, const std::string& id,
                                                std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::optional<ExecutionOutcome> ret;
  while (std::chrono::steady_clock::now() < deadline) {
    ret = tracker.Get(id);
    if (!ret || ret->IsTerminal()) return ret;
    std::this_thread::sleep_for(5ms);
  }
  return ret;
}

BackoffPolicy FastPolicy() {
  return BackoffPolicy(10ms, 1.5, 40ms, 500ms);
}

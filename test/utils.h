#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <unordered_map>
#include <condition_variable>

#include <gtest/gtest.h>
#include <gymjudge/sandbox.h>
#include <gymjudge/scoring.h>
#include <gymjudge/task_spec.h>
#include <gymjudge/orchestrator.h>
#include <gymjudge/episode_store.h>

using namespace std::chrono_literals;

// Scripted isolation backend; behavior is chosen per submission id
class FakeBackend : public SandboxBackend {
 public:
  struct Script {
    RunResult result = {0, "", 10.0};
    std::chrono::milliseconds delay = 0ms;
    bool hang = false; // never finishes on its own
    bool fail_start = false;
    bool fail_wait = false;
  };

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  long next_id_ = 0;
  std::unordered_map<long, std::string> handles_; // live handle -> submission id
  std::set<long> killed_;
  std::unordered_map<std::string, Script> scripts_;
  Script default_script_;
  std::unordered_map<std::string, int> starts_, releases_;
  int running_ = 0, max_running_ = 0, kills_ = 0;

 public:
  std::set<std::string> images = {"python", "markdown", "json"};

  void SetScript(const std::string& id, const Script& script);
  void SetDefaultScript(const Script& script);

  int Starts(const std::string& id) const;
  int Releases(const std::string& id) const;
  int TotalReleases() const;
  int Kills() const;
  int Running() const;
  int MaxRunning() const;

  bool HasImage(const std::string& language) const override;
  SandboxHandle Start(const ExecutionSpec&) override;
  RunResult Wait(const SandboxHandle&, Clock::time_point deadline) override;
  void Kill(const SandboxHandle&) override;
  void Release(const SandboxHandle&) noexcept override;
};

// Scripted runner transport
class FakeRunnerClient : public RunnerClient {
 public:
  std::function<ExecutionOutcome(const ExecutionSpec&)> on_submit;
  std::function<ExecutionOutcome(const std::string&)> on_snapshot;
  std::function<std::optional<ExecutionOutcome>(const std::string&, Clock::time_point)> on_subscribe;
  std::function<ExecutionOutcome(const std::string&)> on_cancel;

  std::atomic_int submits{0}, snapshots{0}, subscribes{0}, cancels{0};
  std::optional<ExecutionSpec> last_spec;

  FakeRunnerClient();

  bool Health() override { return true; }
  ExecutionOutcome Submit(const ExecutionSpec&) override;
  ExecutionOutcome Snapshot(const std::string& id) override;
  std::optional<ExecutionOutcome> Subscribe(const std::string& id, Clock::time_point deadline) override;
  ExecutionOutcome Cancel(const std::string& id) override;
};

// Keeps the last write per key, like the SQL upserts
class FakeEpisodeStore : public EpisodeStore {
 public:
  struct Result {
    std::string task_id;
    bool success;
    double score;
    nlohmann::json metrics;
  };
  std::map<std::string, Result> results;
  std::map<std::pair<std::string, int>, FeedbackItem> feedback;
  int writes = 0;
  bool fail = false;

  void UpdateResult(const std::string& episode_id, const std::string& task_id,
                    bool success, double score, const nlohmann::json& metrics) override;
  void AppendFeedback(const std::string& episode_id, int position, const FeedbackItem& item) override;
};

ExecutionSpec MakeExecutionSpec(const std::string& id, int time_limit_sec = 5,
                                const std::string& language = "python");
ExecutionOutcome MakeCompleted(const std::string& id, int exit_code, const std::string& logs,
                               double execution_time_ms);
TaskSpec MakeTaskSpec(const std::string& task_id, std::vector<RubricItem> rubric,
                      const std::string& category = "coding", int time_limit_sec = 10);

// Waits until the submission is terminal; returns the last snapshot seen
std::optional<ExecutionOutcome> WaitForTerminal(SubmissionTracker& tracker, const std::string& id,
                                                std::chrono::milliseconds timeout = 5000ms);

// Fast poll policy for tests
BackoffPolicy FastPolicy();

#endif // TEST_UTILS_H_

#ifndef RUNNER_CLIENT_H_
#define RUNNER_CLIENT_H_

#include <string>
#include <gymjudge/orchestrator.h>

// RunnerClient over the runner's HTTP surface and websocket stream
class HttpRunnerClient : public RunnerClient {
  std::string runner_url_;
  std::string ws_url_; // empty: no stream, always poll
  BackoffPolicy health_policy_;

 public:
  HttpRunnerClient(const std::string& runner_url, const std::string& ws_url,
                   BackoffPolicy health_policy = DefaultPollPolicy());

  bool Health() override;
  ExecutionOutcome Submit(const ExecutionSpec&) override;
  ExecutionOutcome Snapshot(const std::string& id) override;
  std::optional<ExecutionOutcome> Subscribe(const std::string& id, Clock::time_point deadline) override;
  ExecutionOutcome Cancel(const std::string& id) override;
};

#endif  // RUNNER_CLIENT_H_

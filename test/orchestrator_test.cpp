#include <thread>

#include <gtest/gtest.h>
#include <gymjudge/errors.h>
#include <gymjudge/orchestrator.h>

#include "utils.h"

class OrchestratorTest : public testing::Test {
 protected:
  FakeRunnerClient client;
  JudgeOrchestrator orchestrator{client, FastPolicy(), 100ms};
};

TEST_F(OrchestratorTest, TerminalReplyReturnedImmediately) {
  client.on_submit = [](const ExecutionSpec& spec) { return MakeCompleted(spec.submission_id, 0, "sorted", 12); };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
  EXPECT_EQ(res.logs, "sorted");
  EXPECT_EQ(client.subscribes, 0);
  EXPECT_EQ(client.snapshots, 0);
  EXPECT_EQ(client.cancels, 0);
}

TEST_F(OrchestratorTest, StreamDeliversResult) {
  client.on_subscribe = [](const std::string& id, RunnerClient::Clock::time_point) {
    return std::optional<ExecutionOutcome>(MakeCompleted(id, 0, "sorted", 30));
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
  EXPECT_EQ(client.subscribes, 1);
  EXPECT_EQ(client.snapshots, 0);
}

TEST_F(OrchestratorTest, PollsWhenStreamUnavailable) {
  std::atomic_int polls{0};
  client.on_snapshot = [&](const std::string& id) {
    if (++polls < 3) return ExecutionOutcome(id, SubmissionStatus::RUNNING);
    return MakeCompleted(id, 0, "sorted", 30);
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
  EXPECT_EQ(client.snapshots, 3);
  EXPECT_EQ(client.cancels, 0);
}

TEST_F(OrchestratorTest, PollsWhenStreamBreaks) {
  client.on_subscribe = [](const std::string&, RunnerClient::Clock::time_point) -> std::optional<ExecutionOutcome> {
    throw TransientDeliveryError("stream closed");
  };
  client.on_snapshot = [](const std::string& id) { return MakeCompleted(id, 1, "", 30); };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
  EXPECT_EQ(res.exit_code, 1);
}

TEST_F(OrchestratorTest, TransientPollErrorsRecovered) {
  std::atomic_int polls{0};
  client.on_snapshot = [&](const std::string& id) {
    if (++polls <= 2) throw TransientDeliveryError("connection reset");
    return MakeCompleted(id, 0, "sorted", 30);
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
}

TEST_F(OrchestratorTest, DeadlineExpires) {
  // the runner never reports a terminal state
  auto begin = std::chrono::steady_clock::now();
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_EQ(res.status, SubmissionStatus::TIMED_OUT);
  EXPECT_EQ(res.error, kTimedOutMessage);
  EXPECT_EQ(client.cancels, 1);
  EXPECT_GE(elapsed, 1100ms);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(OrchestratorTest, CancelFailureAtDeadline) {
  client.on_cancel = [](const std::string&) -> ExecutionOutcome {
    throw TransientDeliveryError("connection refused");
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  EXPECT_EQ(res.status, SubmissionStatus::TIMED_OUT);
  EXPECT_EQ(client.cancels, 1);
}

TEST_F(OrchestratorTest, LateAnswerAfterDeadlineIgnored) {
  // the stream stays silent until the deadline; the runner finishes just after
  client.on_subscribe = [](const std::string&, RunnerClient::Clock::time_point deadline) {
    std::this_thread::sleep_until(deadline);
    return std::optional<ExecutionOutcome>();
  };
  client.on_snapshot = [](const std::string& id) { return MakeCompleted(id, 0, "sorted", 900); };
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  EXPECT_EQ(res.status, SubmissionStatus::TIMED_OUT);
  EXPECT_EQ(res.error, kTimedOutMessage);
  EXPECT_EQ(client.snapshots, 0);
  EXPECT_EQ(client.cancels, 1);
}

TEST_F(OrchestratorTest, LastPollAtDeadlineIgnored) {
  auto deadline = std::chrono::steady_clock::now() + 1s + 100ms;
  client.on_snapshot = [deadline](const std::string& id) {
    if (std::chrono::steady_clock::now() < deadline) return ExecutionOutcome(id, SubmissionStatus::RUNNING);
    return MakeCompleted(id, 0, "sorted", 900);
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  EXPECT_EQ(res.status, SubmissionStatus::TIMED_OUT);
  EXPECT_EQ(client.cancels, 1);
}

TEST_F(OrchestratorTest, TransportErrorsUntilDeadline) {
  client.on_snapshot = [](const std::string&) -> ExecutionOutcome {
    throw TransientDeliveryError("connection refused");
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  EXPECT_EQ(res.status, SubmissionStatus::ERRORED);
  EXPECT_EQ(res.error, "connection refused");
  EXPECT_EQ(client.cancels, 1);
}

TEST_F(OrchestratorTest, SubmitNeverReachesRunner) {
  client.on_submit = [](const ExecutionSpec&) -> ExecutionOutcome {
    throw TransientDeliveryError("connection refused");
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep", 1));
  EXPECT_EQ(res.status, SubmissionStatus::ERRORED);
  EXPECT_EQ(res.error, "connection refused");
  EXPECT_GT(client.submits, 1);
}

TEST_F(OrchestratorTest, SubmitRetryAfterLostReply) {
  client.on_submit = [&](const ExecutionSpec& spec) -> ExecutionOutcome {
    if (client.submits == 1) throw TransientDeliveryError("read timeout");
    throw ConflictError("submission " + spec.submission_id + " already exists");
  };
  client.on_snapshot = [](const std::string& id) { return MakeCompleted(id, 0, "sorted", 1); };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::COMPLETED);
  EXPECT_EQ(client.submits, 2);
}

TEST_F(OrchestratorTest, ValidationErrorPropagates) {
  client.on_submit = [](const ExecutionSpec&) -> ExecutionOutcome {
    throw ValidationError("language must not be empty");
  };
  EXPECT_THROW(orchestrator.Run(MakeExecutionSpec("ep")), ValidationError);
  client.on_submit = [](const ExecutionSpec&) -> ExecutionOutcome {
    throw ConflictError("submission ep already exists");
  };
  EXPECT_THROW(orchestrator.Run(MakeExecutionSpec("ep")), ConflictError);
  EXPECT_EQ(client.cancels, 0);
}

TEST_F(OrchestratorTest, RunnerRefusesRuntime) {
  client.on_submit = [](const ExecutionSpec&) -> ExecutionOutcome {
    throw SandboxError("no runtime image for language cobol");
  };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::ERRORED);
  EXPECT_EQ(res.error, "no runtime image for language cobol");
}

TEST_F(OrchestratorTest, SubmissionVanishes) {
  client.on_snapshot = [](const std::string& id) { return ExecutionOutcome::NotFound(id); };
  auto res = orchestrator.Run(MakeExecutionSpec("ep"));
  EXPECT_EQ(res.status, SubmissionStatus::ERRORED);
  EXPECT_EQ(res.error, "submission not found");
  EXPECT_EQ(client.cancels, 0);
}

TEST(BackoffPolicyTest, Growth) {
  BackoffPolicy policy(100ms, 2.0, 350ms, 1s);
  EXPECT_EQ(policy.Initial(), 100ms);
  EXPECT_EQ(policy.Next(100ms), 200ms);
  EXPECT_EQ(policy.Next(200ms), 350ms);
  EXPECT_EQ(policy.Next(350ms), 350ms);
  EXPECT_EQ(policy.WithDeadline(3s).Deadline(), 3s);
  EXPECT_EQ(BackoffPolicy(500ms, 1.5, 100ms, 1s).Initial(), 100ms);
}

TEST(BackoffPolicyTest, RetryAttemptsAtLeastOnce) {
  int attempts = 0;
  BackoffPolicy policy(10ms, 1.5, 20ms, 0ms);
  EXPECT_FALSE(policy.Retry([&] { attempts++; return false; }));
  EXPECT_EQ(attempts, 1);
  attempts = 0;
  EXPECT_TRUE(BackoffPolicy(1ms, 2.0, 5ms, 1s).Retry([&] { return ++attempts == 4; }));
  EXPECT_EQ(attempts, 4);
}

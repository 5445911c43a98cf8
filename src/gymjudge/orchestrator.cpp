#include <gymjudge/orchestrator.h>

#include <spdlog/spdlog.h>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>

namespace {

const char kNotFoundMessage[] = "submission not found";

} // namespace

BackoffPolicy DefaultPollPolicy() {
  using namespace std::chrono_literals;
  // the deadline is replaced per run by time_limit_sec + grace
  return BackoffPolicy(500ms, 1.5, 2000ms, 15s);
}

ExecutionOutcome JudgeOrchestrator::Run(const ExecutionSpec& spec) {
  const std::string& id = spec.submission_id;
  auto deadline = Clock::now() + std::chrono::seconds(spec.time_limit_sec) + grace_;

  std::optional<ExecutionOutcome> reply;
  std::string transport_error;
  bool retried = false;
  try {
    poll_policy_.RetryUntil(deadline, [&]() {
      try {
        reply = client_.Submit(spec);
        return true;
      } catch (ConflictError&) {
        // an earlier attempt may have reached the runner even though its reply was lost
        if (!retried) throw;
        spdlog::info("Submission {} already accepted by an earlier attempt", id);
        reply = ExecutionOutcome(id, SubmissionStatus::QUEUED);
        return true;
      } catch (TransientDeliveryError& e) {
        spdlog::info("Submit of {} failed, retrying: {}", id, e.what());
        transport_error = e.what();
        retried = true;
        return false;
      }
    });
  } catch (SandboxError& e) {
    spdlog::warn("Runner refused submission {}: {}", id, e.what());
    return ExecutionOutcome::Errored(id, e.what());
  }
  if (!reply) {
    spdlog::warn("Giving up submitting {}: {}", id, transport_error);
    return ExecutionOutcome::Errored(id, transport_error);
  }
  if (reply->status == SubmissionStatus::NOT_FOUND) return ExecutionOutcome::Errored(id, kNotFoundMessage);
  if (reply->IsTerminal()) return *reply;
  return Await_(spec, deadline);
}

ExecutionOutcome JudgeOrchestrator::Await_(const ExecutionSpec& spec, Clock::time_point deadline) {
  const std::string& id = spec.submission_id;
  try {
    auto res = client_.Subscribe(id, deadline);
    if (Clock::now() >= deadline) return Expire_(id, "");
    if (res) {
      if (res->status == SubmissionStatus::NOT_FOUND) return ExecutionOutcome::Errored(id, kNotFoundMessage);
      if (res->IsTerminal()) return *res;
    }
    spdlog::debug("Stream of {} unavailable; polling", id);
  } catch (TransientDeliveryError& e) {
    spdlog::info("Stream of {} broke, polling instead: {}", id, e.what());
    if (Clock::now() >= deadline) return Expire_(id, e.what());
  }

  std::optional<ExecutionOutcome> result;
  std::string last_error;
  poll_policy_.RetryUntil(deadline, [&]() {
    try {
      auto snapshot = client_.Snapshot(id);
      last_error.clear();
      // answers arriving after the deadline are not accepted
      if (Clock::now() >= deadline) return false;
      if (snapshot.status == SubmissionStatus::NOT_FOUND) {
        result = ExecutionOutcome::Errored(id, kNotFoundMessage);
        return true;
      }
      if (snapshot.IsTerminal()) {
        result = std::move(snapshot);
        return true;
      }
      spdlog::debug("Submission {} is {}", id, StatusToAbr(snapshot.status));
    } catch (TransientDeliveryError& e) {
      spdlog::info("Poll of {} failed: {}", id, e.what());
      last_error = e.what();
    }
    return false;
  });
  if (result) return *result;
  return Expire_(id, last_error);
}

ExecutionOutcome JudgeOrchestrator::Expire_(const std::string& id, const std::string& transport_error) {
  spdlog::warn("Submission {} missed its deadline; cancelling", id);
  try {
    client_.Cancel(id);
  } catch (TransientDeliveryError& e) {
    spdlog::warn("Cancel of {} failed: {}", id, e.what());
  }
  if (!transport_error.empty()) return ExecutionOutcome::Errored(id, transport_error);
  return ExecutionOutcome::TimedOut(id, kTimedOutMessage);
}

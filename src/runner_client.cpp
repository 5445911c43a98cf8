#include "runner_client.h"

#include <mutex>
#include <condition_variable>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>

#include "websocket.h"
#include "http_utils.h"

namespace {

constexpr std::chrono::seconds kConnectTimeout(3);
constexpr std::chrono::seconds kReadTimeout(10);

void SetupClient(httplib::Client& cli) {
  cli.set_connection_timeout(kConnectTimeout);
  cli.set_read_timeout(kReadTimeout);
  cli.set_write_timeout(kReadTimeout);
}

std::string SolutionPath(const std::string& id) {
  return "/solutions/" + httplib::detail::encode_url(id);
}

std::string ErrorMessage(const httplib::Result& res) {
  try {
    auto body = nlohmann::json::parse(res->body);
    if (body.contains("error")) return body["error"].get<std::string>();
  } catch (nlohmann::json::exception&) {}
  return DescribeResult(res);
}

ExecutionOutcome ParseReply(const httplib::Result& res) {
  try {
    return ParseSnapshot(nlohmann::json::parse(res->body));
  } catch (nlohmann::json::exception& e) {
    throw TransientDeliveryError(std::string("malformed reply: ") + e.what());
  }
}

// Collects snapshots until a terminal one arrives or the connection ends
class SnapshotSubscriber : public WsClient {
  std::mutex mtx_;
  std::condition_variable cv_;
  bool opened_ = false, ended_ = false;
  std::optional<ExecutionOutcome> last_;
  std::string error_;

  bool IsFinal_() const {
    return last_ && (last_->IsTerminal() || last_->status == SubmissionStatus::NOT_FOUND);
  }
  void End_() {
    std::lock_guard lck(mtx_);
    ended_ = true;
    cv_.notify_all();
  }

 public:
  using WsClient::WsClient;
  ~SnapshotSubscriber() { Shutdown(); }

  void OnOpen() override {
    std::lock_guard lck(mtx_);
    opened_ = true;
  }
  void OnFail() override { End_(); }
  void OnClose() override { End_(); }
  void OnMessage(const std::string& msg) override {
    std::lock_guard lck(mtx_);
    try {
      last_ = ParseSnapshot(nlohmann::json::parse(msg));
    } catch (nlohmann::json::exception& e) {
      error_ = e.what();
    } catch (TransientDeliveryError& e) {
      error_ = e.what();
    }
    if (IsFinal_()) cv_.notify_all();
  }

  // nullopt: stream never opened or deadline passed
  std::optional<ExecutionOutcome> Await(RunnerClient::Clock::time_point deadline) {
    std::unique_lock lck(mtx_);
    cv_.wait_until(lck, deadline, [this]{ return ended_ || IsFinal_(); });
    if (IsFinal_()) return last_;
    if (!ended_) return std::nullopt;
    if (!opened_) return std::nullopt;
    throw TransientDeliveryError(error_.empty() ? "stream closed before a terminal snapshot" : error_);
  }
};

} // namespace

HttpRunnerClient::HttpRunnerClient(const std::string& runner_url, const std::string& ws_url,
                                   BackoffPolicy health_policy) :
    runner_url_(runner_url), ws_url_(ws_url), health_policy_(health_policy) {}

bool HttpRunnerClient::Health() {
  httplib::Client cli(runner_url_);
  SetupClient(cli);
  auto res = RunnerRequestRetry<GetMethod>(health_policy_, cli, "/health");
  if (!IsSuccess(res)) {
    spdlog::warn("Runner {} is not healthy: {}", runner_url_, DescribeResult(res));
    return false;
  }
  spdlog::info("Runner {} is healthy", runner_url_);
  return true;
}

ExecutionOutcome HttpRunnerClient::Submit(const ExecutionSpec& spec) {
  httplib::Client cli(runner_url_);
  SetupClient(cli);
  std::string body = ExecutionSpecJSON(spec).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto res = RunnerRequest<PostMethod>(cli, "/solutions", &body);
  if (!res) throw TransientDeliveryError(DescribeResult(res));
  switch (res->status) {
    case 200: [[fallthrough]];
    case 202: return ExecutionOutcome(spec.submission_id, SubmissionStatus::QUEUED);
    case 400: throw ValidationError(ErrorMessage(res));
    case 409: throw ConflictError(ErrorMessage(res));
    case 503: throw SandboxError(ErrorMessage(res));
  }
  throw TransientDeliveryError("submit: " + ErrorMessage(res));
}

ExecutionOutcome HttpRunnerClient::Snapshot(const std::string& id) {
  httplib::Client cli(runner_url_);
  SetupClient(cli);
  auto res = RunnerRequest<GetMethod>(cli, SolutionPath(id));
  if (!res) throw TransientDeliveryError(DescribeResult(res));
  if (res->status == 404) return ExecutionOutcome::NotFound(id);
  if (res->status != 200) throw TransientDeliveryError("snapshot: " + ErrorMessage(res));
  return ParseReply(res);
}

std::optional<ExecutionOutcome> HttpRunnerClient::Subscribe(const std::string& id, Clock::time_point deadline) {
  if (ws_url_.empty()) return std::nullopt;
  SnapshotSubscriber sub(ws_url_ + "/ws/solutions/" + httplib::detail::encode_url(id));
  if (!sub.Connect()) {
    spdlog::info("Cannot open stream {}", ws_url_);
    return std::nullopt;
  }
  return sub.Await(deadline);
}

ExecutionOutcome HttpRunnerClient::Cancel(const std::string& id) {
  httplib::Client cli(runner_url_);
  SetupClient(cli);
  auto res = RunnerRequest<DeleteMethod>(cli, SolutionPath(id));
  if (!res) throw TransientDeliveryError(DescribeResult(res));
  if (res->status == 404) return ExecutionOutcome::NotFound(id);
  if (res->status != 200) throw TransientDeliveryError("cancel: " + ErrorMessage(res));
  return ParseReply(res);
}

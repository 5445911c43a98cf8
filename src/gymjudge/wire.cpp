#include <gymjudge/utils.h>

#include <nlohmann/json.hpp>
#include <gymjudge/errors.h>

nlohmann::json SnapshotJSON(const ExecutionOutcome& outcome) {
  nlohmann::json ret = {
    {"submission_id", outcome.submission_id},
    {"status", StatusToAbr(outcome.status)},
  };
  if (outcome.IsTerminal()) {
    ret["exit_code"] = outcome.exit_code;
    ret["logs"] = outcome.logs;
    ret["execution_time_ms"] = outcome.execution_time_ms;
  }
  if (!outcome.error.empty()) ret["error"] = outcome.error;
  return ret;
}

ExecutionOutcome ParseSnapshot(const nlohmann::json& body) {
  ExecutionOutcome ret;
  try {
    ret.submission_id = body.value("submission_id", std::string());
    ret.status = AbrToStatus(body.at("status").get<std::string>());
    ret.exit_code = body.value("exit_code", -1);
    ret.logs = body.value("logs", std::string());
    ret.execution_time_ms = body.value("execution_time_ms", 0.0);
    ret.error = body.value("error", std::string());
  } catch (nlohmann::json::exception& e) {
    throw TransientDeliveryError(std::string("malformed snapshot: ") + e.what());
  }
  return ret;
}

nlohmann::json ExecutionSpecJSON(const ExecutionSpec& spec) {
  return {
    {"submission_id", spec.submission_id},
    {"code", spec.code},
    {"language", spec.language},
    {"memory_limit_mb", spec.memory_limit_mb},
    {"time_limit_sec", spec.time_limit_sec},
    {"network_disabled", spec.network_disabled},
  };
}

long LimitField(const nlohmann::json& body, const char* key, long def, long max) {
  auto it = body.find(key);
  if (it == body.end()) return def;
  if (!it->is_number_integer()) throw ValidationError(std::string(key) + " must be an integer");
  // unsigned values above the signed range would wrap in get<long>()
  if ((it->is_number_unsigned() && it->get<unsigned long>() > (unsigned long)max) ||
      it->get<long>() < 1 || it->get<long>() > max) {
    throw ValidationError(std::string(key) + " must be between 1 and " + std::to_string(max));
  }
  return it->get<long>();
}

ExecutionSpec ParseExecutionSpec(const nlohmann::json& body) {
  if (!body.is_object()) throw ValidationError("request body must be an object");
  ExecutionSpec ret;
  try {
    ret.submission_id = body.at("submission_id").get<std::string>();
    ret.code = body.at("code").get<std::string>();
    ret.language = body.at("language").get<std::string>();
    ret.memory_limit_mb = LimitField(body, "memory_limit_mb", ret.memory_limit_mb, kMaxMemoryLimitMb);
    ret.time_limit_sec = LimitField(body, "time_limit_sec", ret.time_limit_sec, kMaxTimeLimitSec);
    ret.network_disabled = body.value("network_disabled", ret.network_disabled);
  } catch (nlohmann::json::exception& e) {
    throw ValidationError(std::string("malformed submission: ") + e.what());
  }
  return ret;
}

nlohmann::json JudgeResultJSON(const JudgeResult& result) {
  nlohmann::json feedback = nlohmann::json::array();
  for (auto& i : result.feedback) {
    feedback.push_back({
      {"source", i.source},
      {"rating", i.rating},
      {"rationale", i.rationale},
      {"rubric_section", i.rubric_section},
    });
  }
  return {
    {"episode_id", result.episode_id},
    {"task_id", result.task_id},
    {"success", result.success},
    {"score", result.score},
    {"metrics", result.metrics},
    {"feedback", feedback},
  };
}

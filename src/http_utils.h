#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

#include <string>
#include <optional>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <gymjudge/backoff.h>

// 2xx reply
bool IsSuccess(const httplib::Result& res);
// Transport error or status, for error messages
std::string DescribeResult(const httplib::Result& res);

// Method tags for RunnerRequest; a body is only sent by POST
struct GetMethod {
  static constexpr char kName[] = "GET";
  static httplib::Result Send(httplib::Client& cli, const std::string& path, const std::string*) {
    return cli.Get(path.c_str());
  }
};
struct PostMethod {
  static constexpr char kName[] = "POST";
  static httplib::Result Send(httplib::Client& cli, const std::string& path, const std::string* body) {
    return cli.Post(path.c_str(), body ? *body : std::string(), "application/json");
  }
};
struct DeleteMethod {
  static constexpr char kName[] = "DELETE";
  static httplib::Result Send(httplib::Client& cli, const std::string& path, const std::string*) {
    return cli.Delete(path.c_str());
  }
};

template <class Method>
httplib::Result RunnerRequest(httplib::Client& cli, const std::string& path,
                              const std::string* body = nullptr) {
  auto res = Method::Send(cli, path, body);
  spdlog::debug("{} {} ({} bytes): {}", Method::kName, path, body ? body->size() : 0,
                DescribeResult(res));
  return res;
}

// Repeats the request under the policy until it gets a 2xx reply.
// Returns the last reply.
template <class Method>
httplib::Result RunnerRequestRetry(const BackoffPolicy& policy, httplib::Client& cli,
                                   const std::string& path, const std::string* body = nullptr) {
  std::optional<httplib::Result> last;
  int attempts = 0;
  bool ok = policy.Retry([&]() {
    attempts++;
    last.emplace(RunnerRequest<Method>(cli, path, body));
    return IsSuccess(*last);
  });
  if (!ok) {
    spdlog::warn("{} {} still failing after {} attempts: {}", Method::kName, path, attempts,
                 DescribeResult(*last));
  }
  return std::move(*last);
}

#endif  // HTTP_UTILS_H_

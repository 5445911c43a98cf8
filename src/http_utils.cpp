#include "http_utils.h"

bool IsSuccess(const httplib::Result& res) {
  return res && res->status / 100 == 2;
}

std::string DescribeResult(const httplib::Result& res) {
  if (!res) return "transport error: " + httplib::to_string(res.error());
  return "HTTP status " + std::to_string(res->status);
}

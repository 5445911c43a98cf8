#include "utils.h"

#include <atomic>
#include <cctype>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <gymjudge/errors.h>

namespace {

std::atomic_long sandbox_id_seq = 0;

} // namespace

long GetUniqueSandboxId() {
  return ++sandbox_id_seq;
}

const char kTimedOutMessage[] = "execution timed out";
const char kCancelledMessage[] = "cancelled";

static const char* kStatusAbrTable[] = {
#define X(name, abr) abr,
  ENUM_SUBMISSION_STATUS_
#undef X
};

const char* StatusToAbr(SubmissionStatus status) {
  return kStatusAbrTable[(int)status];
}

SubmissionStatus AbrToStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kStatusAbrTable) / sizeof(kStatusAbrTable[0]); i++) {
    if (str == kStatusAbrTable[i]) return (SubmissionStatus)i;
  }
  return SubmissionStatus::NOT_FOUND;
}

static const char* kRubricKindNameTable[] = {
#define X(name, abr) abr,
  ENUM_RUBRIC_KIND_
#undef X
};

RubricKind GetRubricKind(const std::string& str) {
  for (size_t i = 0; i < sizeof(kRubricKindNameTable) / sizeof(kRubricKindNameTable[0]); i++) {
    if (str == kRubricKindNameTable[i]) return (RubricKind)i;
  }
  throw ValidationError("unknown rubric kind: " + str);
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool ReadFileHead(const fs::path& path, size_t max_bytes, std::string& content, bool& truncated) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed opening {}", path.c_str());
    return false;
  }
  content.assign(max_bytes, '\0');
  fin.read(content.data(), max_bytes);
  content.resize(fin.gcount());
  truncated = fin.peek() != std::ifstream::traits_type::eof();
  return true;
}

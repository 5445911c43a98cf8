#include "paths.h"

#include <string>

fs::path kBoxRoot = "/tmp/gymjudge_box";

namespace internal {
fs::path kDataDir = fs::path(GYMJUDGE_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SandboxRunPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}
fs::path SandboxBoxPath(long id) {
  return SandboxRunPath(id) / "box";
}
fs::path SandboxProgram(long id, const std::string& filename, bool inside_box) {
  return Workdir(BoxRoot(SandboxBoxPath(id), inside_box)) / filename;
}
fs::path SandboxLog(long id) {
  return SandboxRunPath(id) / "log";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

#include <gymjudge/cjail_backend.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <thread>

#include <spdlog/spdlog.h>
#include <gymjudge/errors.h>
#include "paths.h"
#include "utils.h"
#include "sandbox_exec.h"

long kMaxLogKiB = 1024;
long kKillGraceMs = 500;

namespace {

constexpr int kUidBase = 50000, kUidPoolSize = 100;
constexpr int kProcLimit = 32;
constexpr int kFileLimit = 64;

const std::vector<RuntimeImage> kRuntimeImages = {
  {"python", "prog.py", "/usr/bin/python3", {"/usr/bin/python3", "-B", "/workdir/prog.py"}},
  {"markdown", "prog.md", "/bin/cat", {"/bin/cat", "/workdir/prog.md"}},
  {"json", "prog.json", "/usr/bin/python3", {"/usr/bin/python3", "-m", "json.tool", "/workdir/prog.json"}},
};

inline double ToMs(const struct timeval& v) {
  return v.tv_sec * 1000.0 + v.tv_usec / 1000.0;
}

int ExitCode(const siginfo_t& info) {
  if (info.si_code == CLD_EXITED) return info.si_status;
  return 128 + info.si_status;
}

} // namespace

const RuntimeImage* FindRuntimeImage(const std::string& language) {
  for (auto& i : kRuntimeImages) {
    if (i.language == language) return &i;
  }
  return nullptr;
}

CJailBackend::CJailBackend() {
  for (int i = 0; i < kUidPoolSize; i++) uid_pool_.push_back(i + kUidBase);
}

bool CJailBackend::AcquireUid_(int& uid) {
  std::lock_guard lck(mtx_);
  if (uid_pool_.empty()) return false;
  uid = uid_pool_.back();
  uid_pool_.pop_back();
  return true;
}

void CJailBackend::ReleaseUid_(int uid) {
  std::lock_guard lck(mtx_);
  uid_pool_.push_back(uid);
}

bool CJailBackend::HasImage(const std::string& language) const {
  auto image = FindRuntimeImage(language);
  if (!image) return false;
  std::error_code ec;
  return fs::exists(image->interpreter, ec);
}

bool CJailBackend::PrepareBox_(long id, const RuntimeImage& image, const ExecutionSpec& spec, int uid) {
  auto workdir = Workdir(SandboxBoxPath(id));
  if (!CreateDirs(workdir, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec)) {
    return false;
  }
  if (!WriteFile(SandboxProgram(id, image.program), spec.code,
                 fs::perms::owner_read | fs::perms::owner_write |
                 fs::perms::group_read | fs::perms::others_read)) {
    return false;
  }
  // the workdir is the only place the program may write to
  if (chown(workdir.c_str(), uid, uid) < 0) {
    spdlog::warn("Failed chown {}: {}", workdir.c_str(), strerror(errno));
    return false;
  }
  return true;
}

SandboxHandle CJailBackend::Start(const ExecutionSpec& spec) {
  auto image = FindRuntimeImage(spec.language);
  if (!image) throw SandboxError("no runtime image for language " + spec.language);
  int uid;
  if (!AcquireUid_(uid)) throw SandboxError("too many running sandboxes");
  long id = GetUniqueSandboxId();
  spdlog::debug("Preparing sandbox {} for {}: uid={}", id, spec.submission_id, uid);

  int log_fd = -1;
  SandboxProcess proc;
  SandboxOptions opt;
  if (!PrepareBox_(id, *image, spec, uid)) goto err;
  log_fd = open(SandboxLog(id).c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (log_fd < 0) {
    spdlog::warn("Failed opening log of sandbox {}: {}", id, strerror(errno));
    goto err;
  }
  opt.boxdir = SandboxBoxPath(id);
  opt.command = image->command;
  opt.envs = {"PATH=/usr/bin:/bin", "HOME=/workdir", "LANG=C.UTF-8"};
  opt.workdir = Workdir("/");
  opt.fd_output = opt.fd_error = kHelperLogFd;
  opt.uid = opt.gid = uid;
  // backstop only; the manager enforces the limit
  opt.wall_time = (static_cast<long>(spec.time_limit_sec) + 1) * 1'000'000L;
  opt.fsize = kMaxLogKiB;
  // the log is accounted in the cgroup
  opt.rss = spec.memory_limit_mb * 1024 + opt.fsize;
  opt.proc_num = kProcLimit;
  opt.file_num = kFileLimit;
  opt.share_net = !spec.network_disabled;
  opt.dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  opt.FilterDirs();
  if (!SpawnSandboxExec(opt, log_fd, proc)) goto err;
  close(log_fd);
  {
    std::lock_guard lck(mtx_);
    procs_[id] = {proc.pid, proc.result_fd, uid};
  }
  spdlog::info("Sandbox {} started for {}: pid={} language={}", id, spec.submission_id,
               proc.pid, spec.language);
  return SandboxHandle{id};
err:
  if (log_fd >= 0) close(log_fd);
  ReleaseUid_(uid);
  RemoveAll(SandboxRunPath(id));
  throw SandboxError("failed to create sandbox for " + spec.submission_id);
}

RunResult CJailBackend::Wait(const SandboxHandle& handle, Clock::time_point deadline) {
  int fd;
  {
    std::lock_guard lck(mtx_);
    auto it = procs_.find(handle.id);
    if (it == procs_.end()) throw SandboxError("unknown sandbox");
    fd = it->second.result_fd;
  }
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) throw TimeoutError(kTimedOutMessage);
    struct pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, remaining.count());
    if (ret < 0) {
      if (errno == EINTR) continue;
      throw SandboxError(std::string("poll: ") + strerror(errno));
    }
    if (ret > 0) break;
  }
  struct cjail_result res = {};
  if (!ReadSandboxResult(fd, res)) {
    throw SandboxError("sandbox terminated without a result");
  }
  if (res.timekill == -1) {
    spdlog::warn("cjail_exec error in sandbox {}: errno={} {}", handle.id, res.oomkill, strerror(res.oomkill));
    throw SandboxError(std::string("cjail_exec: ") + strerror(res.oomkill));
  }
  if (res.timekill) throw TimeoutError(kTimedOutMessage);

  RunResult ret;
  ret.exit_code = ExitCode(res.info);
  ret.execution_time_ms = ToMs(res.time);
  bool truncated = false;
  if (!ReadFileHead(SandboxLog(handle.id), kMaxLogKiB * 1024, ret.logs, truncated)) {
    throw SandboxError("cannot read sandbox output");
  }
  if (truncated) ret.logs += "\n[output truncated]";
  if (res.oomkill) ret.logs += "\n[killed: memory limit exceeded]";
  spdlog::debug("Sandbox {} finished: exit_code={} time={}ms", handle.id, ret.exit_code,
                ret.execution_time_ms);
  return ret;
}

void CJailBackend::Kill(const SandboxHandle& handle) {
  std::lock_guard lck(mtx_);
  auto it = procs_.find(handle.id);
  if (it == procs_.end()) return;
  spdlog::debug("Killing sandbox {} (pgid {})", handle.id, it->second.pid);
  kill(-it->second.pid, SIGKILL);
}

void CJailBackend::Release(const SandboxHandle& handle) noexcept {
  Process proc;
  {
    std::lock_guard lck(mtx_);
    auto it = procs_.find(handle.id);
    if (it == procs_.end()) return;
    proc = it->second;
    procs_.erase(it);
  }
  auto give_up = Clock::now() + std::chrono::milliseconds(kKillGraceMs);
  while (true) {
    pid_t ret = waitpid(proc.pid, nullptr, WNOHANG);
    if (ret == proc.pid || (ret < 0 && errno != EINTR)) break;
    if (Clock::now() >= give_up) {
      spdlog::warn("Sandbox {} still alive after {}ms; forcing", handle.id, kKillGraceMs);
      kill(-proc.pid, SIGKILL);
      waitpid(proc.pid, nullptr, 0);
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  close(proc.result_fd);
  ReleaseUid_(proc.uid);
  RemoveAll(SandboxRunPath(handle.id));
  spdlog::debug("Sandbox {} released", handle.id);
}

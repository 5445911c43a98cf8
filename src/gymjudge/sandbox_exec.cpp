#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"

namespace {

bool WriteAll(int fd, const void* buf, size_t size) {
  const char* ptr = static_cast<const char*>(buf);
  while (size) {
    ssize_t n = write(fd, ptr, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += n;
    size -= n;
  }
  return true;
}

} // namespace

bool SpawnSandboxExec(const SandboxOptions& opt, int log_fd, SandboxProcess& proc) {
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  auto cmd = SandboxExecPath();
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    setpgid(0, 0);
    // dup2 clears FD_CLOEXEC on the target
    if (dup2(outpipe[0], 0) < 0 || dup2(inpipe[1], 1) < 0 || dup2(log_fd, kHelperLogFd) < 0) _exit(1);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  // also set from the parent so Kill never races the child's own setpgid
  setpgid(pid, pid);
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("sandbox-exec started: pid={} boxdir={} command={}",
                pid, opt.boxdir, fmt::format("{}", opt.command));
  {
    auto vec = opt.Serialize();
    long size = vec.size();
    if (!WriteAll(outpipe[1], &size, sizeof(size)) || !WriteAll(outpipe[1], vec.data(), vec.size())) {
      int saved = errno;
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      close(inpipe[0]);
      close(outpipe[1]);
      spdlog::warn("Failed sending options to sandbox-exec: {}", strerror(saved));
      return false;
    }
  }
  close(outpipe[1]);
  proc.pid = pid;
  proc.result_fd = inpipe[0];
  return true;
err:
  spdlog::warn("SpawnSandboxExec error: errno={} {}", errno, strerror(errno));
  for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
    if (fd >= 0) close(fd);
  }
  return false;
}

bool ReadSandboxResult(int fd, struct cjail_result& res) {
  char* ptr = reinterpret_cast<char*>(&res);
  size_t remaining = sizeof(res);
  while (remaining) {
    ssize_t n = read(fd, ptr, remaining);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    remaining -= n;
  }
  return true;
}

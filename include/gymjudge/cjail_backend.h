#ifndef INCLUDE_GYMJUDGE_CJAIL_BACKEND_H_
#define INCLUDE_GYMJUDGE_CJAIL_BACKEND_H_

#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>
#include <sys/types.h>

#include <gymjudge/sandbox.h>

// KiB of stdout+stderr kept per run
extern long kMaxLogKiB;
// How long Release waits for a killed runtime before forcing it again
extern long kKillGraceMs;

// Static language -> runtime mapping
struct RuntimeImage {
  std::string language;
  std::string program; // file name of the artifact inside the workdir
  std::string interpreter; // host path; the image is unusable if it is missing
  std::vector<std::string> command;
};

const RuntimeImage* FindRuntimeImage(const std::string& language);

// Runs each submission in a cjail jail (chroot + namespaces + cgroup memory limit)
//  through the sandbox-exec helper. Requires root.
class CJailBackend : public SandboxBackend {
  struct Process {
    pid_t pid;
    int result_fd;
    int uid;
  };

  std::mutex mtx_;
  std::unordered_map<long, Process> procs_;
  std::vector<int> uid_pool_;

  bool AcquireUid_(int& uid);
  void ReleaseUid_(int uid);
  bool PrepareBox_(long id, const RuntimeImage& image, const ExecutionSpec& spec, int uid);

 public:
  CJailBackend();

  bool HasImage(const std::string& language) const override;
  SandboxHandle Start(const ExecutionSpec&) override;
  RunResult Wait(const SandboxHandle&, Clock::time_point deadline) override;
  void Kill(const SandboxHandle&) override;
  void Release(const SandboxHandle&) noexcept override;
};

#endif  // INCLUDE_GYMJUDGE_CJAIL_BACKEND_H_

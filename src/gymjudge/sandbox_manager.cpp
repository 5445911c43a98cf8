#include <gymjudge/sandbox.h>

#include <thread>

#include <spdlog/spdlog.h>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>

void ValidateExecutionSpec(const ExecutionSpec& spec) {
  if (spec.submission_id.empty()) throw ValidationError("submission_id must not be empty");
  if (spec.submission_id.find('/') != std::string::npos) {
    throw ValidationError("submission_id must not contain '/'");
  }
  if (spec.language.empty()) throw ValidationError("language must not be empty");
  if (spec.time_limit_sec <= 0 || spec.time_limit_sec > kMaxTimeLimitSec) {
    throw ValidationError("time_limit_sec must be between 1 and " + std::to_string(kMaxTimeLimitSec));
  }
  if (spec.memory_limit_mb <= 0 || spec.memory_limit_mb > kMaxMemoryLimitMb) {
    throw ValidationError("memory_limit_mb must be between 1 and " + std::to_string(kMaxMemoryLimitMb));
  }
}

SandboxManager::SandboxManager(SubmissionTracker& tracker, SandboxBackend& backend, int max_parallel) :
    tracker_(tracker), backend_(backend), max_parallel_(max_parallel),
    running_(0), monitors_(0), stopping_(false) {}

SandboxManager::~SandboxManager() {
  std::unique_lock lck(mtx_);
  stopping_ = true;
  for (auto& i : live_) backend_.Kill(i.second);
  cv_.notify_all();
  cv_.wait(lck, [this]{ return monitors_ == 0; });
}

std::string SandboxManager::Start(const ExecutionSpec& spec) {
  ValidateExecutionSpec(spec);
  if (!backend_.HasImage(spec.language)) {
    spdlog::warn("No runtime image for language {} (submission {})", spec.language, spec.submission_id);
    throw SandboxError("no runtime image for language " + spec.language);
  }
  {
    std::lock_guard lck(mtx_);
    if (stopping_) throw SandboxError("sandbox manager is shutting down");
  }
  if (!tracker_.Put(spec)) {
    throw ConflictError("submission " + spec.submission_id + " already exists");
  }
  {
    std::lock_guard lck(mtx_);
    monitors_++;
  }
  try {
    std::thread(&SandboxManager::Monitor_, this, spec.submission_id).detach();
  } catch (std::system_error& e) {
    spdlog::error("Failed to start monitor of {}: {}", spec.submission_id, e.what());
    tracker_.Update(spec.submission_id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::ERRORED;
      state.error = std::string("failed to start monitor: ") + e.what();
    });
    std::lock_guard lck(mtx_);
    monitors_--;
    cv_.notify_all();
  }
  spdlog::info("Submission {} accepted: language={} time_limit={}s memory={}MiB network={}",
               spec.submission_id, spec.language, spec.time_limit_sec, spec.memory_limit_mb,
               !spec.network_disabled);
  return spec.submission_id;
}

ExecutionOutcome SandboxManager::Stop(const std::string& id) {
  bool cancelled = tracker_.Update(id, [](ExecutionOutcome& state) {
    state.status = SubmissionStatus::ERRORED;
    state.error = kCancelledMessage;
  });
  if (cancelled) {
    spdlog::info("Submission {} cancelled", id);
    std::lock_guard lck(mtx_);
    if (auto it = live_.find(id); it != live_.end()) backend_.Kill(it->second);
    // wake a monitor still waiting for a slot
    cv_.notify_all();
  }
  auto snapshot = tracker_.Get(id);
  if (!snapshot) return ExecutionOutcome::NotFound(id);
  return *snapshot;
}

int SandboxManager::RunningCount() {
  std::lock_guard lck(mtx_);
  return running_;
}

bool SandboxManager::AcquireSlot_(const std::string& id) {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [&]{
    if (stopping_) return true;
    if (max_parallel_ <= 0 || running_ < max_parallel_) return true;
    auto state = tracker_.Get(id);
    return !state || state->IsTerminal();
  });
  if (stopping_) return false;
  if (auto state = tracker_.Get(id); !state || state->IsTerminal()) return false;
  running_++;
  return true;
}

void SandboxManager::ReleaseSlot_() {
  std::lock_guard lck(mtx_);
  running_--;
  cv_.notify_all();
}

void SandboxManager::Execute_(const ExecutionSpec& spec) {
  const std::string& id = spec.submission_id;
  std::unique_ptr<ScopedSandbox> box;
  try {
    box = std::make_unique<ScopedSandbox>(backend_, spec);
  } catch (SandboxError& e) {
    spdlog::warn("Failed to create sandbox for {}: {}", id, e.what());
    tracker_.Update(id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::ERRORED;
      state.error = e.what();
    });
    return;
  }
  // live_ must not outlive the box; this guard is destroyed first
  struct LiveGuard {
    SandboxManager& self;
    const std::string& id;
    ~LiveGuard() {
      std::lock_guard lck(self.mtx_);
      self.live_.erase(id);
    }
  };
  {
    std::lock_guard lck(mtx_);
    live_.emplace(id, box->Handle());
  }
  LiveGuard live_guard{*this, id};
  auto start = Clock::now();
  bool running = tracker_.Update(id, [](ExecutionOutcome& state) {
    state.status = SubmissionStatus::RUNNING;
  });
  {
    std::lock_guard lck(mtx_);
    if (!running || stopping_) {
      // cancelled before the runtime came up
      backend_.Kill(box->Handle());
      return;
    }
  }
  auto deadline = start + std::chrono::seconds(spec.time_limit_sec);
  try {
    RunResult result = backend_.Wait(box->Handle(), deadline);
    tracker_.Update(id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::COMPLETED;
      state.exit_code = result.exit_code;
      state.logs = std::move(result.logs);
      state.execution_time_ms = result.execution_time_ms;
    });
  } catch (TimeoutError&) {
    spdlog::info("Submission {} exceeded {}s; killing", id, spec.time_limit_sec);
    backend_.Kill(box->Handle());
    tracker_.Update(id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::TIMED_OUT;
      state.error = kTimedOutMessage;
      state.execution_time_ms =
          std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    });
  } catch (SandboxError& e) {
    spdlog::warn("Sandbox of {} failed: {}", id, e.what());
    tracker_.Update(id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::ERRORED;
      state.error = e.what();
    });
  }
}

void SandboxManager::Monitor_(const std::string& id) {
  spdlog::debug("Monitor of {} started", id);
  try {
    if (AcquireSlot_(id)) {
      struct SlotGuard {
        SandboxManager& self;
        ~SlotGuard() { self.ReleaseSlot_(); }
      } slot_guard{*this};
      if (auto spec = tracker_.GetSpec(id)) Execute_(*spec);
    } else {
      tracker_.Update(id, [](ExecutionOutcome& state) {
        state.status = SubmissionStatus::ERRORED;
        state.error = kCancelledMessage;
      });
    }
  } catch (std::exception& e) {
    spdlog::error("Monitor of {} failed: {}", id, e.what());
    tracker_.Update(id, [&](ExecutionOutcome& state) {
      state.status = SubmissionStatus::ERRORED;
      state.error = e.what();
    });
  }
  spdlog::debug("Monitor of {} finished", id);
  std::lock_guard lck(mtx_);
  monitors_--;
  cv_.notify_all();
}

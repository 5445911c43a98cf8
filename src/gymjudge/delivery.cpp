#include <gymjudge/delivery.h>

#include <thread>

#include <spdlog/spdlog.h>

namespace {

class SubscriberPin {
  SubmissionTracker& tracker_;
  const std::string& id_;
  bool pinned_;
 public:
  SubscriberPin(SubmissionTracker& tracker, const std::string& id) :
      tracker_(tracker), id_(id), pinned_(tracker.AddSubscriber(id)) {}
  ~SubscriberPin() {
    if (pinned_) tracker_.RemoveSubscriber(id_);
  }
};

} // namespace

int WatchSubmission(SubmissionTracker& tracker, const std::string& id,
                    const std::function<bool(const ExecutionOutcome&)>& emit,
                    std::chrono::milliseconds interval,
                    const std::function<bool()>& alive) {
  SubscriberPin pin(tracker, id);
  int emitted = 0;
  auto snapshot = tracker.Get(id);
  if (!snapshot) {
    spdlog::debug("Watch of unknown submission {}", id);
    emit(ExecutionOutcome::NotFound(id));
    return 1;
  }
  emitted++;
  if (!emit(*snapshot) || snapshot->IsTerminal()) return emitted;
  while (true) {
    std::this_thread::sleep_for(interval);
    if (alive && !alive()) {
      spdlog::debug("Watcher of {} went away", id);
      return emitted;
    }
    auto current = tracker.Get(id);
    if (!current) {
      emit(ExecutionOutcome::NotFound(id));
      return emitted + 1;
    }
    if (current->IsTerminal()) {
      emit(*current);
      return emitted + 1;
    }
  }
}

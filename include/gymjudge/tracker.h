#ifndef INCLUDE_GYMJUDGE_TRACKER_H_
#define INCLUDE_GYMJUDGE_TRACKER_H_

#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <unordered_map>

#include <gymjudge/submission.h>

bool IsValidTransition(SubmissionStatus from, SubmissionStatus to);

// Concurrency-safe id -> state store. The map lock is only held to find a record;
//  each record has its own lock, so unrelated submissions never serialize.
class SubmissionTracker {
 public:
  using Clock = std::chrono::steady_clock;
  using Mutator = std::function<void(ExecutionOutcome&)>;

 private:
  struct Record {
    std::mutex mtx;
    ExecutionSpec spec;
    ExecutionOutcome state;
    Clock::time_point terminal_at;
    int subscribers = 0;
  };

  mutable std::shared_mutex map_mtx_;
  std::unordered_map<std::string, std::shared_ptr<Record>> records_;

  std::shared_ptr<Record> Find_(const std::string& id) const;

 public:
  // Returns false if id is already tracked (conflict); the existing record is untouched.
  // The initial state must be QUEUED.
  bool Put(const ExecutionSpec& spec);

  std::optional<ExecutionOutcome> Get(const std::string& id) const;
  std::optional<ExecutionSpec> GetSpec(const std::string& id) const;

  // Applies the mutator to a copy of the current state and commits it only if the
  //  record exists, is non-terminal, and the resulting status is a valid transition.
  // Returns whether the update was committed.
  bool Update(const std::string& id, const Mutator& mutator);

  // Removes a record; safe to call multiple times
  void Evict(const std::string& id);
  // Removes terminal records older than retention that nobody is subscribed to
  size_t EvictExpired(Clock::duration retention);

  // Subscribers pin a record against expiry
  bool AddSubscriber(const std::string& id);
  void RemoveSubscriber(const std::string& id);

  size_t Size() const;
  std::vector<std::string> ActiveIds() const; // non-terminal ids
};

#endif  // INCLUDE_GYMJUDGE_TRACKER_H_

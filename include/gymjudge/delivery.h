#ifndef INCLUDE_GYMJUDGE_DELIVERY_H_
#define INCLUDE_GYMJUDGE_DELIVERY_H_

#include <chrono>
#include <string>
#include <functional>

#include <gymjudge/tracker.h>

constexpr std::chrono::milliseconds kWatchInterval(100);

// Snapshot stream over the tracker, independent of the execution task.
// Emits the current snapshot immediately, then re-checks every interval and emits
//  once more when the state becomes terminal. Unknown (or evicted) ids emit NOT_FOUND.
// emit returns false if the consumer has gone away, which ends the watch; so does
//  alive (asked before every re-check) returning false.
// Returns the number of snapshots emitted.
int WatchSubmission(SubmissionTracker& tracker, const std::string& id,
                    const std::function<bool(const ExecutionOutcome&)>& emit,
                    std::chrono::milliseconds interval = kWatchInterval,
                    const std::function<bool()>& alive = nullptr);

#endif  // INCLUDE_GYMJUDGE_DELIVERY_H_

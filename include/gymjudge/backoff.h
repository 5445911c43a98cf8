#ifndef INCLUDE_GYMJUDGE_BACKOFF_H_
#define INCLUDE_GYMJUDGE_BACKOFF_H_

#include <chrono>
#include <thread>
#include <algorithm>

// Retry interval growth bounded by a cap, and an overall deadline
class BackoffPolicy {
 public:
  using Clock = std::chrono::steady_clock;
  using Duration = std::chrono::milliseconds;

 private:
  Duration initial_;
  double multiplier_;
  Duration cap_;
  Duration deadline_;

 public:
  BackoffPolicy(Duration initial, double multiplier, Duration cap, Duration deadline) :
      initial_(initial), multiplier_(multiplier), cap_(cap), deadline_(deadline) {}

  Duration Initial() const { return std::min(initial_, cap_); }
  Duration Next(Duration current) const {
    auto next = Duration(static_cast<long>(current.count() * multiplier_));
    return std::min(std::max(next, current), cap_);
  }
  Duration Cap() const { return cap_; }
  Duration Deadline() const { return deadline_; }
  double Multiplier() const { return multiplier_; }

  BackoffPolicy WithDeadline(Duration deadline) const {
    return BackoffPolicy(initial_, multiplier_, cap_, deadline);
  }

  // Calls attempt() until it returns true or the deadline (counted from now) passes,
  //  sleeping between attempts per the policy. Returns whether an attempt succeeded.
  template <class Func>
  bool Retry(Func&& attempt) const {
    return RetryUntil(Clock::now() + deadline_, std::forward<Func>(attempt));
  }

  template <class Func>
  bool RetryUntil(Clock::time_point deadline, Func&& attempt) const {
    Duration interval = Initial();
    while (true) {
      if (attempt()) return true;
      auto now = Clock::now();
      if (now >= deadline) return false;
      auto remaining = std::chrono::duration_cast<Duration>(deadline - now);
      std::this_thread::sleep_for(std::min(interval, remaining));
      interval = Next(interval);
    }
  }
};

#endif  // INCLUDE_GYMJUDGE_BACKOFF_H_

/***
 * Name: pybox::sandbox timeout governor
 * Purpose: Bound the wall-clock time of one execution two ways at once.
 * Inputs:
 *   - Timeout duration
 * Outputs:
 *   - An interrupt flag the interpreter polls (preemptive layer)
 *   - exceptions::TimeoutFailure from Deadline::check() (cooperative layer)
 * Theory of Operation:
 *   AlarmGuard owns the process-wide SIGALRM/ITIMER_REAL pair for its
 *   lifetime. The constructor clears the flag, installs the handler and
 *   arms a one-shot timer; the destructor disarms the timer, restores the
 *   previous handler and timer value and clears the flag again, on every
 *   exit path. A previous timer comes back with the guard's lifetime taken
 *   off its remaining time (at least 1 microsecond, so it still fires).
 *   The handler only stores to a sig_atomic_t. A static mutex
 *   makes ownership exclusive, so executions on different threads take
 *   turns rather than share the timer.
 *   Deadline is the cooperative layer: the capability proxy checks it at
 *   every handle call, the only suspension points a fragment has.
 */
#pragma once

#include <sys/time.h>

#include <chrono>
#include <csignal>
#include <mutex>

namespace pybox::sandbox {

class AlarmGuard {
 public:
  // Throws exceptions::SandboxError when the handler or timer cannot be installed.
  explicit AlarmGuard(std::chrono::microseconds timeout);
  ~AlarmGuard();
  AlarmGuard(const AlarmGuard&) = delete;
  AlarmGuard& operator=(const AlarmGuard&) = delete;

  // The flag the handler sets; valid for the life of the process.
  static const volatile std::sig_atomic_t* flag();
  bool fired() const;
  // True while some guard owns the timer.
  static bool armed();

 private:
  std::unique_lock<std::mutex> lock_;
  struct sigaction previousAction_{};
  struct itimerval previousTimer_{};
  std::chrono::steady_clock::time_point armedAt_;
};

class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::microseconds budget) : budget_(budget), end_(Clock::now() + budget) {}

  bool expired() const { return Clock::now() >= end_; }
  // Throws exceptions::TimeoutFailure once the budget is spent.
  void check() const;
  std::chrono::microseconds budget() const { return budget_; }

 private:
  std::chrono::microseconds budget_;
  Clock::time_point end_;
};

} // namespace pybox::sandbox

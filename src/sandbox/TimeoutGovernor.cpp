/***
 * Name: pybox::sandbox::AlarmGuard / Deadline (impl)
 * Purpose: Arm and disarm the preemptive timer; check the cooperative deadline.
 */
#include "sandbox/TimeoutGovernor.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#include "observability/Log.h"
#include "pybox/exceptions/sandbox_error.h"
#include "pybox/exceptions/timeout_failure.h"

namespace pybox::sandbox {

namespace {

volatile std::sig_atomic_t alarmFired = 0;
std::atomic<bool> timerOwned{false};

std::mutex& timerMutex() {
  static std::mutex mutex;
  return mutex;
}

void onAlarm(int /*signo*/) { alarmFired = 1; }

std::string lastError(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

bool isArmed(const itimerval& timer) { return timer.it_value.tv_sec != 0 || timer.it_value.tv_usec != 0; }

// Takes `elapsed` off the one-shot part of `timer`, never below 1us.
itimerval lessElapsed(itimerval timer, std::chrono::microseconds elapsed) {
  const long long left = static_cast<long long>(timer.it_value.tv_sec) * 1'000'000 + timer.it_value.tv_usec -
                         static_cast<long long>(elapsed.count());
  const long long usec = left > 0 ? left : 1;
  timer.it_value.tv_sec = static_cast<time_t>(usec / 1'000'000);
  timer.it_value.tv_usec = static_cast<suseconds_t>(usec % 1'000'000);
  return timer;
}

} // namespace

AlarmGuard::AlarmGuard(std::chrono::microseconds timeout) : lock_(timerMutex()) {
  alarmFired = 0;

  struct sigaction action{};
  action.sa_handler = &onAlarm;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if (sigaction(SIGALRM, &action, &previousAction_) != 0) {
    throw exceptions::SandboxError(lastError("cannot install SIGALRM handler"));
  }

  // A zero it_value would disarm instead of arming.
  const long long usec = timeout.count() > 0 ? static_cast<long long>(timeout.count()) : 1;
  struct itimerval timer{};
  timer.it_value.tv_sec = static_cast<time_t>(usec / 1'000'000);
  timer.it_value.tv_usec = static_cast<suseconds_t>(usec % 1'000'000);
  if (setitimer(ITIMER_REAL, &timer, &previousTimer_) != 0) {
    const std::string message = lastError("cannot arm interval timer");
    if (sigaction(SIGALRM, &previousAction_, nullptr) != 0) {
      log::Log::Error(lastError("cannot restore SIGALRM handler"));
    }
    throw exceptions::SandboxError(message);
  }
  armedAt_ = std::chrono::steady_clock::now();
  timerOwned = true;
}

AlarmGuard::~AlarmGuard() {
  // Disarm before the old handler comes back so a late tick cannot reach it.
  struct itimerval off{};
  if (setitimer(ITIMER_REAL, &off, nullptr) != 0) {
    log::Log::Error(lastError("cannot disarm interval timer"));
  }
  if (sigaction(SIGALRM, &previousAction_, nullptr) != 0) {
    log::Log::Error(lastError("cannot restore SIGALRM handler"));
  }
  if (isArmed(previousTimer_)) {
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - armedAt_);
    const itimerval remaining = lessElapsed(previousTimer_, elapsed);
    if (setitimer(ITIMER_REAL, &remaining, nullptr) != 0) {
      log::Log::Error(lastError("cannot restore previous interval timer"));
    }
  }
  alarmFired = 0;
  timerOwned = false;
}

const volatile std::sig_atomic_t* AlarmGuard::flag() { return &alarmFired; }

bool AlarmGuard::fired() const { return alarmFired != 0; }

bool AlarmGuard::armed() { return timerOwned; }

void Deadline::check() const {
  if (expired()) { throw exceptions::TimeoutFailure("execution deadline passed"); }
}

} // namespace pybox::sandbox

/***
 * Name: test_timeout_governor
 * Purpose: Cooperative deadline and preemptive timer guard.
 */
#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>

#include <sys/time.h>

#include "pybox/exceptions/timeout_failure.h"
#include "sandbox/TimeoutGovernor.h"

using namespace pybox;
using namespace std::chrono_literals;

namespace {
void customHandler(int /*signo*/) {}
} // namespace

TEST(Deadline, ExpiredBudgetThrows) {
  const sandbox::Deadline spent(0us);
  EXPECT_TRUE(spent.expired());
  EXPECT_THROW(spent.check(), exceptions::TimeoutFailure);
}

TEST(Deadline, FreshBudgetPasses) {
  const sandbox::Deadline fresh(std::chrono::microseconds(3600s));
  EXPECT_FALSE(fresh.expired());
  EXPECT_NO_THROW(fresh.check());
  EXPECT_EQ(fresh.budget(), std::chrono::microseconds(3600s));
}

TEST(AlarmGuard, OwnsTimerOnlyWhileAlive) {
  EXPECT_FALSE(sandbox::AlarmGuard::armed());
  {
    sandbox::AlarmGuard guard(std::chrono::microseconds(60s));
    EXPECT_TRUE(sandbox::AlarmGuard::armed());
    EXPECT_FALSE(guard.fired());
    EXPECT_EQ(*sandbox::AlarmGuard::flag(), 0);
  }
  EXPECT_FALSE(sandbox::AlarmGuard::armed());
}

TEST(AlarmGuard, FiresAfterTimeout) {
  sandbox::AlarmGuard guard(std::chrono::microseconds(20ms));
  const auto until = std::chrono::steady_clock::now() + 2s;
  while (!guard.fired() && std::chrono::steady_clock::now() < until) { std::this_thread::sleep_for(5ms); }
  EXPECT_TRUE(guard.fired());
  EXPECT_NE(*sandbox::AlarmGuard::flag(), 0);
}

TEST(AlarmGuard, FlagClearedAfterGuard) {
  {
    sandbox::AlarmGuard guard(std::chrono::microseconds(1ms));
    std::this_thread::sleep_for(50ms);
  }
  EXPECT_EQ(*sandbox::AlarmGuard::flag(), 0);
}

TEST(AlarmGuard, RestoresPreviousHandler) {
  struct sigaction mine{};
  mine.sa_handler = &customHandler;
  sigemptyset(&mine.sa_mask);
  struct sigaction saved{};
  ASSERT_EQ(sigaction(SIGALRM, &mine, &saved), 0);
  {
    sandbox::AlarmGuard guard(std::chrono::microseconds(60s));
    struct sigaction during{};
    ASSERT_EQ(sigaction(SIGALRM, nullptr, &during), 0);
    EXPECT_NE(during.sa_handler, &customHandler);
  }
  struct sigaction after{};
  ASSERT_EQ(sigaction(SIGALRM, nullptr, &after), 0);
  EXPECT_EQ(after.sa_handler, &customHandler);
  ASSERT_EQ(sigaction(SIGALRM, &saved, nullptr), 0);
}

TEST(AlarmGuard, PreviousTimerResumesWithElapsedTimeTakenOff) {
  struct sigaction mine{};
  mine.sa_handler = &customHandler;
  sigemptyset(&mine.sa_mask);
  struct sigaction saved{};
  ASSERT_EQ(sigaction(SIGALRM, &mine, &saved), 0);
  struct itimerval outer{};
  outer.it_value.tv_sec = 2;
  ASSERT_EQ(setitimer(ITIMER_REAL, &outer, nullptr), 0);
  {
    sandbox::AlarmGuard guard(std::chrono::microseconds(1s));
    std::this_thread::sleep_for(200ms);
  }
  struct itimerval left{};
  ASSERT_EQ(getitimer(ITIMER_REAL, &left), 0);
  const long long usec = static_cast<long long>(left.it_value.tv_sec) * 1'000'000 + left.it_value.tv_usec;
  EXPECT_GT(usec, 0);
  EXPECT_LE(usec, 1'850'000);
  struct itimerval off{};
  ASSERT_EQ(setitimer(ITIMER_REAL, &off, nullptr), 0);
  ASSERT_EQ(sigaction(SIGALRM, &saved, nullptr), 0);
}

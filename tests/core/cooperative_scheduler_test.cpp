// Tests for core/cooperative_scheduler.h -- yield points and cancellation.

#include "core/cooperative_scheduler.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace affect {
namespace {

TEST(CancellationTokenTest, StartsUncancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.isCancelled());
  token.cancel();
  EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTokenTest, WaitForTimesOutWithoutCancel) {
  CancellationToken token;
  EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(1)));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
  CancellationToken token;
  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  bool cancelled = token.waitFor(std::chrono::seconds(10));
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();
  EXPECT_TRUE(cancelled);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ThreadYieldSchedulerTest, ContinuesWithoutToken) {
  ThreadYieldScheduler scheduler;
  EXPECT_EQ(scheduler.yieldControl(nullptr), YieldStatus::Continue);
}

TEST(ThreadYieldSchedulerTest, ReportsCancellation) {
  ThreadYieldScheduler scheduler(std::chrono::milliseconds(1));
  CancellationToken token;
  EXPECT_EQ(scheduler.yieldControl(&token), YieldStatus::Continue);
  token.cancel();
  EXPECT_EQ(scheduler.yieldControl(&token), YieldStatus::Cancelled);
}

}  // namespace
}  // namespace affect

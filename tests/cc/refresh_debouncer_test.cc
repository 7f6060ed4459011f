#include "deskbridge/kube/refresh_debouncer.h"

#include <chrono>

#include "gtest/gtest.h"

namespace deskbridge {
namespace kube {
namespace {

using std::chrono::milliseconds;

class RefreshDebouncerTest : public ::testing::Test {
 protected:
  RefreshDebouncer MakeDebouncer(milliseconds window) {
    return RefreshDebouncer(window, [this] { ++runs_; },
                            [this] { return now_; });
  }

  void Advance(milliseconds delta) { now_ += delta; }

  std::chrono::steady_clock::time_point now_{};
  int runs_ = 0;
};

TEST_F(RefreshDebouncerTest, BurstCollapsesToOneRun) {
  RefreshDebouncer debouncer = MakeDebouncer(milliseconds(500));

  debouncer.Trigger();
  Advance(milliseconds(200));
  debouncer.Trigger();
  Advance(milliseconds(200));
  debouncer.Trigger();

  Advance(milliseconds(499));
  EXPECT_FALSE(debouncer.Poll());
  EXPECT_TRUE(debouncer.IsPending());

  Advance(milliseconds(1));
  EXPECT_TRUE(debouncer.Poll());
  EXPECT_FALSE(debouncer.Poll());
  EXPECT_EQ(runs_, 1);
}

TEST_F(RefreshDebouncerTest, IdlePollDoesNothing) {
  RefreshDebouncer debouncer = MakeDebouncer(milliseconds(500));
  Advance(milliseconds(5000));
  EXPECT_FALSE(debouncer.Poll());
  EXPECT_EQ(runs_, 0);
}

TEST_F(RefreshDebouncerTest, CancelDropsPendingRun) {
  RefreshDebouncer debouncer = MakeDebouncer(milliseconds(100));
  debouncer.Trigger();
  debouncer.Cancel();
  Advance(milliseconds(200));
  EXPECT_FALSE(debouncer.Poll());
  EXPECT_EQ(runs_, 0);
}

TEST_F(RefreshDebouncerTest, ZeroWindowRunsOnNextPoll) {
  RefreshDebouncer debouncer = MakeDebouncer(milliseconds(0));
  debouncer.Trigger();
  EXPECT_TRUE(debouncer.Poll());
  EXPECT_EQ(runs_, 1);
  EXPECT_EQ(debouncer.GetWindow(), milliseconds(0));
}

}  // namespace
}  // namespace kube
}  // namespace deskbridge

#include "deskbridge/bridge/dispatch_queue.h"

#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace deskbridge {
namespace bridge {
namespace {

TEST(DispatchQueueTest, RunsInPostOrder) {
  DispatchQueue queue;
  std::vector<int> order;
  queue.Post([&] { order.push_back(1); });
  queue.Post([&] { order.push_back(2); });
  queue.Post(nullptr);

  EXPECT_EQ(queue.Pending(), 2u);
  EXPECT_EQ(queue.Pump(), 2u);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
  EXPECT_EQ(queue.Pending(), 0u);
}

TEST(DispatchQueueTest, TasksPostedWhilePumpingWait) {
  DispatchQueue queue;
  int runs = 0;
  queue.Post([&] {
    ++runs;
    queue.Post([&] { ++runs; });
  });

  EXPECT_EQ(queue.Pump(), 1u);
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(queue.Pump(), 1u);
  EXPECT_EQ(runs, 2);
}

TEST(DispatchQueueTest, PumpHonorsLimit) {
  DispatchQueue queue;
  for (int i = 0; i < 5; ++i) queue.Post([] {});
  EXPECT_EQ(queue.Pump(2), 2u);
  EXPECT_EQ(queue.Pending(), 3u);
}

TEST(DispatchQueueTest, ThrowingTaskKeepsTheRestQueued) {
  DispatchQueue queue;
  std::vector<int> order;
  queue.Post([&] { order.push_back(1); });
  queue.Post([] { throw std::runtime_error("handler failed"); });
  queue.Post([&] { order.push_back(3); });
  queue.Post([&] { order.push_back(4); });

  EXPECT_THROW(queue.Pump(), std::runtime_error);
  EXPECT_EQ(order, (std::vector<int>{1}));
  EXPECT_EQ(queue.Pending(), 2u);

  EXPECT_EQ(queue.Pump(), 2u);
  EXPECT_EQ(order, (std::vector<int>{1, 3, 4}));
}

TEST(DispatchQueueTest, PostFromOtherThreads) {
  DispatchQueue queue;
  int total = 0;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&queue, &total] {
      for (int i = 0; i < 100; ++i) queue.Post([&total] { ++total; });
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(queue.Pump(), 400u);
  EXPECT_EQ(total, 400);
}

}  // namespace
}  // namespace bridge
}  // namespace deskbridge

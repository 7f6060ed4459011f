#include "deskbridge/bridge/listener_registry.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace deskbridge {
namespace bridge {
namespace {

TEST(ListenerRegistryTest, DeliversInRegistrationOrder) {
  ListenerRegistry registry;
  std::vector<std::string> seen;
  registry.Add("tick", [&](const nlohmann::json&) { seen.push_back("a"); });
  registry.Add("tock", [&](const nlohmann::json&) { seen.push_back("x"); });
  registry.Add("tick", [&](const nlohmann::json&) { seen.push_back("b"); });

  EXPECT_EQ(registry.Deliver("tick", nullptr), 2u);
  EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(registry.Count("tick"), 2u);
  EXPECT_EQ(registry.Size(), 3u);
}

TEST(ListenerRegistryTest, RemoveIsIdempotent) {
  ListenerRegistry registry;
  auto id = registry.Add("tick", [](const nlohmann::json&) {});
  EXPECT_TRUE(registry.Remove(id));
  EXPECT_FALSE(registry.Remove(id));
  EXPECT_EQ(registry.Deliver("tick", nullptr), 0u);
}

TEST(ListenerRegistryTest, ListenerRemovedDuringDeliveryIsSkipped) {
  ListenerRegistry registry;
  int second_calls = 0;
  ListenerRegistry::ListenerId second = 0;
  registry.Add("tick", [&](const nlohmann::json&) { registry.Remove(second); });
  second = registry.Add("tick", [&](const nlohmann::json&) { ++second_calls; });

  EXPECT_EQ(registry.Deliver("tick", nullptr), 1u);
  EXPECT_EQ(second_calls, 0);
}

TEST(ListenerRegistryTest, ListenerMayRemoveItself) {
  ListenerRegistry registry;
  int calls = 0;
  ListenerRegistry::ListenerId self = 0;
  self = registry.Add("tick", [&](const nlohmann::json&) {
    ++calls;
    registry.Remove(self);
  });

  registry.Deliver("tick", nullptr);
  registry.Deliver("tick", nullptr);
  EXPECT_EQ(calls, 1);
}

}  // namespace
}  // namespace bridge
}  // namespace deskbridge

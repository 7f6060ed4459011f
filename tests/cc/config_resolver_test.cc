#include "deskbridge/kube/config_resolver.h"

#include <optional>
#include <string>

#include "gtest/gtest.h"

namespace deskbridge {
namespace kube {
namespace {

KubeConfig MakeConfig() {
  KubeConfig config;
  config.clusters.push_back({"c1", {"https://a", std::nullopt, std::nullopt, false}});
  config.clusters.push_back({"c2", {"https://b", std::nullopt, std::nullopt, false}});

  NamedUser u1;
  u1.name = "u1";
  u1.user.token = "secret";
  config.users.push_back(u1);

  config.contexts.push_back({"dev", {"c1", "u1", std::nullopt}});
  config.contexts.push_back({"staging", {"c2", "u1", std::string("qa")}});
  config.contexts.push_back({"blank-ns", {"c1", "u1", std::string("")}});
  config.contexts.push_back({"orphan", {"missing-cluster", "u1", std::nullopt}});
  config.current_context = "dev";
  return config;
}

TEST(ConfigResolverTest, ResolvesContextClusterAndUser) {
  KubeConfig config = MakeConfig();
  Resolution r = Resolve(config, std::string("staging"));
  ASSERT_TRUE(r.HasContext());
  EXPECT_EQ(r.context->name, "staging");
  ASSERT_NE(r.cluster, nullptr);
  EXPECT_EQ(r.cluster->cluster.server, "https://b");
  ASSERT_NE(r.user, nullptr);
  EXPECT_EQ(r.user->name, "u1");
  EXPECT_EQ(r.EffectiveNamespace(), "qa");
}

TEST(ConfigResolverTest, NamespaceDefaults) {
  KubeConfig config = MakeConfig();
  EXPECT_EQ(Resolve(config, std::string("dev")).EffectiveNamespace(), "default");
  EXPECT_EQ(Resolve(config, std::string("blank-ns")).EffectiveNamespace(), "default");
  EXPECT_EQ(ContextLabel(*FindContext(config, "dev")), "dev (default)");
  EXPECT_EQ(ContextLabel(*FindContext(config, "staging")), "staging (qa)");
}

TEST(ConfigResolverTest, DanglingClusterLeavesOnlyThatUnset) {
  KubeConfig config = MakeConfig();
  Resolution r = Resolve(config, std::string("orphan"));
  ASSERT_TRUE(r.HasContext());
  EXPECT_EQ(r.cluster, nullptr);
  ASSERT_NE(r.user, nullptr);
  EXPECT_EQ(r.user->user.token, std::optional<std::string>("secret"));
}

TEST(ConfigResolverTest, UnknownOrUnsetNameIsEmpty) {
  KubeConfig config = MakeConfig();
  Resolution unknown = Resolve(config, std::string("nope"));
  EXPECT_FALSE(unknown.HasContext());
  EXPECT_EQ(unknown.cluster, nullptr);
  EXPECT_EQ(unknown.user, nullptr);

  Resolution unset = Resolve(config, std::nullopt);
  EXPECT_FALSE(unset.HasContext());
}

TEST(ConfigResolverTest, CurrentContextServer) {
  KubeConfig config = MakeConfig();
  EXPECT_EQ(CurrentContextServer(config), std::optional<std::string>("https://a"));

  config.current_context = "orphan";
  EXPECT_FALSE(CurrentContextServer(config).has_value());

  config.current_context.reset();
  EXPECT_FALSE(CurrentContextServer(config).has_value());
}

TEST(ConfigResolverTest, FirstMatchWins) {
  KubeConfig config = MakeConfig();
  config.clusters.push_back({"c1", {"https://shadowed", std::nullopt, std::nullopt, false}});
  EXPECT_EQ(FindCluster(config, "c1")->cluster.server, "https://a");
}

}  // namespace
}  // namespace kube
}  // namespace deskbridge

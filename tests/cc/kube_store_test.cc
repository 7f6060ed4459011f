#include "deskbridge/kube/kube_store.h"

#include <memory>
#include <optional>
#include <string>

#include "deskbridge/core/logger.h"
#include "fake_host.h"
#include "gtest/gtest.h"

namespace deskbridge {
namespace kube {
namespace {

nlohmann::json Document(const std::string& current, const std::string& server) {
  return {
      {"current-context", current},
      {"clusters", {{{"name", "c1"}, {"cluster", {{"server", server}}}}}},
      {"contexts",
       {{{"name", "dev"}, {"context", {{"cluster", "c1"}, {"user", "u1"}}}},
        {{"name", "prod"},
         {"context", {{"cluster", "c1"}, {"user", "u1"}, {"namespace", "live"}}}}}},
      {"users", {{{"name", "u1"}, {"user", {{"token", "t"}}}}}}};
}

class KubeStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    core::Logger::GetInstance().SetConsoleOutput(false);
    host_ = std::make_shared<fakes::FakeHost>();
    backend_ = std::make_unique<bridge::NativeBackend>(host_);
    bridge_ = std::make_unique<bridge::ExecutionBridge>(*backend_);
    loader_ = std::make_unique<ConfigLoader>(*bridge_);
    store_ = std::make_unique<KubeStore>(*loader_, "/tmp/kubeconfig");
  }

  std::shared_ptr<fakes::FakeHost> host_;
  std::unique_ptr<bridge::NativeBackend> backend_;
  std::unique_ptr<bridge::ExecutionBridge> bridge_;
  std::unique_ptr<ConfigLoader> loader_;
  std::unique_ptr<KubeStore> store_;
};

TEST_F(KubeStoreTest, RefreshLoadsDocument) {
  EXPECT_FALSE(store_->HasDocument());
  bool done = false;
  store_->Refresh([&](const ConfigLoader::LoadResult& r) { done = r.ok; });

  EXPECT_TRUE(store_->IsLoading());
  ASSERT_EQ(host_->calls.size(), 1u);
  EXPECT_EQ(host_->calls[0].args["path"], "/tmp/kubeconfig");

  host_->Reply(0, Document("dev", "https://a"));
  EXPECT_TRUE(done);
  EXPECT_FALSE(store_->IsLoading());
  ASSERT_TRUE(store_->HasDocument());
  EXPECT_EQ(store_->ActiveContextName(), std::optional<std::string>("dev"));

  Resolution r = store_->Resolve();
  ASSERT_TRUE(r.HasContext());
  ASSERT_NE(r.cluster, nullptr);
  EXPECT_EQ(r.cluster->cluster.server, "https://a");
}

TEST_F(KubeStoreTest, FailureKeepsPreviousDocument) {
  store_->Refresh();
  host_->Reply(0, Document("dev", "https://a"));

  store_->Refresh();
  host_->Fail(1, "permission denied");

  ASSERT_TRUE(store_->HasDocument());
  EXPECT_EQ(store_->GetDocument()->clusters[0].cluster.server, "https://a");
  EXPECT_EQ(store_->GetLastError().kind, bridge::ErrorKind::kHostFailure);
  EXPECT_EQ(store_->GetLastError().message, "permission denied");

  store_->Refresh();
  host_->Reply(2, Document("dev", "https://b"));
  EXPECT_FALSE(store_->GetLastError().IsError());
  EXPECT_EQ(store_->GetDocument()->clusters[0].cluster.server, "https://b");
}

TEST_F(KubeStoreTest, StaleReplyIsDropped) {
  int callbacks = 0;
  store_->Refresh([&](const ConfigLoader::LoadResult&) { ++callbacks; });
  store_->Refresh([&](const ConfigLoader::LoadResult&) { ++callbacks; });

  host_->Reply(1, Document("dev", "https://new"));
  host_->Reply(0, Document("dev", "https://old"));

  EXPECT_EQ(callbacks, 1);
  EXPECT_FALSE(store_->IsLoading());
  EXPECT_EQ(store_->GetDocument()->clusters[0].cluster.server, "https://new");
}

TEST_F(KubeStoreTest, SelectionOverridesDocumentContext) {
  store_->Refresh();
  host_->Reply(0, Document("dev", "https://a"));

  store_->SelectContext("prod");
  EXPECT_EQ(store_->ActiveContextName(), std::optional<std::string>("prod"));
  EXPECT_EQ(store_->Resolve().EffectiveNamespace(), "live");

  // Selection survives a reload.
  store_->Refresh();
  host_->Reply(1, Document("dev", "https://a"));
  EXPECT_EQ(store_->ActiveContextName(), std::optional<std::string>("prod"));

  store_->ClearSelection();
  EXPECT_EQ(store_->ActiveContextName(), std::optional<std::string>("dev"));
}

TEST_F(KubeStoreTest, UnknownSelectionResolvesEmpty) {
  store_->Refresh();
  host_->Reply(0, Document("dev", "https://a"));
  store_->SelectContext("gone");
  EXPECT_FALSE(store_->Resolve().HasContext());
}

TEST_F(KubeStoreTest, NoDocumentMeansNoContext) {
  EXPECT_FALSE(store_->ActiveContextName().has_value());
  EXPECT_FALSE(store_->Resolve().HasContext());
}

}  // namespace
}  // namespace kube
}  // namespace deskbridge

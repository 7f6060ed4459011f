#include "deskbridge/dock/dock_controller.h"

#include <memory>
#include <optional>
#include <string>

#include "deskbridge/core/logger.h"
#include "fake_host.h"
#include "gtest/gtest.h"

namespace deskbridge {
namespace dock {
namespace {

class DockControllerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    core::Logger::GetInstance().SetConsoleOutput(false);
    host_ = std::make_shared<fakes::FakeHost>();
    backend_ = std::make_unique<bridge::NativeBackend>(host_);
    bridge_ = std::make_unique<bridge::ExecutionBridge>(*backend_);
    controller_ = std::make_unique<DockController>(*bridge_);
  }

  std::shared_ptr<fakes::FakeHost> host_;
  std::unique_ptr<bridge::NativeBackend> backend_;
  std::unique_ptr<bridge::ExecutionBridge> bridge_;
  std::unique_ptr<DockController> controller_;
};

TEST_F(DockControllerTest, SendsCommands) {
  controller_->SetProgress(0.25);
  controller_->SetBadge("3");
  controller_->ClearProgress();
  controller_->ClearBadge();
  controller_->RunTestAnimation();

  ASSERT_EQ(host_->calls.size(), 5u);
  EXPECT_EQ(host_->calls[0].command, "set_dock_progress");
  EXPECT_DOUBLE_EQ(host_->calls[0].args["progress"].get<double>(), 0.25);
  EXPECT_EQ(host_->calls[1].command, "set_dock_badge");
  EXPECT_EQ(host_->calls[1].args["label"], "3");
  EXPECT_EQ(host_->calls[2].command, "clear_dock");
  EXPECT_EQ(host_->calls[3].command, "clear_dock_badge");
  EXPECT_EQ(host_->calls[4].command, "test_dock_progress");
}

TEST_F(DockControllerTest, OutOfRangeProgressNeverReachesHost) {
  std::optional<bridge::InvokeResult> result;
  controller_->SetProgress(1.5, [&](const bridge::InvokeResult& r) { result = r; });

  EXPECT_TRUE(host_->calls.empty());
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->ok);
  EXPECT_EQ(result->error.kind, bridge::ErrorKind::kHostFailure);
  EXPECT_EQ(result->error.message, "Invalid progress 1.5: must be between 0.0 and 1.0");

  controller_->SetProgress(-0.1);
  EXPECT_TRUE(host_->calls.empty());
}

TEST_F(DockControllerTest, BoundsAreInclusive) {
  controller_->SetProgress(0.0);
  controller_->SetProgress(1.0);
  EXPECT_EQ(host_->calls.size(), 2u);
}

TEST_F(DockControllerTest, HostFailureReachesCallback) {
  std::optional<bridge::InvokeResult> result;
  controller_->SetBadge("x", [&](const bridge::InvokeResult& r) { result = r; });
  host_->Fail(0, "dock unavailable");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->error.message, "dock unavailable");
}

TEST_F(DockControllerTest, FailureWithoutCallbackIsLogged) {
  auto& logger = core::Logger::GetInstance();
  logger.Clear();
  controller_->ClearBadge();
  host_->Fail(0, "dock unavailable");

  bool logged = false;
  for (const auto& entry : logger.GetEntries()) {
    if (entry.level == core::LogLevel::kError &&
        entry.message == "Failed to clear dock badge: dock unavailable") {
      logged = true;
    }
  }
  EXPECT_TRUE(logged);
}

}  // namespace
}  // namespace dock
}  // namespace deskbridge

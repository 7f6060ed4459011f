#include "deskbridge/core/shell_config.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"
#include "gtest/gtest.h"

namespace deskbridge {
namespace core {
namespace {

class TempDir {
 public:
  TempDir() {
    std::filesystem::path base = std::filesystem::temp_directory_path();
    auto suffix = std::to_string(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    path_ = base / std::filesystem::path("deskbridge_config_test_" + suffix);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() { std::filesystem::remove_all(path_); }

  std::filesystem::path File(const std::string& name) const {
    return path_ / name;
  }

 private:
  std::filesystem::path path_;
};

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream file(path, std::ios::trunc);
  file << contents;
}

class ShellConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::GetInstance().SetConsoleOutput(false);
    unsetenv(kModeEnvVar);
  }
  void TearDown() override { unsetenv(kModeEnvVar); }
};

TEST_F(ShellConfigTest, ParsesAllKeys) {
  ShellConfig config;
  std::string error;
  ASSERT_TRUE(ParseShellConfig(
      "# deskbridge shell\n"
      "mode = native\n"
      "host_helper = ~/bin/deskbridge-host\n"
      "kubeconfig=/etc/kube/config\n"
      "\n"
      "refresh_debounce_ms = 250\n"
      "log_level = debug\n",
      &config, &error))
      << error;

  EXPECT_EQ(config.mode, ModePreference::kNative);
  EXPECT_EQ(config.host_helper, "~/bin/deskbridge-host");
  EXPECT_EQ(config.kubeconfig, "/etc/kube/config");
  EXPECT_EQ(config.refresh_debounce_ms, 250);
  EXPECT_EQ(config.log_level, LogLevel::kDebug);
}

TEST_F(ShellConfigTest, ReportsBadLinesButKeepsGoodOnes) {
  ShellConfig config;
  std::string error;
  EXPECT_FALSE(ParseShellConfig(
      "unknown_key = 1\n"
      "refresh_debounce_ms = soon\n"
      "mode = standalone\n"
      "no equals sign\n",
      &config, &error));

  EXPECT_EQ(config.mode, ModePreference::kStandalone);
  EXPECT_EQ(config.refresh_debounce_ms, 500);
  EXPECT_NE(error.find("line 1: unknown key 'unknown_key'"), std::string::npos);
  EXPECT_NE(error.find("line 2"), std::string::npos);
  EXPECT_NE(error.find("line 4"), std::string::npos);
}

TEST_F(ShellConfigTest, MissingFileIsNotAnError) {
  TempDir dir;
  ShellConfig config;
  std::string error;
  EXPECT_TRUE(LoadShellConfig(dir.File("absent.conf"), &config, &error));
  EXPECT_EQ(config.mode, ModePreference::kAuto);
}

TEST_F(ShellConfigTest, LoadsFromDisk) {
  TempDir dir;
  std::filesystem::path path = dir.File("shell.conf");
  WriteFile(path, "mode = web\nlog_level = WARN\n");

  ShellConfig config;
  ASSERT_TRUE(LoadShellConfig(path, &config));
  EXPECT_EQ(config.mode, ModePreference::kStandalone);
  EXPECT_EQ(config.log_level, LogLevel::kWarn);
}

TEST_F(ShellConfigTest, EnvironmentOverridesMode) {
  ShellConfig config;
  config.mode = ModePreference::kStandalone;
  setenv(kModeEnvVar, "native", 1);
  ASSERT_TRUE(ApplyEnvironmentOverrides(&config));
  EXPECT_EQ(config.mode, ModePreference::kNative);

  std::string error;
  setenv(kModeEnvVar, "sideways", 1);
  EXPECT_FALSE(ApplyEnvironmentOverrides(&config, &error));
  EXPECT_EQ(config.mode, ModePreference::kNative);
  EXPECT_NE(error.find("sideways"), std::string::npos);
}

TEST_F(ShellConfigTest, AutoModeNeedsExecutableHelper) {
  TempDir dir;
  ShellConfig config;
  EXPECT_EQ(SelectExecutionMode(config), bridge::ExecutionMode::kStandalone);

  std::filesystem::path helper = dir.File("deskbridge-host");
  WriteFile(helper, "#!/bin/sh\n");
  config.host_helper = helper.string();
  EXPECT_EQ(SelectExecutionMode(config), bridge::ExecutionMode::kStandalone);

  std::filesystem::permissions(helper, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace);
  EXPECT_EQ(SelectExecutionMode(config), bridge::ExecutionMode::kNative);

  config.mode = ModePreference::kStandalone;
  EXPECT_EQ(SelectExecutionMode(config), bridge::ExecutionMode::kStandalone);
}

TEST_F(ShellConfigTest, DefaultPathHonorsXdg) {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  EXPECT_EQ(DefaultShellConfigPath(),
            std::filesystem::path(absl::StrCat("/tmp/xdg", "/deskbridge/shell.conf")));
  if (old) {
    setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    unsetenv("XDG_CONFIG_HOME");
  }
}

}  // namespace
}  // namespace core
}  // namespace deskbridge

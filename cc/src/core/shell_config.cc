#include "deskbridge/core/shell_config.h"

#include <cstdlib>
#include <sstream>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "deskbridge/core/filesystem.h"

namespace deskbridge {
namespace core {

std::filesystem::path DefaultShellConfigPath() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::filesystem::path(xdg) / "deskbridge" / "shell.conf";
  }
  return FileSystem::ResolvePath("~/.config/deskbridge/shell.conf");
}

bool ParseModePreference(const std::string& text, ModePreference* mode) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "auto") {
    *mode = ModePreference::kAuto;
  } else if (lower == "native") {
    *mode = ModePreference::kNative;
  } else if (lower == "standalone" || lower == "web") {
    *mode = ModePreference::kStandalone;
  } else {
    return false;
  }
  return true;
}

bool ParseShellConfig(const std::string& contents, ShellConfig* config,
                      std::string* error) {
  std::vector<std::string> problems;
  std::istringstream stream(contents);
  std::string line;
  int line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    std::string trimmed(absl::StripAsciiWhitespace(line));
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#' || trimmed[0] == ';') continue;

    size_t pos = trimmed.find('=');
    if (pos == std::string::npos) {
      problems.push_back(absl::StrCat("line ", line_number, ": expected key = value"));
      continue;
    }
    std::string key(absl::StripAsciiWhitespace(trimmed.substr(0, pos)));
    std::string value(absl::StripAsciiWhitespace(trimmed.substr(pos + 1)));

    if (key == "mode") {
      if (!ParseModePreference(value, &config->mode)) {
        problems.push_back(absl::StrCat("line ", line_number, ": unknown mode '", value, "'"));
      }
    } else if (key == "host_helper") {
      config->host_helper = value;
    } else if (key == "kubeconfig") {
      if (value.empty()) {
        problems.push_back(absl::StrCat("line ", line_number, ": empty kubeconfig path"));
      } else {
        config->kubeconfig = value;
      }
    } else if (key == "refresh_debounce_ms") {
      int ms = 0;
      if (!absl::SimpleAtoi(value, &ms) || ms < 0) {
        problems.push_back(absl::StrCat("line ", line_number,
                                        ": bad refresh_debounce_ms '", value, "'"));
      } else {
        config->refresh_debounce_ms = ms;
      }
    } else if (key == "log_level") {
      if (!Logger::ParseLevel(value, &config->log_level)) {
        problems.push_back(absl::StrCat("line ", line_number, ": unknown log_level '", value, "'"));
      }
    } else {
      problems.push_back(absl::StrCat("line ", line_number, ": unknown key '", key, "'"));
    }
  }

  if (!problems.empty()) {
    if (error) *error = absl::StrJoin(problems, "; ");
    return false;
  }
  return true;
}

bool LoadShellConfig(const std::filesystem::path& path, ShellConfig* config,
                     std::string* error) {
  if (!FileSystem::Exists(path)) return true;

  auto contents = FileSystem::ReadFile(path);
  if (!contents) {
    if (error) *error = "Failed to read shell config: " + path.string();
    return false;
  }

  std::string parse_error;
  if (!ParseShellConfig(*contents, config, &parse_error)) {
    if (error) *error = path.string() + ": " + parse_error;
    DESKBRIDGE_LOG_WARN("Shell config: " + path.string() + ": " + parse_error);
    return false;
  }
  DESKBRIDGE_LOG_INFO("Shell config loaded from " + path.string());
  return true;
}

bool ApplyEnvironmentOverrides(ShellConfig* config, std::string* error) {
  const char* mode = std::getenv(kModeEnvVar);
  if (!mode || !*mode) return true;
  if (!ParseModePreference(mode, &config->mode)) {
    if (error) {
      *error = absl::StrCat(kModeEnvVar, ": unknown mode '", mode, "'");
    }
    return false;
  }
  return true;
}

bridge::ExecutionMode SelectExecutionMode(const ShellConfig& config) {
  switch (config.mode) {
    case ModePreference::kNative:
      return bridge::ExecutionMode::kNative;
    case ModePreference::kStandalone:
      return bridge::ExecutionMode::kStandalone;
    case ModePreference::kAuto:
      break;
  }
  if (!config.host_helper.empty() &&
      FileSystem::IsExecutable(FileSystem::ResolvePath(config.host_helper))) {
    return bridge::ExecutionMode::kNative;
  }
  return bridge::ExecutionMode::kStandalone;
}

}  // namespace core
}  // namespace deskbridge

#ifndef DESKBRIDGE_CORE_SHELL_CONFIG_H_
#define DESKBRIDGE_CORE_SHELL_CONFIG_H_

#include <filesystem>
#include <string>

#include "deskbridge/bridge/execution_backend.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace core {

enum class ModePreference { kAuto, kNative, kStandalone };

// Shell settings, read from a `key = value` file:
//
//   # comment
//   mode = auto | native | standalone
//   host_helper = ~/.local/bin/deskbridge-host
//   kubeconfig = ~/.kube/config
//   refresh_debounce_ms = 500
//   log_level = trace | debug | info | warn | error
struct ShellConfig {
  ModePreference mode = ModePreference::kAuto;
  std::string host_helper;
  std::string kubeconfig = "~/.kube/config";
  int refresh_debounce_ms = 500;
  LogLevel log_level = LogLevel::kInfo;
};

constexpr const char* kModeEnvVar = "DESKBRIDGE_MODE";

std::filesystem::path DefaultShellConfigPath();

// Applies every valid line to `config`. A missing file is not an error and
// leaves `config` untouched. Unknown keys or bad values make the call return
// false with a description in `error`; the valid lines are still applied.
bool LoadShellConfig(const std::filesystem::path& path, ShellConfig* config,
                     std::string* error = nullptr);

// Parses the contents of a config file; see LoadShellConfig().
bool ParseShellConfig(const std::string& contents, ShellConfig* config,
                      std::string* error = nullptr);

// DESKBRIDGE_MODE overrides the file's `mode`.
bool ApplyEnvironmentOverrides(ShellConfig* config,
                               std::string* error = nullptr);

bool ParseModePreference(const std::string& text, ModePreference* mode);

// kAuto picks Native when the host helper exists and is executable.
bridge::ExecutionMode SelectExecutionMode(const ShellConfig& config);

}  // namespace core
}  // namespace deskbridge

#endif  // DESKBRIDGE_CORE_SHELL_CONFIG_H_

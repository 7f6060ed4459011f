/// deskbridge shell - Main Entry Point
///
/// Usage: deskbridge_shell [config_path]
///   config_path: Shell settings file (default: ~/.config/deskbridge/shell.conf)
///
/// Build:
///   cmake -B build -S . -DDESKBRIDGE_BUILD_SHELL=ON
///   cmake --build build
///
/// Environment:
///   DESKBRIDGE_MODE=native|standalone overrides the configured mode

#include <filesystem>
#include <iostream>
#include <string>

#include "app.h"
#include "deskbridge/core/logger.h"
#include "deskbridge/core/shell_config.h"

int main(int argc, char* argv[]) {
  using deskbridge::core::ShellConfig;

  std::filesystem::path config_path = argc > 1
                                          ? std::filesystem::path(argv[1])
                                          : deskbridge::core::DefaultShellConfigPath();

  ShellConfig config;
  std::string error;
  if (!deskbridge::core::LoadShellConfig(config_path, &config, &error)) {
    std::cerr << "Warning: " << config_path.string() << ": " << error << "\n";
  }
  if (!deskbridge::core::ApplyEnvironmentOverrides(&config, &error)) {
    std::cerr << "Warning: " << error << "\n";
  }
  deskbridge::core::Logger::GetInstance().SetMinLevel(config.log_level);

  std::cout << "deskbridge shell\n";
  std::cout << "Config: " << config_path.string() << "\n";
  std::cout << "Kubeconfig: " << config.kubeconfig << "\n\n";

  deskbridge::shell::App app(config);
  return app.Run();
}

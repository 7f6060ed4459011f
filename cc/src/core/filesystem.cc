#include "deskbridge/core/filesystem.h"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace core {

std::filesystem::path FileSystem::ResolvePath(const std::string& path_str) {
  if (path_str.empty()) return {};

  if (path_str[0] == '~' && (path_str.size() == 1 || path_str[1] == '/')) {
    const char* home = std::getenv("HOME");
    if (home) {
      if (path_str.size() <= 2) return std::filesystem::path(home);
      return std::filesystem::path(home) / path_str.substr(2);
    }
  }

  return std::filesystem::path(path_str);
}

bool FileSystem::Exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool FileSystem::IsExecutable(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return false;
  return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> FileSystem::ReadFile(
    const std::filesystem::path& path) {
  if (!Exists(path)) {
    DESKBRIDGE_LOG_WARN("File not found: " + path.string());
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    DESKBRIDGE_LOG_ERROR("Failed to open file: " + path.string());
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace core
}  // namespace deskbridge

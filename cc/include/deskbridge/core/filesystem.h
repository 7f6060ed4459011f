#ifndef DESKBRIDGE_CORE_FILESYSTEM_H_
#define DESKBRIDGE_CORE_FILESYSTEM_H_

#include <filesystem>
#include <optional>
#include <string>

namespace deskbridge {
namespace core {

class FileSystem {
 public:
  /// Resolve a home-relative path (e.g., ~/.kube/config) to an absolute path.
  static std::filesystem::path ResolvePath(const std::string& path_str);

  /// Check if a path exists.
  static bool Exists(const std::filesystem::path& path);

  /// Check if a path is a regular file the current user may execute.
  static bool IsExecutable(const std::filesystem::path& path);

  /// Read the entire content of a file as a string.
  static std::optional<std::string> ReadFile(const std::filesystem::path& path);
};

}  // namespace core
}  // namespace deskbridge

#endif  // DESKBRIDGE_CORE_FILESYSTEM_H_

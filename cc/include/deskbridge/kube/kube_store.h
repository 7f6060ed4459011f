#ifndef DESKBRIDGE_KUBE_KUBE_STORE_H_
#define DESKBRIDGE_KUBE_KUBE_STORE_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "deskbridge/bridge/command_error.h"
#include "deskbridge/kube/config_loader.h"
#include "deskbridge/kube/config_resolver.h"
#include "deskbridge/kube/kube_config.h"

namespace deskbridge {
namespace kube {

// Holds the latest configuration snapshot and the user's context choice.
// A successful load replaces the snapshot wholesale; a failed one keeps the
// previous snapshot and records the error.
class KubeStore {
 public:
  using RefreshCallback = std::function<void(const ConfigLoader::LoadResult&)>;

  explicit KubeStore(ConfigLoader& loader,
                     std::string path = ConfigLoader::kDefaultPath);

  // Starts a load. Only the newest refresh may replace the snapshot; a
  // reply to an older one is dropped.
  void Refresh(RefreshCallback done = nullptr);

  void SetDocument(KubeConfig config);
  void SelectContext(const std::string& name);
  void ClearSelection() { selected_context_.reset(); }

  // The user's selection, else the document's own current context.
  std::optional<std::string> ActiveContextName() const;

  // Resolution of the active context against the current snapshot. Pointers
  // are invalidated by the next SetDocument() or successful Refresh().
  Resolution Resolve() const;

  bool HasDocument() const { return config_.has_value(); }
  const std::optional<KubeConfig>& GetDocument() const { return config_; }
  bool IsLoading() const { return in_flight_ > 0; }
  const bridge::CommandError& GetLastError() const { return last_error_; }
  const std::string& GetPath() const { return path_; }
  void SetPath(std::string path) { path_ = std::move(path); }

 private:
  ConfigLoader& loader_;
  std::string path_;
  std::optional<KubeConfig> config_;
  std::optional<std::string> selected_context_;
  bridge::CommandError last_error_;
  std::uint64_t latest_request_ = 0;
  int in_flight_ = 0;
};

}  // namespace kube
}  // namespace deskbridge

#endif  // DESKBRIDGE_KUBE_KUBE_STORE_H_

#ifndef DESKBRIDGE_KUBE_CONFIG_LOADER_H_
#define DESKBRIDGE_KUBE_CONFIG_LOADER_H_

#include <functional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/command_error.h"
#include "deskbridge/bridge/execution_bridge.h"
#include "deskbridge/kube/kube_config.h"

namespace deskbridge {
namespace kube {

// Fetches the configuration document through the bridge and normalizes it.
class ConfigLoader {
 public:
  static constexpr const char* kDefaultPath = "~/.kube/config";
  static constexpr const char* kLoadCommand = "load_kubeconfig";

  struct LoadResult {
    bool ok = false;
    KubeConfig config;
    bridge::CommandError error;
  };
  using Callback = std::function<void(const LoadResult&)>;

  explicit ConfigLoader(bridge::ExecutionBridge& bridge);

  // Asks the host for the document at `path`. Bridge failures are passed
  // through; a reply that is not a JSON object fails with InvalidFormat.
  void Load(const std::string& path, Callback done);
  void Load(Callback done) { Load(kDefaultPath, std::move(done)); }

  // Returns a normalized copy of `raw`:
  //   current-context               -> currentContext
  //   users[].user.client-certificate -> clientCertificate
  //   users[].user.client-key         -> clientKey
  // User entries without a `user` object are dropped. Fails (leaving
  // `normalized` untouched) when `raw` is not an object.
  static bool Normalize(const nlohmann::json& raw, nlohmann::json* normalized);

 private:
  bridge::ExecutionBridge& bridge_;
};

}  // namespace kube
}  // namespace deskbridge

#endif  // DESKBRIDGE_KUBE_CONFIG_LOADER_H_

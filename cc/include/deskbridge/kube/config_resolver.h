#ifndef DESKBRIDGE_KUBE_CONFIG_RESOLVER_H_
#define DESKBRIDGE_KUBE_CONFIG_RESOLVER_H_

#include <optional>
#include <string>

#include "deskbridge/kube/kube_config.h"

namespace deskbridge {
namespace kube {

constexpr const char* kDefaultNamespace = "default";

// Records a context name resolves to. Pointers refer into the KubeConfig
// passed to Resolve() and are valid as long as it is.
struct Resolution {
  const NamedContext* context = nullptr;
  const NamedCluster* cluster = nullptr;
  const NamedUser* user = nullptr;

  bool HasContext() const { return context != nullptr; }

  // Namespace to show for the resolved context ("default" when unset).
  std::string EffectiveNamespace() const;
};

// Looks up `context_name` and the cluster and user it references. An unset
// or unknown name yields an empty Resolution. A dangling cluster or user
// reference leaves only that field unset.
Resolution Resolve(const KubeConfig& config,
                   const std::optional<std::string>& context_name);

const NamedContext* FindContext(const KubeConfig& config,
                                const std::string& name);
const NamedCluster* FindCluster(const KubeConfig& config,
                                const std::string& name);
const NamedUser* FindUser(const KubeConfig& config, const std::string& name);

// `namespace_name` when present and non-empty, else "default".
std::string EffectiveNamespace(const NamedContext& context);

// "<name> (<effective namespace>)", as shown in the context picker.
std::string ContextLabel(const NamedContext& context);

// Server URL of the document's own current context, if it resolves.
std::optional<std::string> CurrentContextServer(const KubeConfig& config);

}  // namespace kube
}  // namespace deskbridge

#endif  // DESKBRIDGE_KUBE_CONFIG_RESOLVER_H_

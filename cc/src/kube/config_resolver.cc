#include "deskbridge/kube/config_resolver.h"

#include "absl/strings/str_cat.h"

namespace deskbridge {
namespace kube {

std::string Resolution::EffectiveNamespace() const {
  if (!context) return kDefaultNamespace;
  return kube::EffectiveNamespace(*context);
}

const NamedContext* FindContext(const KubeConfig& config,
                                const std::string& name) {
  for (const auto& context : config.contexts) {
    if (context.name == name) return &context;
  }
  return nullptr;
}

const NamedCluster* FindCluster(const KubeConfig& config,
                                const std::string& name) {
  for (const auto& cluster : config.clusters) {
    if (cluster.name == name) return &cluster;
  }
  return nullptr;
}

const NamedUser* FindUser(const KubeConfig& config, const std::string& name) {
  for (const auto& user : config.users) {
    if (user.name == name) return &user;
  }
  return nullptr;
}

Resolution Resolve(const KubeConfig& config,
                   const std::optional<std::string>& context_name) {
  Resolution resolution;
  if (!context_name) return resolution;

  resolution.context = FindContext(config, *context_name);
  if (!resolution.context) return resolution;

  resolution.cluster = FindCluster(config, resolution.context->context.cluster);
  resolution.user = FindUser(config, resolution.context->context.user);
  return resolution;
}

std::string EffectiveNamespace(const NamedContext& context) {
  const auto& ns = context.context.namespace_name;
  if (ns && !ns->empty()) return *ns;
  return kDefaultNamespace;
}

std::string ContextLabel(const NamedContext& context) {
  return absl::StrCat(context.name, " (", EffectiveNamespace(context), ")");
}

std::optional<std::string> CurrentContextServer(const KubeConfig& config) {
  Resolution resolution = Resolve(config, config.current_context);
  if (!resolution.cluster) return std::nullopt;
  return resolution.cluster->cluster.server;
}

}  // namespace kube
}  // namespace deskbridge

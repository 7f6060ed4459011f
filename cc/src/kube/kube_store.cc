#include "deskbridge/kube/kube_store.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace kube {

KubeStore::KubeStore(ConfigLoader& loader, std::string path)
    : loader_(loader), path_(std::move(path)) {}

void KubeStore::Refresh(RefreshCallback done) {
  const std::uint64_t request = ++latest_request_;
  ++in_flight_;
  loader_.Load(path_, [this, request, done = std::move(done)](
                          const ConfigLoader::LoadResult& result) {
    --in_flight_;
    if (request != latest_request_) {
      DESKBRIDGE_LOG_DEBUG(
          absl::StrCat("KubeStore: dropping stale refresh #", request));
      return;
    }
    if (result.ok) {
      SetDocument(result.config);
    } else {
      last_error_ = result.error;
    }
    if (done) done(result);
  });
}

void KubeStore::SetDocument(KubeConfig config) {
  config_ = std::move(config);
  last_error_ = bridge::CommandError();
}

void KubeStore::SelectContext(const std::string& name) {
  selected_context_ = name;
  DESKBRIDGE_LOG_INFO("Switched to context: " + name);
}

std::optional<std::string> KubeStore::ActiveContextName() const {
  if (selected_context_) return selected_context_;
  if (config_) return config_->current_context;
  return std::nullopt;
}

Resolution KubeStore::Resolve() const {
  if (!config_) return Resolution();
  return kube::Resolve(*config_, ActiveContextName());
}

}  // namespace kube
}  // namespace deskbridge

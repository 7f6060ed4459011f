#include "deskbridge/kube/config_loader.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace kube {

namespace {

void RenameKey(nlohmann::json* object, const char* from, const char* to) {
  auto it = object->find(from);
  if (it == object->end()) return;
  nlohmann::json value = std::move(*it);
  object->erase(it);
  (*object)[to] = std::move(value);
}

}  // namespace

ConfigLoader::ConfigLoader(bridge::ExecutionBridge& bridge) : bridge_(bridge) {}

void ConfigLoader::Load(const std::string& path, Callback done) {
  DESKBRIDGE_LOG_INFO("ConfigLoader: Loading from " + path);
  bridge_.Invoke(
      kLoadCommand, nlohmann::json{{"path", path}},
      [done = std::move(done)](const bridge::InvokeResult& invoked) {
        LoadResult result;
        if (!invoked.ok) {
          result.error = invoked.error;
          DESKBRIDGE_LOG_ERROR("ConfigLoader: " + invoked.error.message);
          if (done) done(result);
          return;
        }

        nlohmann::json normalized;
        std::string parse_error;
        if (!Normalize(invoked.value, &normalized) ||
            !ParseKubeConfig(normalized, &result.config, &parse_error)) {
          result.error =
              bridge::CommandError::InvalidFormat("Invalid KubeConfig format");
          DESKBRIDGE_LOG_ERROR("ConfigLoader: Invalid KubeConfig format");
          if (done) done(result);
          return;
        }

        result.ok = true;
        DESKBRIDGE_LOG_DEBUG(absl::StrCat(
            "Loaded ", result.config.clusters.size(),
            " clusters, current context: ",
            result.config.current_context.value_or("<unset>")));
        if (done) done(result);
      });
}

bool ConfigLoader::Normalize(const nlohmann::json& raw,
                             nlohmann::json* normalized) {
  if (!raw.is_object()) return false;

  nlohmann::json doc = raw;
  RenameKey(&doc, "current-context", "currentContext");

  auto users = doc.find("users");
  if (users != doc.end() && users->is_array()) {
    nlohmann::json kept = nlohmann::json::array();
    for (auto& entry : *users) {
      if (!entry.is_object()) continue;
      auto user = entry.find("user");
      if (user == entry.end() || !user->is_object()) continue;
      RenameKey(&*user, "client-certificate", "clientCertificate");
      RenameKey(&*user, "client-key", "clientKey");
      kept.push_back(std::move(entry));
    }
    *users = std::move(kept);
  }

  *normalized = std::move(doc);
  return true;
}

}  // namespace kube
}  // namespace deskbridge

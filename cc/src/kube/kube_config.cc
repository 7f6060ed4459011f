#include "deskbridge/kube/kube_config.h"

#include <initializer_list>
#include <utility>

namespace deskbridge {
namespace kube {

namespace {

// First string value found under any of `keys`. Documents arrive with either
// kubeconfig's kebab-case or the camelCase produced by normalization.
std::optional<std::string> GetOptionalString(
    const nlohmann::json& json, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = json.find(key);
    if (it != json.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}

std::string GetString(const nlohmann::json& json,
                      std::initializer_list<const char*> keys) {
  return GetOptionalString(json, keys).value_or("");
}

const nlohmann::json* GetObject(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_object()) return nullptr;
  return &*it;
}

bool ParseCluster(const nlohmann::json& entry, NamedCluster* cluster) {
  if (!entry.is_object()) return false;
  cluster->name = GetString(entry, {"name"});
  if (cluster->name.empty()) return false;

  if (const nlohmann::json* info = GetObject(entry, "cluster")) {
    cluster->cluster.server = GetString(*info, {"server"});
    cluster->cluster.certificate_authority = GetOptionalString(
        *info, {"certificate-authority", "certificateAuthority"});
    cluster->cluster.certificate_authority_data = GetOptionalString(
        *info, {"certificate-authority-data", "certificateAuthorityData"});
    for (const char* key : {"insecure-skip-tls-verify", "insecureSkipTlsVerify"}) {
      auto it = info->find(key);
      if (it != info->end() && it->is_boolean()) {
        cluster->cluster.insecure_skip_tls_verify = it->get<bool>();
        break;
      }
    }
  }
  return true;
}

bool ParseContext(const nlohmann::json& entry, NamedContext* context) {
  if (!entry.is_object()) return false;
  context->name = GetString(entry, {"name"});
  if (context->name.empty()) return false;

  if (const nlohmann::json* info = GetObject(entry, "context")) {
    context->context.cluster = GetString(*info, {"cluster"});
    context->context.user = GetString(*info, {"user"});
    context->context.namespace_name = GetOptionalString(*info, {"namespace"});
  }
  return true;
}

ExecConfig ParseExec(const nlohmann::json& exec) {
  ExecConfig config;
  config.api_version = GetString(exec, {"apiVersion"});
  config.command = GetString(exec, {"command"});

  auto args = exec.find("args");
  if (args != exec.end() && args->is_array()) {
    for (const auto& arg : *args) {
      if (arg.is_string()) config.args.push_back(arg.get<std::string>());
    }
  }

  auto env = exec.find("env");
  if (env != exec.end() && env->is_array()) {
    for (const auto& var : *env) {
      if (!var.is_object()) continue;
      config.env.push_back({GetString(var, {"name"}), GetString(var, {"value"})});
    }
  }
  return config;
}

bool ParseUser(const nlohmann::json& entry, NamedUser* user) {
  if (!entry.is_object()) return false;
  user->name = GetString(entry, {"name"});
  if (user->name.empty()) return false;

  const nlohmann::json* info = GetObject(entry, "user");
  if (!info) return false;

  UserInfo& u = user->user;
  u.token = GetOptionalString(*info, {"token"});
  u.token_file = GetOptionalString(*info, {"tokenFile", "token-file"});
  u.client_certificate =
      GetOptionalString(*info, {"clientCertificate", "client-certificate"});
  u.client_key = GetOptionalString(*info, {"clientKey", "client-key"});
  u.client_certificate_data = GetOptionalString(
      *info, {"client-certificate-data", "clientCertificateData"});
  u.client_key_data =
      GetOptionalString(*info, {"client-key-data", "clientKeyData"});
  u.username = GetOptionalString(*info, {"username"});
  u.password = GetOptionalString(*info, {"password"});
  if (const nlohmann::json* exec = GetObject(*info, "exec")) {
    u.exec = ParseExec(*exec);
  }
  return true;
}

template <typename T, typename ParseFn>
void ParseList(const nlohmann::json& root, const char* key, ParseFn parse,
               std::vector<T>* out) {
  auto it = root.find(key);
  if (it == root.end() || !it->is_array()) return;
  for (const auto& entry : *it) {
    T item;
    if (parse(entry, &item)) out->push_back(std::move(item));
  }
}

}  // namespace

CredentialKind UserInfo::Kind() const {
  if (exec) return CredentialKind::kExec;
  if (client_certificate || client_certificate_data) {
    return CredentialKind::kClientCertificate;
  }
  if (token || token_file) return CredentialKind::kToken;
  if (username) return CredentialKind::kBasicAuth;
  return CredentialKind::kNone;
}

const char* CredentialKindName(CredentialKind kind) {
  switch (kind) {
    case CredentialKind::kNone:              return "none";
    case CredentialKind::kToken:             return "token";
    case CredentialKind::kClientCertificate: return "client-certificate";
    case CredentialKind::kBasicAuth:         return "basic-auth";
    case CredentialKind::kExec:              return "exec";
  }
  return "unknown";
}

bool ParseKubeConfig(const nlohmann::json& normalized, KubeConfig* config,
                     std::string* error) {
  if (!normalized.is_object()) {
    if (error) *error = "Configuration document is not an object";
    return false;
  }

  KubeConfig parsed;
  parsed.api_version = GetString(normalized, {"apiVersion"});
  parsed.kind = GetString(normalized, {"kind"});
  parsed.current_context = GetOptionalString(normalized, {"currentContext"});
  if (const nlohmann::json* prefs = GetObject(normalized, "preferences")) {
    parsed.preferences = *prefs;
  }

  ParseList(normalized, "clusters", ParseCluster, &parsed.clusters);
  ParseList(normalized, "contexts", ParseContext, &parsed.contexts);
  ParseList(normalized, "users", ParseUser, &parsed.users);

  parsed.document = normalized;
  *config = std::move(parsed);
  return true;
}

}  // namespace kube
}  // namespace deskbridge

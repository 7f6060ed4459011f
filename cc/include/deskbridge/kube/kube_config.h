#ifndef DESKBRIDGE_KUBE_KUBE_CONFIG_H_
#define DESKBRIDGE_KUBE_KUBE_CONFIG_H_

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace deskbridge {
namespace kube {

struct ClusterInfo {
  std::string server;
  std::optional<std::string> certificate_authority;
  std::optional<std::string> certificate_authority_data;  // base64
  bool insecure_skip_tls_verify = false;
};

struct NamedCluster {
  std::string name;
  ClusterInfo cluster;
};

struct ContextInfo {
  std::string cluster;  // NamedCluster::name
  std::string user;     // NamedUser::name
  std::optional<std::string> namespace_name;
};

struct NamedContext {
  std::string name;
  ContextInfo context;
};

struct ExecEnvVar {
  std::string name;
  std::string value;
};

struct ExecConfig {
  std::string api_version;
  std::string command;
  std::vector<std::string> args;
  std::vector<ExecEnvVar> env;
};

enum class CredentialKind {
  kNone,
  kToken,
  kClientCertificate,
  kBasicAuth,
  kExec
};

struct UserInfo {
  std::optional<std::string> token;
  std::optional<std::string> token_file;
  std::optional<std::string> client_certificate;
  std::optional<std::string> client_key;
  std::optional<std::string> client_certificate_data;  // base64
  std::optional<std::string> client_key_data;          // base64
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<ExecConfig> exec;

  // Exec wins over a client certificate, which wins over a token.
  CredentialKind Kind() const;
};

struct NamedUser {
  std::string name;
  UserInfo user;
};

// One loaded configuration snapshot. `document` is the normalized JSON the
// typed lists were read from, kept whole: entries the typed lists skip (no
// name, not an object) are still present in it. Lookups go through the typed
// lists; `document` is what the host sent after normalization.
struct KubeConfig {
  std::string api_version;
  std::string kind;
  std::vector<NamedCluster> clusters;
  std::vector<NamedContext> contexts;
  std::vector<NamedUser> users;
  std::optional<std::string> current_context;
  nlohmann::json preferences = nlohmann::json::object();
  nlohmann::json document = nlohmann::json::object();
};

const char* CredentialKindName(CredentialKind kind);

// Reads typed records out of a normalized document. List entries that are
// not objects or have no name are skipped. Fails only when `normalized` is
// not an object.
bool ParseKubeConfig(const nlohmann::json& normalized, KubeConfig* config,
                     std::string* error = nullptr);

}  // namespace kube
}  // namespace deskbridge

#endif  // DESKBRIDGE_KUBE_KUBE_CONFIG_H_

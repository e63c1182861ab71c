#pragma once

#include "cluster/cluster_client.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace symptomops::cluster {

struct KubectlOptions {
  std::string kubectl_binary = "kubectl";
  // Empty means kubectl's own default resolution.
  std::string kubeconfig_path;
  std::chrono::milliseconds request_timeout{30000};
};

// Cluster client that shells out to kubectl and decodes its JSON output.
class KubectlClusterClient final : public ClusterClient {
public:
  explicit KubectlClusterClient(KubectlOptions options);

  bool NamespaceExists(const std::string& namespace_name, bool& exists,
                       std::string& error) override;
  bool ListDeployments(const std::string& namespace_name, std::vector<Deployment>& deployments,
                       std::string& error) override;

  // Common prefix: binary plus --kubeconfig/--request-timeout flags.
  std::string BaseCommand() const;

private:
  KubectlOptions options_;
};

// Decodes `kubectl get deployments -o json`. A deployment without
// `spec.replicas` wants one replica; a missing `status.readyReplicas` is zero.
bool ParseDeploymentListJson(std::string_view json_text, std::vector<Deployment>& deployments,
                             std::string& error);

// Parses RFC 3339 UTC timestamps as written by the API server
// (`2024-05-01T10:00:00Z`).
bool ParseRfc3339Utc(std::string_view text, std::chrono::system_clock::time_point& out);

} // namespace symptomops::cluster

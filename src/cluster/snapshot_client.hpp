#pragma once

#include "cluster/cluster_client.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace symptomops::cluster {

// In-memory cluster view for offline runs and tests. Namespaces map to their
// deployments; a namespace with no deployments still exists.
class SnapshotClusterClient final : public ClusterClient {
public:
  SnapshotClusterClient() = default;

  void AddNamespace(const std::string& namespace_name);
  void AddDeployment(const std::string& namespace_name, Deployment deployment);

  // Makes every query fail with `error` (simulates an unreachable cluster).
  void SetUnavailable(std::string error);

  bool NamespaceExists(const std::string& namespace_name, bool& exists,
                       std::string& error) override;
  bool ListDeployments(const std::string& namespace_name, std::vector<Deployment>& deployments,
                       std::string& error) override;

  std::size_t QueryCount() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<Deployment>> namespaces_;
  std::string unavailable_error_;
  std::size_t query_count_ = 0;
};

// Loads a snapshot file:
// {"namespaces":[{"name":"default","deployments":[{"name":"uecm-core",
//   "ready_replicas":1,"desired_replicas":1,"image":"...",
//   "created_at":"2024-05-01T10:00:00Z"}]}]}
bool LoadClusterSnapshotFile(const std::filesystem::path& snapshot_path,
                             SnapshotClusterClient& client, std::string& error);

} // namespace symptomops::cluster

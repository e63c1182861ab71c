#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace symptomops::cluster {

// Point-in-time view of one deployment.
struct Deployment {
  std::string name;
  std::int64_t ready_replicas = 0;
  std::int64_t desired_replicas = 0;
  std::chrono::system_clock::time_point created_at{};
  std::string image;
};

// Read-only cluster query contract used by preflight and `list-deployments`.
//
// Both calls return false only when the cluster could not be queried; a
// namespace that does not exist is `exists=false`, not an error.
class ClusterClient {
public:
  virtual ~ClusterClient() = default;

  virtual bool NamespaceExists(const std::string& namespace_name, bool& exists,
                               std::string& error) = 0;

  virtual bool ListDeployments(const std::string& namespace_name,
                               std::vector<Deployment>& deployments, std::string& error) = 0;
};

} // namespace symptomops::cluster

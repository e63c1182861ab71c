#include "cluster/snapshot_client.hpp"

#include "cluster/kubectl_client.hpp"
#include "core/json_dom.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace symptomops::cluster {

void SnapshotClusterClient::AddNamespace(const std::string& namespace_name) {
  std::lock_guard<std::mutex> lock(mu_);
  (void)namespaces_[namespace_name];
}

void SnapshotClusterClient::AddDeployment(const std::string& namespace_name,
                                          Deployment deployment) {
  std::lock_guard<std::mutex> lock(mu_);
  namespaces_[namespace_name].push_back(std::move(deployment));
}

void SnapshotClusterClient::SetUnavailable(std::string error) {
  std::lock_guard<std::mutex> lock(mu_);
  unavailable_error_ = std::move(error);
}

bool SnapshotClusterClient::NamespaceExists(const std::string& namespace_name, bool& exists,
                                            std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++query_count_;
  exists = false;
  if (!unavailable_error_.empty()) {
    error = unavailable_error_;
    return false;
  }
  exists = namespaces_.count(namespace_name) != 0U;
  return true;
}

bool SnapshotClusterClient::ListDeployments(const std::string& namespace_name,
                                            std::vector<Deployment>& deployments,
                                            std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  ++query_count_;
  deployments.clear();
  if (!unavailable_error_.empty()) {
    error = unavailable_error_;
    return false;
  }
  const auto it = namespaces_.find(namespace_name);
  if (it != namespaces_.end()) {
    deployments = it->second;
  }
  return true;
}

std::size_t SnapshotClusterClient::QueryCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return query_count_;
}

bool LoadClusterSnapshotFile(const std::filesystem::path& snapshot_path,
                             SnapshotClusterClient& client, std::string& error) {
  std::ifstream in(snapshot_path, std::ios::binary);
  if (!in) {
    error = "failed to open cluster snapshot '" + snapshot_path.string() + "'";
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  core::json::Value root;
  if (!core::json::Parse(buffer.str(), root, error)) {
    error = "invalid cluster snapshot '" + snapshot_path.string() + "': " + error;
    return false;
  }
  const core::json::Value* namespaces = root.Find("namespaces");
  if (namespaces == nullptr || !namespaces->IsArray()) {
    error = "invalid cluster snapshot: missing 'namespaces' array";
    return false;
  }

  for (std::size_t i = 0; i < namespaces->array_value.size(); ++i) {
    const core::json::Value& ns = namespaces->array_value[i];
    const std::string where = "namespaces[" + std::to_string(i) + "]";
    const core::json::Value* name = ns.Find("name");
    if (name == nullptr || !name->IsString() || name->string_value.empty()) {
      error = "invalid cluster snapshot: " + where + ".name must be a non-empty string";
      return false;
    }
    client.AddNamespace(name->string_value);

    const core::json::Value* deployments = ns.Find("deployments");
    if (deployments == nullptr) {
      continue;
    }
    if (!deployments->IsArray()) {
      error = "invalid cluster snapshot: " + where + ".deployments must be an array";
      return false;
    }
    for (std::size_t j = 0; j < deployments->array_value.size(); ++j) {
      const core::json::Value& item = deployments->array_value[j];
      const std::string item_where = where + ".deployments[" + std::to_string(j) + "]";
      const core::json::Value* deployment_name = item.Find("name");
      if (deployment_name == nullptr || !deployment_name->IsString() ||
          deployment_name->string_value.empty()) {
        error = "invalid cluster snapshot: " + item_where + ".name must be a non-empty string";
        return false;
      }

      Deployment deployment;
      deployment.name = deployment_name->string_value;
      const core::json::Value* desired = item.Find("desired_replicas");
      deployment.desired_replicas =
          desired != nullptr && desired->IsNumber()
              ? static_cast<std::int64_t>(desired->number_value)
              : 1;
      const core::json::Value* ready = item.Find("ready_replicas");
      deployment.ready_replicas =
          ready != nullptr && ready->IsNumber() ? static_cast<std::int64_t>(ready->number_value)
                                                : 0;
      const core::json::Value* image = item.Find("image");
      if (image != nullptr && image->IsString()) {
        deployment.image = image->string_value;
      }
      const core::json::Value* created = item.Find("created_at");
      if (created != nullptr && created->IsString() &&
          !ParseRfc3339Utc(created->string_value, deployment.created_at)) {
        error = "invalid cluster snapshot: " + item_where +
                ".created_at must be an RFC 3339 UTC timestamp";
        return false;
      }
      client.AddDeployment(name->string_value, std::move(deployment));
    }
  }
  return true;
}

} // namespace symptomops::cluster

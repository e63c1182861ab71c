#pragma once

#include "cluster/cluster_client.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace symptomops::preflight {

enum class FailureKind {
  kNone,
  kNamespaceNotFound,
  kDeploymentNotFound,
  kDeploymentAmbiguous,
  kDeploymentNotReady,
  kClusterQueryFailed,
};

// Readiness of the single deployment a fragment resolved to.
struct DeploymentReadiness {
  std::string fragment;
  std::string deployment_name;
  std::int64_t ready_replicas = 0;
  std::int64_t desired_replicas = 0;
  bool ready = false;
};

struct PreflightReport {
  std::string namespace_name;
  bool namespace_exists = false;
  std::vector<DeploymentReadiness> deployments;
  FailureKind failure = FailureKind::kNone;
  // Fragment that caused the failure (empty for namespace/cluster failures).
  std::string failing_fragment;
  std::vector<std::string> candidate_names;
};

const char* ToString(FailureKind kind);

// Point-in-time precondition check. Read-only.
//
// Passes when `namespace_name` exists and every fragment is a substring of
// exactly one deployment name whose ready replicas reach the desired count.
// Fragments are checked in order and the first failure wins.
//
// Contract:
// - true: every fragment resolved and is ready; `report.deployments` holds one
//   entry per fragment, in fragment order.
// - false: `report.failure` classifies the failure and `error` is an operator
//   message naming the namespace/fragment.
bool ValidatePreflight(cluster::ClusterClient& client, const std::string& namespace_name,
                       const std::vector<std::string>& fragments, PreflightReport& report,
                       std::string& error);

std::string ToJson(const DeploymentReadiness& readiness);
std::string ToJson(const PreflightReport& report);

} // namespace symptomops::preflight

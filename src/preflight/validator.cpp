#include "preflight/validator.hpp"

#include "core/json_utils.hpp"

#include <sstream>

namespace symptomops::preflight {

const char* ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kNamespaceNotFound:
    return "namespace_not_found";
  case FailureKind::kDeploymentNotFound:
    return "deployment_not_found";
  case FailureKind::kDeploymentAmbiguous:
    return "deployment_ambiguous";
  case FailureKind::kDeploymentNotReady:
    return "deployment_not_ready";
  case FailureKind::kClusterQueryFailed:
    return "cluster_query_failed";
  }
  return "unknown";
}

bool ValidatePreflight(cluster::ClusterClient& client, const std::string& namespace_name,
                       const std::vector<std::string>& fragments, PreflightReport& report,
                       std::string& error) {
  report = PreflightReport{};
  report.namespace_name = namespace_name;
  error.clear();

  if (fragments.empty()) {
    report.failure = FailureKind::kDeploymentNotFound;
    error = "no pod fragment given; pass at least one with -p";
    return false;
  }
  for (const auto& fragment : fragments) {
    if (fragment.empty()) {
      report.failure = FailureKind::kDeploymentNotFound;
      error = "empty pod fragment is not allowed";
      return false;
    }
  }

  bool exists = false;
  std::string query_error;
  if (!client.NamespaceExists(namespace_name, exists, query_error)) {
    report.failure = FailureKind::kClusterQueryFailed;
    error = "failed to check namespace '" + namespace_name + "': " + query_error;
    return false;
  }
  report.namespace_exists = exists;
  if (!exists) {
    report.failure = FailureKind::kNamespaceNotFound;
    error = "namespace '" + namespace_name + "' not found";
    return false;
  }

  std::vector<cluster::Deployment> deployments;
  if (!client.ListDeployments(namespace_name, deployments, query_error)) {
    report.failure = FailureKind::kClusterQueryFailed;
    error = "failed to list deployments in namespace '" + namespace_name + "': " + query_error;
    return false;
  }

  for (const auto& fragment : fragments) {
    std::vector<const cluster::Deployment*> matches;
    for (const auto& deployment : deployments) {
      if (deployment.name.find(fragment) != std::string::npos) {
        matches.push_back(&deployment);
      }
    }

    if (matches.empty()) {
      report.failure = FailureKind::kDeploymentNotFound;
      report.failing_fragment = fragment;
      error = "no deployment matching '" + fragment + "' in namespace '" + namespace_name + "'";
      return false;
    }
    if (matches.size() > 1U) {
      report.failure = FailureKind::kDeploymentAmbiguous;
      report.failing_fragment = fragment;
      std::string names;
      for (const auto* match : matches) {
        report.candidate_names.push_back(match->name);
        if (!names.empty()) {
          names += ", ";
        }
        names += match->name;
      }
      error = "fragment '" + fragment + "' matches more than one deployment in namespace '" +
              namespace_name + "': " + names;
      return false;
    }

    const cluster::Deployment& match = *matches.front();
    DeploymentReadiness readiness;
    readiness.fragment = fragment;
    readiness.deployment_name = match.name;
    readiness.ready_replicas = match.ready_replicas;
    readiness.desired_replicas = match.desired_replicas;
    readiness.ready = match.ready_replicas >= match.desired_replicas;
    report.deployments.push_back(readiness);

    if (!readiness.ready) {
      report.failure = FailureKind::kDeploymentNotReady;
      report.failing_fragment = fragment;
      error = "deployment '" + match.name + "' is not ready (" +
              std::to_string(match.ready_replicas) + "/" +
              std::to_string(match.desired_replicas) + " replicas ready)";
      return false;
    }
  }

  return true;
}

std::string ToJson(const DeploymentReadiness& readiness) {
  std::ostringstream out;
  out << "{"
      << "\"fragment\":" << core::QuoteJson(readiness.fragment) << ","
      << "\"deployment\":" << core::QuoteJson(readiness.deployment_name) << ","
      << "\"ready_replicas\":" << readiness.ready_replicas << ","
      << "\"desired_replicas\":" << readiness.desired_replicas << ","
      << "\"ready\":" << (readiness.ready ? "true" : "false") << "}";
  return out.str();
}

std::string ToJson(const PreflightReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"namespace\":" << core::QuoteJson(report.namespace_name) << ","
      << "\"namespace_exists\":" << (report.namespace_exists ? "true" : "false") << ","
      << "\"failure\":" << core::QuoteJson(ToString(report.failure)) << ","
      << "\"deployments\":[";
  for (std::size_t i = 0; i < report.deployments.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << ToJson(report.deployments[i]);
  }
  out << "]}";
  return out.str();
}

} // namespace symptomops::preflight

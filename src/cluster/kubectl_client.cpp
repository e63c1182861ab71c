#include "cluster/kubectl_client.hpp"

#include "core/json_dom.hpp"
#include "core/process/command_runner.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <utility>

namespace symptomops::cluster {

namespace {

std::string ShellQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}

// Only the API server's verdict counts; a shell "command not found" does not.
bool LooksLikeNotFound(std::string_view output) {
  return output.find("(NotFound)") != std::string_view::npos;
}

std::string FirstLine(const std::string& text) {
  const std::size_t newline = text.find('\n');
  return newline == std::string::npos ? text : text.substr(0, newline);
}

std::int64_t ReadInt(const core::json::Value& object, std::string_view dotted,
                     std::int64_t fallback) {
  const core::json::Value* value = object.FindPath(dotted);
  if (value == nullptr || !value->IsNumber()) {
    return fallback;
  }
  return static_cast<std::int64_t>(value->number_value);
}

bool ParseFixedInt(std::string_view text, std::size_t pos, std::size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + width;
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // namespace

KubectlClusterClient::KubectlClusterClient(KubectlOptions options) : options_(std::move(options)) {}

std::string KubectlClusterClient::BaseCommand() const {
  std::string command = options_.kubectl_binary;
  if (!options_.kubeconfig_path.empty()) {
    command += " --kubeconfig " + ShellQuote(options_.kubeconfig_path);
  }
  if (options_.request_timeout.count() > 0) {
    const auto seconds = std::max<std::int64_t>(
        1, std::chrono::duration_cast<std::chrono::seconds>(options_.request_timeout).count());
    command += " --request-timeout=" + std::to_string(seconds) + "s";
  }
  return command;
}

bool KubectlClusterClient::NamespaceExists(const std::string& namespace_name, bool& exists,
                                           std::string& error) {
  exists = false;
  error.clear();
  const std::string command =
      BaseCommand() + " get namespace " + ShellQuote(namespace_name) + " -o name";

  std::string output;
  int exit_code = -1;
  if (!core::process::RunShellCommand(command, output, exit_code, error)) {
    return false;
  }
  if (exit_code == 0) {
    exists = true;
    return true;
  }
  if (LooksLikeNotFound(output)) {
    return true;
  }
  error = "kubectl get namespace failed (exit " + std::to_string(exit_code) +
          "): " + FirstLine(output);
  return false;
}

bool KubectlClusterClient::ListDeployments(const std::string& namespace_name,
                                           std::vector<Deployment>& deployments,
                                           std::string& error) {
  deployments.clear();
  error.clear();
  const std::string command =
      BaseCommand() + " get deployments -n " + ShellQuote(namespace_name) + " -o json";

  std::string output;
  int exit_code = -1;
  if (!core::process::RunShellCommand(command, output, exit_code, error)) {
    return false;
  }
  if (exit_code != 0) {
    error = "kubectl get deployments failed (exit " + std::to_string(exit_code) +
            "): " + FirstLine(output);
    return false;
  }
  return ParseDeploymentListJson(output, deployments, error);
}

bool ParseDeploymentListJson(std::string_view json_text, std::vector<Deployment>& deployments,
                             std::string& error) {
  deployments.clear();
  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid deployment list: " + error;
    return false;
  }
  const core::json::Value* items = root.Find("items");
  if (items == nullptr || !items->IsArray()) {
    error = "invalid deployment list: missing 'items' array";
    return false;
  }

  for (std::size_t i = 0; i < items->array_value.size(); ++i) {
    const core::json::Value& item = items->array_value[i];
    const core::json::Value* name = item.FindPath("metadata.name");
    if (name == nullptr || !name->IsString() || name->string_value.empty()) {
      error = "invalid deployment list: items[" + std::to_string(i) + "] has no metadata.name";
      return false;
    }

    Deployment deployment;
    deployment.name = name->string_value;
    deployment.desired_replicas = ReadInt(item, "spec.replicas", 1);
    deployment.ready_replicas = ReadInt(item, "status.readyReplicas", 0);

    const core::json::Value* created = item.FindPath("metadata.creationTimestamp");
    if (created != nullptr && created->IsString()) {
      (void)ParseRfc3339Utc(created->string_value, deployment.created_at);
    }

    const core::json::Value* containers = item.FindPath("spec.template.spec.containers");
    if (containers != nullptr && containers->IsArray() && !containers->array_value.empty()) {
      const core::json::Value* image = containers->array_value.front().Find("image");
      if (image != nullptr && image->IsString()) {
        deployment.image = image->string_value;
      }
    }
    deployments.push_back(std::move(deployment));
  }
  return true;
}

bool ParseRfc3339Utc(std::string_view text, std::chrono::system_clock::time_point& out) {
  // YYYY-MM-DDTHH:MM:SS[.fff]Z
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':') {
    return false;
  }
  std::tm tm{};
  int year = 0;
  int month = 0;
  if (!ParseFixedInt(text, 0, 4, year) || !ParseFixedInt(text, 5, 2, month) ||
      !ParseFixedInt(text, 8, 2, tm.tm_mday) || !ParseFixedInt(text, 11, 2, tm.tm_hour) ||
      !ParseFixedInt(text, 14, 2, tm.tm_min) || !ParseFixedInt(text, 17, 2, tm.tm_sec)) {
    return false;
  }
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;

  std::size_t pos = 19;
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }
  if (pos >= text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
    return false;
  }

  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return false;
  }
  out = std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
  return true;
}

} // namespace symptomops::cluster

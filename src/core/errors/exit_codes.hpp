#pragma once

namespace symptomops::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values keep their conventional meanings:
// - 0 success (a closed session, even with partial-collection warnings)
// - 1 generic command failure
// - 2 usage/argument failure
//
// Higher values classify failures so wrappers can branch without parsing
// stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kValidationFailed = 20,
  kClusterUnavailable = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace symptomops::core::errors

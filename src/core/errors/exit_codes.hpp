#pragma once

namespace distrun::core::errors {

// Stable process-exit contract for scripts wrapping `distrun`.
//
// The first three values keep their conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values map one-to-one onto task failure kinds so callers can
// branch on the failing stage without parsing stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kProjectInvalid = 10,
  kMissingArtifact = 20,
  kInstallFailed = 30,
  kPackagingFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace distrun::core::errors

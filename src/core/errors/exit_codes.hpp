#pragma once

namespace resilab::core::errors {

// Process-exit contract for experiment automation.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let pipeline scripts tell a bad config file apart from
// an empty trace backend or a chaos validation that did not bite.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDiscoveryFailed = 20,
  kValidationFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace resilab::core::errors

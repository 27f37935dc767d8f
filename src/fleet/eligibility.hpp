#pragma once

#include "fleet/service_name.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace resilab::fleet {

enum class ExclusionSource {
  kDisallowlist,
  kPatternFallback,
};

const char* ToString(ExclusionSource source);

// Decides which services may be killed. The chaos executor and the
// reliability estimator consult the same instance, so the modeled population
// and the real kill population never diverge.
struct EligibilityPolicy {
  std::set<std::string> disallowed;
  std::set<std::string> entrypoints;
  ExclusionSource source = ExclusionSource::kPatternFallback;

  bool IsEligible(const std::string& normalized_service) const;
  ServiceCategory Classify(const std::string& normalized_service) const;
};

// Reads a disallowlist text file and normalizes every entry.
bool LoadServiceList(const std::filesystem::path& path, std::vector<std::string>& services,
                     std::string& error);

// Builds the policy for one fleet observation.
//
// When at least one disallowlist entry names an observed service, exclusion is
// exactly `disallowlist ∪ entrypoints`. Otherwise the list is treated as
// stale and exclusion falls back to the infrastructure pattern plus
// entrypoints; `fallback_reason` then describes why.
EligibilityPolicy BuildEligibilityPolicy(const std::vector<std::string>& disallowlist,
                                         const std::vector<std::string>& entrypoints,
                                         const std::vector<std::string>& observed_services,
                                         std::string& fallback_reason);

} // namespace resilab::fleet

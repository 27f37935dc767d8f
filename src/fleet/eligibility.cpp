#include "fleet/eligibility.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>

namespace resilab::fleet {

const char* ToString(ExclusionSource source) {
  switch (source) {
  case ExclusionSource::kDisallowlist:
    return "disallowlist";
  case ExclusionSource::kPatternFallback:
    return "pattern_fallback";
  }
  return "pattern_fallback";
}

bool EligibilityPolicy::IsEligible(const std::string& normalized_service) const {
  if (entrypoints.count(normalized_service) != 0U) {
    return false;
  }
  if (source == ExclusionSource::kDisallowlist) {
    return disallowed.count(normalized_service) == 0U;
  }
  return !MatchesInfrastructurePattern(normalized_service);
}

ServiceCategory EligibilityPolicy::Classify(const std::string& normalized_service) const {
  if (entrypoints.count(normalized_service) != 0U) {
    return ServiceCategory::kEntrypoint;
  }
  if (MatchesInfrastructurePattern(normalized_service) ||
      disallowed.count(normalized_service) != 0U) {
    return ServiceCategory::kInfrastructure;
  }
  return ServiceCategory::kApplication;
}

bool LoadServiceList(const std::filesystem::path& path, std::vector<std::string>& services,
                     std::string& error) {
  std::vector<std::string> raw_entries;
  if (!core::ReadListFile(path, raw_entries, error)) {
    return false;
  }
  services.clear();
  for (const auto& entry : raw_entries) {
    std::string normalized = NormalizeServiceName(entry);
    if (!normalized.empty()) {
      services.push_back(std::move(normalized));
    }
  }
  return true;
}

EligibilityPolicy BuildEligibilityPolicy(const std::vector<std::string>& disallowlist,
                                         const std::vector<std::string>& entrypoints,
                                         const std::vector<std::string>& observed_services,
                                         std::string& fallback_reason) {
  fallback_reason.clear();

  EligibilityPolicy policy;
  for (const auto& entry : entrypoints) {
    policy.entrypoints.insert(NormalizeServiceName(entry));
  }
  for (const auto& entry : disallowlist) {
    policy.disallowed.insert(NormalizeServiceName(entry));
  }

  std::set<std::string> observed;
  for (const auto& service : observed_services) {
    observed.insert(NormalizeServiceName(service));
  }

  const bool any_match =
      std::any_of(policy.disallowed.begin(), policy.disallowed.end(),
                  [&observed](const std::string& name) { return observed.count(name) != 0U; });
  if (any_match) {
    policy.source = ExclusionSource::kDisallowlist;
    return policy;
  }

  policy.source = ExclusionSource::kPatternFallback;
  if (policy.disallowed.empty()) {
    fallback_reason = "no disallowlist entries; excluding infrastructure by name pattern";
  } else {
    fallback_reason =
        "no disallowlist entry matches an observed service; excluding infrastructure by name "
        "pattern";
  }
  return policy;
}

} // namespace resilab::fleet

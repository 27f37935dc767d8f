#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace resilab::model {

struct AnyOf {
  std::vector<std::string> items;
};

struct AllOf {
  std::vector<std::string> items;
};

struct KOfN {
  int k = 1;
  std::vector<std::string> items;
};

using SuccessRule = std::variant<AnyOf, AllOf, KOfN>;

const std::vector<std::string>& RuleItems(const SuccessRule& rule);

// Minimum number of reachable items for the rule to hold.
std::size_t RequiredCount(const SuccessRule& rule);

const char* RuleKind(const SuccessRule& rule);

// One HTTP request of a probe workflow.
struct ProbeStep {
  std::string method = "GET";
  std::string path;
  std::string body;
};

// Declared user-facing endpoint. Service names are stored normalized.
struct TargetSpec {
  std::string endpoint;
  // Empty means the graph's first entrypoint.
  std::string entry;
  SuccessRule rule;
  bool exclude_async = false;
  // Ordered workflow; empty when the endpoint is model-only.
  std::vector<ProbeStep> probe;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Validates and parses `targets.json` text.
//
// Contract:
// - Returns true when validation completed (even if the document is invalid).
// - `targets` is filled only when `report.valid` is true, sorted by endpoint.
// - Parse errors become a single issue under path `$`.
bool ParseTargetSpecs(std::string_view json_text, std::vector<TargetSpec>& targets,
                      ValidationReport& report, std::string& error);

// Reads and validates a targets file. Returns false only on I/O failure.
bool LoadTargetSpecs(const std::filesystem::path& path, std::vector<TargetSpec>& targets,
                     ValidationReport& report, std::string& error);

// Multi-line `path: message` listing for CLI output.
std::string FormatValidationReport(const ValidationReport& report);

bool FindTarget(const std::vector<TargetSpec>& targets, const std::string& endpoint,
                const TargetSpec*& target);

// Explicit `entry` services of `targets`, sorted and deduplicated. Callers add
// them to the eligibility policy's entrypoints so chaos never kills them.
std::vector<std::string> DeclaredEntryServices(const std::vector<TargetSpec>& targets);

// Filename-safe form of an endpoint label (`POST /api/cart` -> `POST_api_cart`).
std::string SafeEndpointLabel(std::string_view endpoint);

} // namespace resilab::model

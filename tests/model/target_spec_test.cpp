#include "model/target_spec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <vector>

using resilab::model::ParseTargetSpecs;
using resilab::model::TargetSpec;
using resilab::model::ValidationReport;

namespace {

bool HasIssueAt(const ValidationReport& report, const std::string& path) {
  for (const auto& issue : report.issues) {
    if (issue.path == path) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Targets parse into typed success rules", "[model][targets]") {
  const std::string text = R"({
    "POST /api/checkout": {
      "entry": "FrontendService",
      "all_of": ["checkout_service", "redis-cart"],
      "probe": {"steps": [
        {"path": "/api/cart", "method": "post", "body": "{}"},
        {"path": "/api/checkout", "method": "POST"}
      ]}
    },
    "GET /": {"any_of": ["frontend"], "probe": {"path": "/"}},
    "async": {"k_of_n": {"k": 2, "items": ["a", "b", "c"]}, "exclude_async": true}
  })";

  std::vector<TargetSpec> targets;
  ValidationReport report;
  std::string error;
  REQUIRE(ParseTargetSpecs(text, targets, report, error));
  REQUIRE(report.valid);
  REQUIRE(targets.size() == 3U);

  // Sorted by endpoint label.
  REQUIRE(targets[0].endpoint == "GET /");
  REQUIRE(targets[1].endpoint == "POST /api/checkout");
  REQUIRE(targets[2].endpoint == "async");

  const TargetSpec& checkout = targets[1];
  REQUIRE(checkout.entry == "frontend");
  REQUIRE(std::holds_alternative<resilab::model::AllOf>(checkout.rule));
  REQUIRE(resilab::model::RuleItems(checkout.rule) ==
          std::vector<std::string>{"checkout", "redis-cart"});
  REQUIRE(resilab::model::RequiredCount(checkout.rule) == 2U);
  REQUIRE(checkout.probe.size() == 2U);
  REQUIRE(checkout.probe[0].method == "POST");
  REQUIRE(checkout.probe[0].body == "{}");

  REQUIRE(targets[0].entry.empty());
  REQUIRE(targets[0].probe.size() == 1U);
  REQUIRE(targets[0].probe[0].method == "GET");

  REQUIRE(std::string(resilab::model::RuleKind(targets[2].rule)) == "k_of_n");
  REQUIRE(resilab::model::RequiredCount(targets[2].rule) == 2U);
  REQUIRE(targets[2].exclude_async);
  REQUIRE(targets[2].probe.empty());
}

TEST_CASE("Exactly one success rule is required", "[model][targets]") {
  std::vector<TargetSpec> targets;
  ValidationReport report;
  std::string error;

  REQUIRE(ParseTargetSpecs(R"({"x": {"any_of": ["a"], "all_of": ["b"]}})", targets, report,
                           error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "x"));
  REQUIRE(targets.empty());

  REQUIRE(ParseTargetSpecs(R"({"x": {"entry": "frontend"}})", targets, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.front().message.find("found 0") != std::string::npos);
}

TEST_CASE("k_of_n bounds are enforced", "[model][targets]") {
  std::vector<TargetSpec> targets;
  ValidationReport report;
  std::string error;

  REQUIRE(ParseTargetSpecs(R"({"x": {"k_of_n": {"k": 3, "items": ["a", "b"]}}})", targets,
                           report, error));
  REQUIRE(HasIssueAt(report, "x.k_of_n.k"));

  REQUIRE(ParseTargetSpecs(R"({"x": {"k_of_n": {"k": 0, "items": ["a"]}}})", targets, report,
                           error));
  REQUIRE(HasIssueAt(report, "x.k_of_n.k"));

  REQUIRE(ParseTargetSpecs(R"({"x": {"k_of_n": {"k": 1.5, "items": ["a"]}}})", targets, report,
                           error));
  REQUIRE(HasIssueAt(report, "x.k_of_n.k"));

  REQUIRE(ParseTargetSpecs(R"({"x": {"k_of_n": {"k": 1, "items": []}}})", targets, report,
                           error));
  REQUIRE(HasIssueAt(report, "x.k_of_n.items"));
}

TEST_CASE("Validation collects every issue with its path", "[model][targets]") {
  const std::string text = R"({
    "a": {"any_of": ["svc", 7], "bogus": 1},
    "b": {"all_of": ["x"], "exclude_async": "yes"},
    "c": {"any_of": ["x"], "probe": {"path": "no-slash", "method": "TRACE"}}
  })";

  std::vector<TargetSpec> targets;
  ValidationReport report;
  std::string error;
  REQUIRE(ParseTargetSpecs(text, targets, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "a.any_of[1]"));
  REQUIRE(HasIssueAt(report, "a.bogus"));
  REQUIRE(HasIssueAt(report, "b.exclude_async"));
  REQUIRE(HasIssueAt(report, "c.probe.path"));
  REQUIRE(HasIssueAt(report, "c.probe.method"));

  const std::string listing = resilab::model::FormatValidationReport(report);
  REQUIRE(listing.find("a.bogus: unknown field") != std::string::npos);
}

TEST_CASE("Malformed or empty documents report at the root", "[model][targets]") {
  std::vector<TargetSpec> targets;
  ValidationReport report;
  std::string error;

  REQUIRE(ParseTargetSpecs("{not json", targets, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueAt(report, "$"));

  REQUIRE(ParseTargetSpecs("{}", targets, report, error));
  REQUIRE(HasIssueAt(report, "$"));

  REQUIRE(ParseTargetSpecs("[]", targets, report, error));
  REQUIRE(HasIssueAt(report, "$"));
}

TEST_CASE("Endpoint labels map to filename-safe names", "[model][targets]") {
  REQUIRE(resilab::model::SafeEndpointLabel("POST /api/cart") == "POST_api_cart");
  REQUIRE(resilab::model::SafeEndpointLabel("GET /") == "GET");
  REQUIRE(resilab::model::SafeEndpointLabel("///") == "endpoint");
  REQUIRE(resilab::model::SafeEndpointLabel("v1.2-x") == "v1.2-x");
}

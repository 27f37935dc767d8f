#include "fleet/eligibility.hpp"
#include "fleet/service_name.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using resilab::fleet::NormalizeServiceName;

TEST_CASE("Service names normalize to one canonical identity", "[fleet][service_name]") {
  REQUIRE(NormalizeServiceName("CheckoutService") == "checkout");
  REQUIRE(NormalizeServiceName("checkout_service") == "checkout");
  REQUIRE(NormalizeServiceName("checkout-svc") == "checkout");
  REQUIRE(NormalizeServiceName("  checkout  ") == "checkout");
  REQUIRE(NormalizeServiceName("fraud_detection") == "fraud-detection");
  REQUIRE(NormalizeServiceName("redis-cart") == "redis-cart");
}

TEST_CASE("Suffix stripping never empties a name", "[fleet][service_name]") {
  REQUIRE(NormalizeServiceName("service") == "service");
  REQUIRE(NormalizeServiceName("").empty());
}

TEST_CASE("Infrastructure pattern matches name suffixes", "[fleet][service_name]") {
  using resilab::fleet::MatchesInfrastructurePattern;
  REQUIRE(MatchesInfrastructurePattern("kafka"));
  REQUIRE(MatchesInfrastructurePattern("demo-kafka"));
  REQUIRE(MatchesInfrastructurePattern("otel-collector"));
  REQUIRE(MatchesInfrastructurePattern("frontend-proxy"));
  REQUIRE(MatchesInfrastructurePattern("load-generator"));
  REQUIRE_FALSE(MatchesInfrastructurePattern("frontend"));
  REQUIRE_FALSE(MatchesInfrastructurePattern("checkout"));
  REQUIRE_FALSE(MatchesInfrastructurePattern("kafka-consumer"));
}

TEST_CASE("Disallowlist applies when it names an observed service", "[fleet][eligibility]") {
  std::string fallback_reason;
  const auto policy = resilab::fleet::BuildEligibilityPolicy(
      {"Redis_Cart"}, resilab::fleet::DefaultEntrypoints(),
      {"frontend", "checkout", "redis-cart", "kafka"}, fallback_reason);

  REQUIRE(policy.source == resilab::fleet::ExclusionSource::kDisallowlist);
  REQUIRE(fallback_reason.empty());
  REQUIRE_FALSE(policy.IsEligible("redis-cart"));
  REQUIRE_FALSE(policy.IsEligible("frontend"));
  REQUIRE(policy.IsEligible("checkout"));
  // Exclusion is exactly disallowlist plus entrypoints; patterns are off.
  REQUIRE(policy.IsEligible("kafka"));
}

TEST_CASE("Stale disallowlist falls back to the infrastructure pattern", "[fleet][eligibility]") {
  std::string fallback_reason;
  const auto policy = resilab::fleet::BuildEligibilityPolicy(
      {"legacy-db"}, resilab::fleet::DefaultEntrypoints(), {"frontend", "checkout", "kafka"},
      fallback_reason);

  REQUIRE(policy.source == resilab::fleet::ExclusionSource::kPatternFallback);
  REQUIRE_FALSE(fallback_reason.empty());
  REQUIRE_FALSE(policy.IsEligible("kafka"));
  REQUIRE_FALSE(policy.IsEligible("frontend"));
  REQUIRE_FALSE(policy.IsEligible("frontend-proxy"));
  REQUIRE(policy.IsEligible("checkout"));
}

TEST_CASE("Empty disallowlist explains the fallback", "[fleet][eligibility]") {
  std::string fallback_reason;
  const auto policy =
      resilab::fleet::BuildEligibilityPolicy({}, {"frontend"}, {"frontend"}, fallback_reason);
  REQUIRE(policy.source == resilab::fleet::ExclusionSource::kPatternFallback);
  REQUIRE(fallback_reason.find("no disallowlist entries") != std::string::npos);
}

TEST_CASE("Classify separates entrypoints infrastructure and application services",
          "[fleet][eligibility]") {
  std::string fallback_reason;
  const auto policy = resilab::fleet::BuildEligibilityPolicy(
      {}, resilab::fleet::DefaultEntrypoints(), {}, fallback_reason);
  REQUIRE(policy.Classify("frontend") == resilab::fleet::ServiceCategory::kEntrypoint);
  REQUIRE(policy.Classify("jaeger") == resilab::fleet::ServiceCategory::kInfrastructure);
  REQUIRE(policy.Classify("cart") == resilab::fleet::ServiceCategory::kApplication);
  REQUIRE(std::string(resilab::fleet::ToString(policy.Classify("cart"))) == "application");
}

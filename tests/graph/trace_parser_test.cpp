#include "graph/trace_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using resilab::graph::RelationKey;
using resilab::graph::RelationSet;
using resilab::graph::Transport;

namespace {

std::int64_t CallsOf(const RelationSet& relations, const std::string& caller,
                     const std::string& callee, Transport transport) {
  const auto it = relations.calls.find(RelationKey{caller, callee, transport});
  return it == relations.calls.end() ? 0 : it->second;
}

} // namespace

TEST_CASE("Jaeger parent references produce sync relations", "[graph][traces]") {
  const std::string text = R"({"data":[{
    "processes": {"p1": {"serviceName": "frontend"}, "p2": {"serviceName": "cart"}},
    "spans": [
      {"spanID": "a", "processID": "p1", "startTime": 1},
      {"spanID": "b", "processID": "p2", "startTime": 2,
       "references": [{"refType": "CHILD_OF", "spanID": "a"}]},
      {"spanID": "c", "processID": "p2", "startTime": 3, "parentSpanID": "b"}
    ]}]})";

  RelationSet relations;
  std::string error;
  REQUIRE(resilab::graph::ParseJaegerTraceText(text, relations, error));
  REQUIRE(relations.calls.size() == 1U);
  REQUIRE(CallsOf(relations, "frontend", "cart", Transport::kSync) == 1);
}

TEST_CASE("Producer and consumer spans produce async relations", "[graph][traces]") {
  const std::string text = R"([{
    "processes": {"p1": {"serviceName": "checkout"}, "p2": {"serviceName": "accounting"}},
    "spans": [
      {"spanID": "a", "processID": "p1",
       "tags": [{"key": "span.kind", "value": "producer"},
                {"key": "messaging.system", "value": "kafka"}]},
      {"spanID": "b", "processID": "p2",
       "tags": [{"key": "span.kind", "value": "consumer"}],
       "references": [{"refType": "FOLLOWS_FROM", "spanID": "a"}]}
    ]}])";

  RelationSet relations;
  std::string error;
  REQUIRE(resilab::graph::ParseJaegerTraceText(text, relations, error));
  REQUIRE(CallsOf(relations, "checkout", "accounting", Transport::kAsync) == 1);
  REQUIRE(relations.messaging_systems.count("kafka") == 1U);
}

TEST_CASE("Traces without parent links fall back to time order", "[graph][traces]") {
  const std::string text = R"({"data":[{
    "processes": {"p1": {"serviceName": "frontend"}, "p2": {"serviceName": "cart"},
                  "p3": {"serviceName": "redis-cart"}},
    "spans": [
      {"spanID": "c", "processID": "p3", "startTime": 30},
      {"spanID": "a", "processID": "p1", "startTime": 10},
      {"spanID": "b", "processID": "p2", "startTime": 20},
      {"spanID": "d", "processID": "p2", "startTime": 25}
    ]}]})";

  RelationSet relations;
  std::string error;
  REQUIRE(resilab::graph::ParseJaegerTraceText(text, relations, error));
  REQUIRE(relations.calls.size() == 2U);
  REQUIRE(CallsOf(relations, "frontend", "cart", Transport::kSync) == 1);
  REQUIRE(CallsOf(relations, "cart", "redis-cart", Transport::kSync) == 1);
}

TEST_CASE("Trace exports without a data array are rejected", "[graph][traces]") {
  RelationSet relations;
  std::string error;
  REQUIRE_FALSE(resilab::graph::ParseJaegerTraceText(R"({"traces": []})", relations, error));
  REQUIRE_FALSE(resilab::graph::ParseJaegerTraceText("{broken", relations, error));
  REQUIRE(error.find("invalid trace JSON") != std::string::npos);
}

TEST_CASE("Dependency summaries accept field aliases", "[graph][dependencies]") {
  const std::string text = R"({"data":[
    {"parent": "frontend", "child": "cart", "callCount": 12},
    {"caller": "cart", "callee": "redis-cart", "calls": 3},
    {"p": "frontend", "c": "ad"},
    {"parent": "ad", "child": "ad", "callCount": 5},
    {"parent": "", "child": "ad"}
  ]})";

  RelationSet relations;
  std::string error;
  REQUIRE(resilab::graph::ParseDependencySummaryText(text, relations, error));
  REQUIRE(relations.calls.size() == 3U);
  REQUIRE(CallsOf(relations, "frontend", "cart", Transport::kSync) == 12);
  REQUIRE(CallsOf(relations, "cart", "redis-cart", Transport::kSync) == 3);
  REQUIRE(CallsOf(relations, "frontend", "ad", Transport::kSync) == 1);
}

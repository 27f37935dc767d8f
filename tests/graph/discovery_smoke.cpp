#include "graph/discovery.hpp"
#include "graph/trace_source.hpp"

#include "../common/assertions.hpp"
#include "../common/fakes.hpp"

#include <iostream>
#include <sstream>
#include <string>

using resilab::tests::common::AssertContains;
using resilab::tests::common::AssertTrue;
using resilab::tests::common::Fail;

namespace {

constexpr const char* kFrontendTrace = R"({"data":[{
  "processes": {"p1": {"serviceName": "frontend"}, "p2": {"serviceName": "cartservice"}},
  "spans": [
    {"spanID": "a", "processID": "p1"},
    {"spanID": "b", "processID": "p2", "parentSpanID": "a"}
  ]}]})";

resilab::graph::DiscoveryOptions FastOptions() {
  resilab::graph::DiscoveryOptions options;
  options.lookback = std::chrono::minutes(15);
  options.attempts = 2;
  options.retry_interval = std::chrono::milliseconds(1);
  return options;
}

} // namespace

int main() {
  std::ostringstream log_stream;
  resilab::core::logging::Logger logger(resilab::core::logging::LogLevel::kDebug, log_stream);
  std::string error;

  // Traces available right away.
  {
    resilab::tests::common::FakeTraceSource source;
    source.services = {"frontend", "cartservice"};
    source.traces_by_service["frontend"] = kFrontendTrace;

    resilab::graph::DiscoveryResult result;
    if (!resilab::graph::DiscoverRelations(source, FastOptions(), logger, result, error)) {
      Fail("discovery from traces failed: " + error);
    }
    AssertTrue(result.source == resilab::graph::GraphSource::kTraces, "source should be traces");
    AssertTrue(!result.widened, "no widening needed");
    AssertTrue(source.summary_calls == 0U, "summary must not be consulted");
    AssertTrue(result.relations.calls.size() == 1U, "one frontend -> cart relation");
  }

  // Traces only appear in the widened lookback.
  {
    resilab::tests::common::FakeTraceSource source;
    source.services = {"frontend"};
    source.traces_by_service["frontend"] = kFrontendTrace;
    source.min_trace_lookback = std::chrono::minutes(60);

    resilab::graph::DiscoveryResult result;
    if (!resilab::graph::DiscoverRelations(source, FastOptions(), logger, result, error)) {
      Fail("widened discovery failed: " + error);
    }
    AssertTrue(result.widened, "widened lookback should be used");
    AssertTrue(result.source == resilab::graph::GraphSource::kTraces, "source should be traces");
    AssertTrue(source.lookbacks_seen.size() == 3U, "two rounds plus one widened round");
    AssertTrue(source.lookbacks_seen.back() == std::chrono::minutes(60),
               "widened lookback is at least an hour");
  }

  // No traces at all: the dependency summary takes over.
  {
    resilab::tests::common::FakeTraceSource source;
    source.dependency_summary =
        R"([{"parent": "frontend", "child": "cartservice", "callCount": 4}])";

    resilab::graph::DiscoveryResult result;
    if (!resilab::graph::DiscoverRelations(source, FastOptions(), logger, result, error)) {
      Fail("summary fallback failed: " + error);
    }
    AssertTrue(result.source == resilab::graph::GraphSource::kDependencySummary,
               "source should be the dependency summary");
    AssertTrue(source.summary_calls == 1U, "summary fetched once");
    // The backend listed nothing, so the default demo services were scraped.
    AssertTrue(source.trace_calls ==
                   3U * resilab::graph::DiscoveryOptions::DefaultDemoServices().size(),
               "default demo services should be scraped every round");
    AssertContains(log_stream.str(), "falling back to dependency summary");
    AssertContains(log_stream.str(), "using default service list");
  }

  // Strict mode refuses the summary.
  {
    resilab::tests::common::FakeTraceSource source;
    source.services = {"frontend"};
    source.dependency_summary = R"([{"parent": "frontend", "child": "cart"}])";

    auto options = FastOptions();
    options.strict = true;
    resilab::graph::DiscoveryResult result;
    if (resilab::graph::DiscoverRelations(source, options, logger, result, error)) {
      Fail("strict discovery should fail without traces");
    }
    AssertContains(error, "strict");
    AssertTrue(source.summary_calls == 0U, "strict mode never fetches the summary");
  }

  // Summary unavailable.
  {
    resilab::tests::common::FakeTraceSource source;
    source.services = {"frontend"};
    source.summary_fails = true;
    resilab::graph::DiscoveryResult result;
    if (resilab::graph::DiscoverRelations(source, FastOptions(), logger, result, error)) {
      Fail("discovery should fail when every source is empty");
    }
    AssertContains(error, "dependency summary unavailable");
  }

  const auto bases = resilab::graph::SplitBaseList(" http://a:16686/api/ ,,http://b/api");
  AssertTrue(bases.size() == 2U && bases[0] == "http://a:16686/api" && bases[1] == "http://b/api",
             "base list should be trimmed");
  AssertTrue(resilab::graph::PercentEncode("cart service/v1") == "cart%20service%2Fv1",
             "percent encoding of service names");

  std::cout << "discovery_smoke: ok\n";
  return 0;
}

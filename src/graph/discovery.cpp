#include "graph/discovery.hpp"

#include "core/interrupt.hpp"
#include "graph/trace_parser.hpp"

#include <algorithm>

namespace resilab::graph {

namespace {

constexpr std::chrono::minutes kWidenedLookback{60};

RelationSet CollectTraceRelations(ITraceSource& source, const std::vector<std::string>& services,
                                  std::chrono::minutes lookback, core::logging::Logger& logger) {
  RelationSet relations;
  for (const auto& service : services) {
    std::string body;
    std::string error;
    if (!source.FetchTraces(service, lookback, body, error)) {
      logger.Debug("trace fetch failed", {{"service", service}, {"error", error}});
      continue;
    }
    RelationSet per_service;
    if (!ParseJaegerTraceText(body, per_service, error)) {
      logger.Warn("trace payload rejected", {{"service", service}, {"error", error}});
      continue;
    }
    relations.Merge(per_service);
  }
  return relations;
}

} // namespace

std::vector<std::string> DiscoveryOptions::DefaultDemoServices() {
  return {"checkoutservice", "productcatalogservice", "cartservice",
          "paymentservice",  "recommendationservice", "shippingservice",
          "currencyservice", "adservice",             "emailservice",
          "fraudservice",    "accountingservice",     "frontend"};
}

bool DiscoverRelations(ITraceSource& source, const DiscoveryOptions& options,
                       core::logging::Logger& logger, DiscoveryResult& result,
                       std::string& error) {
  result = DiscoveryResult{};

  std::vector<std::string> services;
  std::string list_error;
  if (!source.ListServices(services, list_error) || services.empty()) {
    logger.Warn("trace backend listed no services; using default service list",
                {{"error", list_error}});
    services = options.fallback_services;
  }

  const int attempts = std::max(1, options.attempts);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    result.relations = CollectTraceRelations(source, services, options.lookback, logger);
    if (!result.relations.empty()) {
      result.source = GraphSource::kTraces;
      logger.Info("relations discovered from traces",
                  {{"relations", std::to_string(result.relations.calls.size())},
                   {"attempt", std::to_string(attempt)}});
      return true;
    }
    logger.Debug("no relations in traces yet", {{"attempt", std::to_string(attempt)}});
    if (attempt < attempts && !core::SleepFor(options.retry_interval, options.cancel)) {
      break;
    }
  }

  const std::chrono::minutes widened = std::max(options.lookback, kWidenedLookback);
  result.widened = true;
  result.relations = CollectTraceRelations(source, services, widened, logger);
  if (!result.relations.empty()) {
    result.source = GraphSource::kTraces;
    logger.Info("relations discovered from traces with widened lookback",
                {{"lookback_min", std::to_string(widened.count())}});
    return true;
  }

  if (options.strict) {
    error = "trace scraping found zero relations and the dependency summary fallback is "
            "disabled (strict)";
    return false;
  }

  logger.Warn("trace scraping found zero relations; falling back to dependency summary",
              {{"lookback_min", std::to_string(widened.count())}});
  std::string body;
  if (!source.FetchDependencySummary(widened, body, error)) {
    error = "dependency summary unavailable: " + error;
    return false;
  }
  if (!ParseDependencySummaryText(body, result.relations, error)) {
    return false;
  }
  if (result.relations.empty()) {
    error = "dependency summary returned no relations";
    return false;
  }
  result.source = GraphSource::kDependencySummary;
  return true;
}

} // namespace resilab::graph

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace resilab::graph {

// Trace backend contract. Bodies are returned as raw JSON text and parsed by
// `trace_parser`.
class ITraceSource {
public:
  virtual ~ITraceSource() = default;

  virtual bool ListServices(std::vector<std::string>& services, std::string& error) = 0;

  virtual bool FetchTraces(const std::string& service, std::chrono::minutes lookback,
                           std::string& body, std::string& error) = 0;

  virtual bool FetchDependencySummary(std::chrono::minutes lookback, std::string& body,
                                      std::string& error) = 0;
};

struct JaegerSourceOptions {
  // Query API bases, tried in order, e.g. `http://localhost:16686/api`.
  std::vector<std::string> bases;
  int timeout_s = 8;
  int trace_limit = 1000;
};

// Jaeger query API reached through the `curl` binary.
class JaegerHttpSource final : public ITraceSource {
public:
  explicit JaegerHttpSource(JaegerSourceOptions options);

  bool ListServices(std::vector<std::string>& services, std::string& error) override;
  bool FetchTraces(const std::string& service, std::chrono::minutes lookback, std::string& body,
                   std::string& error) override;
  bool FetchDependencySummary(std::chrono::minutes lookback, std::string& body,
                              std::string& error) override;

private:
  // Returns the first base that answers `path_and_query` with a JSON body.
  bool GetFromAnyBase(const std::string& path_and_query, std::string& body, std::string& error);

  JaegerSourceOptions options_;
};

// Splits a comma separated base list, trimming whitespace and trailing '/'.
std::vector<std::string> SplitBaseList(const std::string& raw);

std::string PercentEncode(const std::string& raw);

} // namespace resilab::graph

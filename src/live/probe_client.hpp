#pragma once

#include <chrono>
#include <string>

namespace resilab::live {

struct ProbeRequest {
  std::string method = "GET";
  std::string url;
  std::string body;
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

// Outcome of one HTTP request. A transport failure (refused, reset, timed out)
// is reported here, not as a call failure: it is a measurement.
struct ProbeResponse {
  int status = 0;
  double latency_ms = 0.0;
  bool transport_error = false;
  std::string error;
};

// HTTP probing contract. Implementations are called from several collector
// workers at once.
class IProbeClient {
public:
  virtual ~IProbeClient() = default;
  virtual ProbeResponse Execute(const ProbeRequest& request) = 0;
};

// Probes through the `curl` binary; status and timing come from `-w`.
class CurlProbeClient final : public IProbeClient {
public:
  explicit CurlProbeClient(std::string curl_binary = "curl");

  ProbeResponse Execute(const ProbeRequest& request) override;

private:
  std::string curl_binary_;
};

// Parses curl's `-w '%{http_code} %{time_total}'` trailer.
bool ParseCurlWriteOut(const std::string& output, int& status, double& seconds);

} // namespace resilab::live

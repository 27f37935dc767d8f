#include "live/probe_client.hpp"

#include "core/process.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace resilab::live {

bool ParseCurlWriteOut(const std::string& output, int& status, double& seconds) {
  // stderr is folded into the captured output, so the trailer is the last
  // line.
  const std::size_t end = output.find_last_not_of(" \r\n");
  if (end == std::string::npos) {
    return false;
  }
  const std::size_t newline = output.find_last_of('\n', end);
  const std::size_t begin = newline == std::string::npos ? 0U : newline + 1U;
  const std::string last_line = output.substr(begin, end + 1U - begin);
  std::istringstream in(last_line);
  if (!(in >> status >> seconds)) {
    return false;
  }
  return true;
}

CurlProbeClient::CurlProbeClient(std::string curl_binary) : curl_binary_(std::move(curl_binary)) {}

ProbeResponse CurlProbeClient::Execute(const ProbeRequest& request) {
  const double timeout_s = static_cast<double>(request.timeout.count()) / 1000.0;
  std::ostringstream timeout_text;
  timeout_text << timeout_s;

  std::vector<std::string> tokens = {
      core::ShellQuote(curl_binary_),
      "-sS",
      "-o",
      "/dev/null",
      "-w",
      core::ShellQuote("%{http_code} %{time_total}"),
      "-X",
      core::ShellQuote(request.method),
      "--max-time",
      timeout_text.str(),
  };
  if (!request.body.empty()) {
    tokens.push_back("-H");
    tokens.push_back(core::ShellQuote("Content-Type: application/json"));
    tokens.push_back("--data-raw");
    tokens.push_back(core::ShellQuote(request.body));
  }
  tokens.push_back(core::ShellQuote(request.url));

  ProbeResponse response;
  core::CommandResult result;
  std::string error;
  if (!core::RunShellCommand(core::JoinCommand(tokens), result, error)) {
    response.transport_error = true;
    response.error = error;
    return response;
  }

  int status = 0;
  double seconds = 0.0;
  const bool parsed = ParseCurlWriteOut(result.output, status, seconds);
  response.latency_ms = parsed ? seconds * 1000.0 : 0.0;
  // curl reports http_code 000 when no response arrived.
  if (result.exit_code != 0 || !parsed || status == 0) {
    response.transport_error = true;
    response.error = "curl exited with code " + std::to_string(result.exit_code);
    return response;
  }
  response.status = status;
  return response;
}

} // namespace resilab::live

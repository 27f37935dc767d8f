#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace resilab::live {

// Probe accounting for one endpoint in one window. A probe is one full
// workflow run; it succeeds when every step answered without a transport
// error and with a status below 500.
struct EndpointCounts {
  std::size_t attempted = 0;
  std::size_t succeeded = 0;
  std::size_t transport_errors = 0;
  std::size_t server_errors = 0;
};

// Live measurement taken during one chaos window.
struct LiveWindow {
  int window_id = 0;
  double p_fail = 0.0;
  // Semantics mode the window is compared against; `any` matches both.
  std::string mode_label = "any";
  std::map<std::string, EndpointCounts> endpoints;
  // Inherited from the chaos window (stop anomalies observed).
  bool anomalous = false;
  std::size_t killed = 0;
  std::string started_utc;
  std::string finished_utc;
  double reveal_s = 0.0;
  double measure_s = 0.0;

  std::size_t TotalAttempted() const;
  std::size_t TotalSucceeded() const;
};

// Whether a window labelled `mode_label` participates in a comparison for
// `mode` (`blocking` / `non_blocking`).
bool ModeLabelMatches(const std::string& mode_label, const std::string& mode);

// Checks `succeeded + transport_errors + server_errors <= attempted` style
// accounting invariants.
bool ValidateLiveWindow(const LiveWindow& window, std::string& error);

std::string ToJson(const LiveWindow& window);
bool ParseLiveWindow(const std::string& text, LiveWindow& window, std::string& error);

} // namespace resilab::live

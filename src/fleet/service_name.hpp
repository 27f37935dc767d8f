#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace resilab::fleet {

enum class ServiceCategory {
  kEntrypoint,
  kInfrastructure,
  kApplication,
};

const char* ToString(ServiceCategory category);

// Canonical service identity shared by the fleet, the graph and target specs.
//
// - trims and lower-cases
// - unifies `_` to `-`
// - strips one trailing `-service`, `service` or `-svc` suffix, unless that
//   would leave nothing behind
//
// `CheckoutService`, `checkout_service` and `checkout` all map to `checkout`.
std::string NormalizeServiceName(std::string_view raw);

// Built-in infrastructure pattern: proxies, tracing backends, dashboards,
// collectors, load generators and brokers. Matches on a name suffix so
// compose-prefixed names such as `demo-kafka` are caught too.
bool MatchesInfrastructurePattern(std::string_view normalized_service);

// Default entrypoint services of the demo topology.
std::vector<std::string> DefaultEntrypoints();

} // namespace resilab::fleet

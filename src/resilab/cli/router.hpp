#pragma once

namespace resilab::cli {

// Routes `resilab` subcommands and returns process exit codes with a stable
// contract for experiment scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration file invalid (targets, graph, replicas, timing)
//   20 => dependency discovery found nothing usable
//   30 => validate-chaos thresholds not met
int Dispatch(int argc, char** argv);

} // namespace resilab::cli

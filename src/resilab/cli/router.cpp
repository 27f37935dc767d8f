#include "resilab/cli/router.hpp"

#include "artifacts/comparison_report_writer.hpp"
#include "artifacts/live_window_store.hpp"
#include "artifacts/model_estimate_writer.hpp"
#include "artifacts/output_dir_utils.hpp"
#include "chaos/chaos_executor.hpp"
#include "chaos/kill_sampler.hpp"
#include "chaos/window_log.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/interrupt.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "experiment/experiment_runner.hpp"
#include "fleet/docker_platform.hpp"
#include "fleet/eligibility.hpp"
#include "fleet/fleet_inspector.hpp"
#include "fleet/service_name.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/discovery.hpp"
#include "graph/trace_parser.hpp"
#include "graph/trace_source.hpp"
#include "live/probe_client.hpp"
#include "model/reliability_estimator.hpp"
#include "model/replica_map.hpp"
#include "model/target_spec.hpp"
#include "stats/correlator.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace resilab::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitDiscoveryFailed =
    core::errors::ToInt(core::errors::ExitCode::kDiscoveryFailed);
constexpr int kExitValidationFailed =
    core::errors::ToInt(core::errors::ExitCode::kValidationFailed);

constexpr double kPTolerance = 1e-9;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  resilab chaos --p <f> [--disallowlist <file>] [--entrypoints <file>] "
         "[--window-s <n>] [--windows <n>] [--log <file>] [--project <name>] [--fan-out <n>]\n"
      << "  resilab graph (--jaeger <base[,base]> | --traces-file <file> | --deps-file <file>) "
         "--out <graph.json> [--entrypoints <file>] [--lookback-min <n>] [--attempts <n>] "
         "[--strict]\n"
      << "  resilab replicas --out <replicas.json> [--project <name>]\n"
      << "  resilab simulate --graph <file> --p <f> --mode <blocking|non_blocking> --out <file> "
         "[--replicas <file>] [--targets <file> [--endpoint <label>]] [--samples <n>] "
         "[--threads <n>] [--disallowlist <file>] [--entrypoints <file>] "
         "[--estimates-dir <dir>]\n"
      << "  resilab experiment --p <f> --targets <file> --base-url <url> --out <dir> "
         "[--windows <n>] [--window-s <n>] [--reveal-s <n>] [--measure-s <n>] "
         "[--disallowlist <file>] [--entrypoints <file>] [--mode-label <any|blocking|"
         "non_blocking>] [--concurrency <n>] [--max-probes <n>] [--project <name>] "
         "[--wait-ready-s <n>] [--warmup-rounds <n>]\n"
      << "  resilab validate-chaos --targets <file> --base-url <url> --out <dir> [--p <f>] "
         "[--window-s <n>] [--reveal-s <n>] [--measure-s <n>] [--min-kills <n>] "
         "[--max-live <f>] [--disallowlist <file>] [--project <name>] [--wait-ready-s <n>]\n"
      << "  resilab compare --p <f> --dir <artifact dir> [--out <dir>] [--bootstrap <n>] "
         "[--window-log <file>]\n"
      << "  resilab validate-targets <targets.json>\n"
      << "  resilab version\n"
      << "\n"
      << "every command accepts --log-level <" << core::logging::ExpectedLogLevelList() << ">\n";
}

bool ParseDoubleText(std::string_view text, double& value) {
  const std::string owned(text);
  if (owned.empty()) {
    return false;
  }
  char* parse_end = nullptr;
  const double parsed = std::strtod(owned.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseIntText(std::string_view text, long long& value) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end && begin != end;
}

// Flag reader shared by every subcommand. Each command declares its value
// flags and switches up front; anything else is a usage error. A repeated
// value flag keeps the last occurrence.
class FlagReader {
public:
  FlagReader(std::string command, std::set<std::string> value_flags,
             std::set<std::string> switches = {}, std::size_t max_positionals = 0)
      : command_(std::move(command)), value_flags_(std::move(value_flags)),
        switches_(std::move(switches)), max_positionals_(max_positionals) {
    value_flags_.insert("--log-level");
  }

  bool Parse(const std::vector<std::string_view>& args, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string token(args[i]);
      if (switches_.count(token) != 0U) {
        switch_hits_.insert(token);
        continue;
      }
      if (value_flags_.count(token) != 0U) {
        if (i + 1 >= args.size()) {
          error = "missing value for " + token;
          return false;
        }
        values_[token] = std::string(args[i + 1]);
        ++i;
        continue;
      }
      if (!token.empty() && token.front() == '-') {
        error = "unknown option for " + command_ + ": " + token;
        return false;
      }
      if (positionals_.size() >= max_positionals_) {
        error = command_ + " does not accept positional argument: " + token;
        return false;
      }
      positionals_.push_back(token);
    }

    const auto level = values_.find("--log-level");
    if (level != values_.end() &&
        !core::logging::ParseLogLevel(level->second, log_level_, error)) {
      return false;
    }
    return true;
  }

  bool Has(const std::string& flag) const {
    return values_.count(flag) != 0U || switch_hits_.count(flag) != 0U;
  }

  std::string Get(const std::string& flag, const std::string& fallback = "") const {
    const auto it = values_.find(flag);
    return it == values_.end() ? fallback : it->second;
  }

  bool Require(const std::string& flag, std::string& value, std::string& error) const {
    const auto it = values_.find(flag);
    if (it == values_.end() || it->second.empty()) {
      error = command_ + " requires " + flag;
      return false;
    }
    value = it->second;
    return true;
  }

  // Leaves `value` untouched when the flag is absent.
  bool GetDouble(const std::string& flag, double& value, std::string& error) const {
    const auto it = values_.find(flag);
    if (it == values_.end()) {
      return true;
    }
    if (!ParseDoubleText(it->second, value)) {
      error = "invalid number for " + flag + ": " + it->second;
      return false;
    }
    return true;
  }

  bool GetInt(const std::string& flag, long long min_value, long long& value,
              std::string& error) const {
    const auto it = values_.find(flag);
    if (it == values_.end()) {
      return true;
    }
    long long parsed = 0;
    if (!ParseIntText(it->second, parsed) || parsed < min_value) {
      error = "invalid value for " + flag + ": " + it->second + " (expected an integer >= " +
              std::to_string(min_value) + ")";
      return false;
    }
    value = parsed;
    return true;
  }

  bool GetProbability(const std::string& flag, double& value, std::string& error) const {
    if (!GetDouble(flag, value, error)) {
      return false;
    }
    if (value < 0.0 || value > 1.0) {
      error = flag + " must be within [0, 1]";
      return false;
    }
    return true;
  }

  const std::vector<std::string>& positionals() const {
    return positionals_;
  }

  core::logging::LogLevel log_level() const {
    return log_level_;
  }

private:
  std::string command_;
  std::set<std::string> value_flags_;
  std::set<std::string> switches_;
  std::size_t max_positionals_ = 0;
  std::map<std::string, std::string> values_;
  std::set<std::string> switch_hits_;
  std::vector<std::string> positionals_;
  core::logging::LogLevel log_level_ = core::logging::LogLevel::kInfo;
};

// Optional service list flag (disallowlist, entrypoints). Entries come back
// normalized.
bool LoadOptionalServiceList(const FlagReader& flags, const std::string& flag,
                             std::vector<std::string>& services, std::string& error) {
  if (!flags.Has(flag)) {
    return true;
  }
  if (!fleet::LoadServiceList(flags.Get(flag), services, error)) {
    error = flag + ": " + error;
    return false;
  }
  return true;
}

bool LoadTargetsOrReport(const fs::path& path, std::vector<model::TargetSpec>& targets,
                         int& exit_code) {
  model::ValidationReport report;
  std::string error;
  if (!model::LoadTargetSpecs(path, targets, report, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitFailure;
    return false;
  }
  if (!report.valid) {
    std::cerr << "invalid targets: " << path.string() << '\n'
              << model::FormatValidationReport(report);
    exit_code = kExitConfigInvalid;
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "resilab 0.1.0\n";
  return kExitSuccess;
}

int CommandValidateTargets(const std::vector<std::string_view>& args) {
  FlagReader flags("validate-targets", {}, {}, 1);
  std::string error;
  if (!flags.Parse(args, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (flags.positionals().size() != 1U) {
    std::cerr << "error: validate-targets requires exactly 1 argument: <targets.json>\n";
    return kExitUsage;
  }

  const fs::path path(flags.positionals().front());
  std::vector<model::TargetSpec> targets;
  int exit_code = kExitSuccess;
  if (!LoadTargetsOrReport(path, targets, exit_code)) {
    return exit_code;
  }

  std::size_t probed = 0;
  for (const auto& target : targets) {
    if (!target.probe.empty()) {
      ++probed;
    }
  }
  std::cout << "valid: " << path.string() << '\n'
            << "endpoints: " << targets.size() << " (probed: " << probed << ")\n";
  return kExitSuccess;
}

int CommandChaos(const std::vector<std::string_view>& args) {
  FlagReader flags("chaos", {"--p", "--disallowlist", "--entrypoints", "--window-s",
                             "--windows", "--log", "--project", "--fan-out"});
  std::string error;
  double p_fail = 0.0;
  long long window_s = 60;
  long long windows = 1;
  long long fan_out = 4;
  if (!flags.Parse(args, error) || !flags.Has("--p") ||
      !flags.GetProbability("--p", p_fail, error) ||
      !flags.GetInt("--window-s", 1, window_s, error) ||
      !flags.GetInt("--windows", 1, windows, error) ||
      !flags.GetInt("--fan-out", 1, fan_out, error)) {
    std::cerr << "error: " << (error.empty() ? "chaos requires --p" : error) << '\n';
    return kExitUsage;
  }

  fleet::FleetInspectorOptions inspector_options;
  inspector_options.fan_out = static_cast<std::size_t>(fan_out);
  if (!LoadOptionalServiceList(flags, "--disallowlist", inspector_options.disallowlist, error) ||
      !LoadOptionalServiceList(flags, "--entrypoints", inspector_options.entrypoints, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(flags.log_level());
  logger.SetRunId(core::MakeRunId(std::chrono::system_clock::now()));
  core::InstallInterruptHandlers();

  fleet::DockerCliPlatform platform({"docker", flags.Get("--project")});
  fleet::FleetInspector inspector(platform, inspector_options, logger);
  chaos::WindowLogWriter window_log(flags.Get("--log", artifacts::kWindowLogFileName));

  chaos::ChaosConfig config;
  config.p_fail = p_fail;
  config.window = std::chrono::seconds(window_s);
  config.fan_out = static_cast<std::size_t>(fan_out);
  config.cancel = &core::InterruptFlag();
  chaos::ChaosExecutor executor(platform, inspector, window_log, logger, config);

  int completed = 0;
  for (int window_id = 1; window_id <= static_cast<int>(windows); ++window_id) {
    if (core::InterruptRequested()) {
      break;
    }
    chaos::ChaosWindow window;
    if (!executor.RunWindow(window_id, chaos::WindowHooks{}, window, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    ++completed;
    std::cout << "window " << window.window_id << ": eligible=" << window.eligible
              << " killed=" << window.Killed() << " anomalies=" << window.anomalies.size()
              << " restore_failures=" << window.restore_failures.size() << '\n';
    if (window.interrupted) {
      break;
    }
  }

  std::cout << "windows: " << completed << '\n'
            << "window_log: " << window_log.path().string() << '\n';
  if (core::InterruptRequested()) {
    std::cout << "interrupted: true\n";
  }
  return kExitSuccess;
}

int CommandGraph(const std::vector<std::string_view>& args) {
  FlagReader flags("graph", {"--jaeger", "--traces-file", "--deps-file", "--out",
                             "--entrypoints", "--lookback-min", "--attempts"},
                   {"--strict"});
  std::string error;
  std::string out_path;
  long long lookback_min = 30;
  long long attempts = 3;
  if (!flags.Parse(args, error) || !flags.Require("--out", out_path, error) ||
      !flags.GetInt("--lookback-min", 1, lookback_min, error) ||
      !flags.GetInt("--attempts", 1, attempts, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  const int source_count = static_cast<int>(flags.Has("--jaeger")) +
                           static_cast<int>(flags.Has("--traces-file")) +
                           static_cast<int>(flags.Has("--deps-file"));
  if (source_count != 1) {
    std::cerr << "error: graph requires exactly one of --jaeger, --traces-file, --deps-file\n";
    return kExitUsage;
  }

  graph::GraphBuildOptions build_options;
  build_options.entrypoints = fleet::DefaultEntrypoints();
  if (!LoadOptionalServiceList(flags, "--entrypoints", build_options.entrypoints, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(flags.log_level());
  graph::RelationSet relations;
  const bool discovered = flags.Has("--jaeger");

  if (discovered) {
    core::InstallInterruptHandlers();
    graph::JaegerSourceOptions source_options;
    source_options.bases = graph::SplitBaseList(flags.Get("--jaeger"));
    if (source_options.bases.empty()) {
      std::cerr << "error: --jaeger requires at least one base URL\n";
      return kExitUsage;
    }
    graph::JaegerHttpSource source(source_options);

    graph::DiscoveryOptions discovery_options;
    discovery_options.lookback = std::chrono::minutes(lookback_min);
    discovery_options.attempts = static_cast<int>(attempts);
    discovery_options.strict = flags.Has("--strict");
    discovery_options.cancel = &core::InterruptFlag();

    graph::DiscoveryResult discovery;
    if (!graph::DiscoverRelations(source, discovery_options, logger, discovery, error)) {
      std::cerr << "error: dependency discovery failed: " << error << '\n';
      return kExitDiscoveryFailed;
    }
    relations = discovery.relations;
    build_options.source = discovery.source;
  } else if (flags.Has("--traces-file")) {
    std::string text;
    if (!core::ReadTextFile(flags.Get("--traces-file"), text, error) ||
        !graph::ParseJaegerTraceText(text, relations, error)) {
      std::cerr << "error: --traces-file: " << error << '\n';
      return kExitFailure;
    }
    build_options.source = graph::GraphSource::kTraces;
  } else {
    std::string text;
    if (!core::ReadTextFile(flags.Get("--deps-file"), text, error) ||
        !graph::ParseDependencySummaryText(text, relations, error)) {
      std::cerr << "error: --deps-file: " << error << '\n';
      return kExitFailure;
    }
    build_options.source = graph::GraphSource::kDependencySummary;
  }

  graph::DependencyGraph dependency_graph;
  if (!graph::BuildDependencyGraph(relations, build_options, dependency_graph, error)) {
    std::cerr << "error: " << error << '\n';
    return discovered ? kExitDiscoveryFailed : kExitFailure;
  }
  if (!graph::WriteDependencyGraph(out_path, dependency_graph, error)) {
    std::cerr << "error: failed to write graph: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("dependency graph written",
              {{"path", out_path},
               {"services", std::to_string(dependency_graph.services.size())},
               {"edges", std::to_string(dependency_graph.edges.size())},
               {"source", graph::ToString(dependency_graph.source)}});
  std::cout << "graph: " << out_path << '\n'
            << "services: " << dependency_graph.services.size() << '\n'
            << "edges: " << dependency_graph.edges.size()
            << " (async: " << dependency_graph.async_edges.size() << ")\n"
            << "entrypoints: " << dependency_graph.entrypoints.size() << '\n'
            << "source: " << graph::ToString(dependency_graph.source) << '\n';
  return kExitSuccess;
}

int CommandReplicas(const std::vector<std::string_view>& args) {
  FlagReader flags("replicas", {"--out", "--project"});
  std::string error;
  std::string out_path;
  if (!flags.Parse(args, error) || !flags.Require("--out", out_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(flags.log_level());
  fleet::DockerCliPlatform platform({"docker", flags.Get("--project")});
  std::vector<fleet::ContainerInfo> containers;
  if (!platform.ListContainers(containers, error)) {
    std::cerr << "error: failed to list containers: " << error << '\n';
    return kExitFailure;
  }

  model::ReplicaMap replicas;
  replicas.counts = fleet::CountRunningReplicas(containers);
  if (replicas.counts.empty()) {
    logger.Warn("no running containers observed; replicas default to 1",
                {{"project", flags.Get("--project")}});
  }
  if (!model::WriteReplicaMap(out_path, replicas, error)) {
    std::cerr << "error: failed to write replicas: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "replicas: " << out_path << '\n'
            << "services: " << replicas.counts.size() << '\n';
  return kExitSuccess;
}

void PrintEstimate(const model::ModelEstimate& estimate, const fs::path& path) {
  std::cout << "R_model=" << core::FormatFixedDouble(estimate.success_rate, 4)
            << " std_error=" << core::FormatFixedDouble(estimate.std_error, 4)
            << " mode=" << model::ToString(estimate.mode)
            << " p=" << artifacts::FormatPLabel(estimate.p_fail)
            << " scope=" << model::ToString(estimate.scope);
  if (!estimate.endpoint.empty()) {
    std::cout << " endpoint=\"" << estimate.endpoint << '"';
  }
  std::cout << " samples=" << estimate.samples << " population=" << estimate.population
            << " kills_per_trial=" << estimate.kills_per_trial << " -> " << path.string()
            << '\n';
}

int CommandSimulate(const std::vector<std::string_view>& args) {
  FlagReader flags("simulate", {"--graph", "--p", "--mode", "--out", "--replicas", "--targets",
                                "--endpoint", "--samples", "--threads", "--disallowlist",
                                "--entrypoints", "--estimates-dir"});
  std::string error;
  std::string graph_path;
  std::string mode_text;
  std::string out_path;
  model::EstimatorConfig config;
  long long samples = static_cast<long long>(config.samples);
  long long threads = static_cast<long long>(config.threads);
  if (!flags.Parse(args, error) || !flags.Require("--graph", graph_path, error) ||
      !flags.Require("--mode", mode_text, error) || !flags.Require("--out", out_path, error) ||
      !flags.Has("--p") || !flags.GetProbability("--p", config.p_fail, error) ||
      !flags.GetInt("--samples", 1, samples, error) ||
      !flags.GetInt("--threads", 1, threads, error)) {
    std::cerr << "error: " << (error.empty() ? "simulate requires --p" : error) << '\n';
    return kExitUsage;
  }
  if (!model::ParseSemanticsMode(mode_text, config.mode)) {
    std::cerr << "error: invalid --mode '" << mode_text << "' (expected blocking|non_blocking)\n";
    return kExitUsage;
  }
  if (flags.Has("--endpoint") && !flags.Has("--targets")) {
    std::cerr << "error: --endpoint requires --targets\n";
    return kExitUsage;
  }
  config.samples = static_cast<std::size_t>(samples);
  config.threads = static_cast<std::size_t>(threads);

  core::logging::Logger logger(flags.log_level());

  graph::DependencyGraph dependency_graph;
  if (!graph::LoadDependencyGraph(graph_path, dependency_graph, error)) {
    std::cerr << "error: --graph: " << error << '\n';
    return kExitConfigInvalid;
  }

  model::ReplicaMap replicas;
  if (flags.Has("--replicas") && !model::LoadReplicaMap(flags.Get("--replicas"), replicas, error)) {
    std::cerr << "error: --replicas: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::vector<model::TargetSpec> targets;
  if (flags.Has("--targets")) {
    int exit_code = kExitSuccess;
    if (!LoadTargetsOrReport(flags.Get("--targets"), targets, exit_code)) {
      return exit_code;
    }
  }

  std::vector<std::string> disallowlist;
  std::vector<std::string> entrypoints = fleet::DefaultEntrypoints();
  if (!LoadOptionalServiceList(flags, "--disallowlist", disallowlist, error) ||
      !LoadOptionalServiceList(flags, "--entrypoints", entrypoints, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  for (const std::size_t index : dependency_graph.entrypoints) {
    entrypoints.push_back(dependency_graph.services[index]);
  }
  for (const auto& entry : model::DeclaredEntryServices(targets)) {
    entrypoints.push_back(entry);
  }

  std::set<std::string> observed(dependency_graph.services.begin(),
                                 dependency_graph.services.end());
  for (const auto& [service, count] : replicas.counts) {
    (void)count;
    observed.insert(service);
  }
  std::string fallback_reason;
  const fleet::EligibilityPolicy policy = fleet::BuildEligibilityPolicy(
      disallowlist, entrypoints, std::vector<std::string>(observed.begin(), observed.end()),
      fallback_reason);
  if (!fallback_reason.empty() && flags.Has("--disallowlist")) {
    logger.Warn("disallowlist matches no modeled service; using infrastructure patterns",
                {{"reason", fallback_reason}});
  }

  model::ReliabilityEstimator estimator;
  if (!estimator.Prepare(dependency_graph, replicas, policy, targets, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  model::ModelEstimate estimate;
  if (!estimator.Estimate(config, flags.Get("--endpoint"), estimate, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!artifacts::WriteModelEstimateFile(estimate, out_path, error)) {
    std::cerr << "error: failed to write model estimate: " << error << '\n';
    return kExitFailure;
  }
  PrintEstimate(estimate, out_path);

  if (flags.Has("--estimates-dir")) {
    const fs::path estimates_dir(flags.Get("--estimates-dir"));
    for (const auto& endpoint : estimator.endpoints()) {
      model::ModelEstimate endpoint_estimate;
      fs::path written_path;
      if (!estimator.Estimate(config, endpoint, endpoint_estimate, error) ||
          !artifacts::WriteModelEstimate(endpoint_estimate, estimates_dir, written_path, error)) {
        std::cerr << "error: endpoint '" << endpoint << "': " << error << '\n';
        return kExitFailure;
      }
      PrintEstimate(endpoint_estimate, written_path);
    }
  }

  logger.Info("simulation completed",
              {{"mode", model::ToString(config.mode)},
               {"p_fail", core::FormatJsonNumber(config.p_fail)},
               {"R_model", core::FormatJsonNumber(estimate.success_rate)},
               {"population", std::to_string(estimate.population)}});
  return kExitSuccess;
}

struct ExperimentDefaults {
  double p_fail = 0.0;
  bool p_required = true;
  long long window_s = 60;
  long long reveal_s = 15;
  long long measure_s = 30;
};

const std::set<std::string> kExperimentFlags = {
    "--p",           "--targets",       "--base-url",     "--out",         "--windows",
    "--window-s",    "--reveal-s",      "--measure-s",    "--disallowlist", "--entrypoints",
    "--mode-label",  "--concurrency",   "--max-probes",   "--project",     "--fan-out",
    "--probe-timeout-s", "--wait-ready-s", "--warmup-rounds"};

// Shared option wiring for `experiment` and `validate-chaos`. Returns an exit
// code other than success when the invocation or a config file is unusable.
int BuildExperimentConfig(const FlagReader& flags, const ExperimentDefaults& defaults,
                          experiment::ExperimentConfig& config,
                          std::vector<model::TargetSpec>& targets) {
  std::string error;
  std::string targets_path;
  std::string out_dir;
  double p_fail = defaults.p_fail;
  long long windows = 1;
  long long window_s = defaults.window_s;
  long long reveal_s = defaults.reveal_s;
  long long measure_s = defaults.measure_s;
  long long concurrency = 4;
  long long max_probes = 0;
  long long fan_out = 4;
  long long probe_timeout_s = 5;
  long long wait_ready_s = 120;
  long long warmup_rounds = 1;
  if ((defaults.p_required && !flags.Has("--p")) ||
      !flags.GetProbability("--p", p_fail, error) ||
      !flags.Require("--targets", targets_path, error) ||
      !flags.Require("--base-url", config.collector.base_url, error) ||
      !flags.Require("--out", out_dir, error) || !flags.GetInt("--windows", 1, windows, error) ||
      !flags.GetInt("--window-s", 1, window_s, error) ||
      !flags.GetInt("--reveal-s", 0, reveal_s, error) ||
      !flags.GetInt("--measure-s", 1, measure_s, error) ||
      !flags.GetInt("--concurrency", 1, concurrency, error) ||
      !flags.GetInt("--max-probes", 0, max_probes, error) ||
      !flags.GetInt("--fan-out", 1, fan_out, error) ||
      !flags.GetInt("--probe-timeout-s", 1, probe_timeout_s, error) ||
      !flags.GetInt("--wait-ready-s", 0, wait_ready_s, error) ||
      !flags.GetInt("--warmup-rounds", 1, warmup_rounds, error)) {
    std::cerr << "error: " << (error.empty() ? "missing required --p" : error) << '\n';
    return kExitUsage;
  }

  const std::string mode_label = flags.Get("--mode-label", "any");
  model::SemanticsMode parsed_mode = model::SemanticsMode::kBlocking;
  if (mode_label == "any") {
    config.mode_label = mode_label;
  } else if (model::ParseSemanticsMode(mode_label, parsed_mode)) {
    config.mode_label = model::ToString(parsed_mode);
  } else {
    std::cerr << "error: invalid --mode-label '" << mode_label
              << "' (expected any|blocking|non_blocking)\n";
    return kExitUsage;
  }

  if (!LoadOptionalServiceList(flags, "--disallowlist", config.inspector.disallowlist, error) ||
      !LoadOptionalServiceList(flags, "--entrypoints", config.inspector.entrypoints, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  int exit_code = kExitSuccess;
  if (!LoadTargetsOrReport(targets_path, targets, exit_code)) {
    return exit_code;
  }
  // Same protection as `simulate`: declared entries are never chaos victims.
  for (const auto& entry : model::DeclaredEntryServices(targets)) {
    config.inspector.entrypoints.push_back(entry);
  }

  config.chaos.p_fail = p_fail;
  config.chaos.window = std::chrono::seconds(window_s);
  config.chaos.fan_out = static_cast<std::size_t>(fan_out);
  config.chaos.cancel = &core::InterruptFlag();
  config.collector.reveal = std::chrono::seconds(reveal_s);
  config.collector.measure = std::chrono::seconds(measure_s);
  config.collector.concurrency = static_cast<std::size_t>(concurrency);
  config.collector.max_probes = static_cast<std::size_t>(max_probes);
  config.collector.probe_timeout = std::chrono::seconds(probe_timeout_s);
  config.collector.ready_timeout = std::chrono::seconds(wait_ready_s);
  config.collector.ready_rounds = static_cast<std::size_t>(warmup_rounds);
  config.collector.cancel = &core::InterruptFlag();
  config.inspector.fan_out = static_cast<std::size_t>(fan_out);
  config.windows = static_cast<int>(windows);
  config.output_dir = out_dir;

  if (!experiment::ValidateExperimentConfig(config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

int CommandExperiment(const std::vector<std::string_view>& args) {
  FlagReader flags("experiment", kExperimentFlags);
  std::string error;
  if (!flags.Parse(args, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  experiment::ExperimentConfig config;
  std::vector<model::TargetSpec> targets;
  const int config_exit = BuildExperimentConfig(flags, ExperimentDefaults{}, config, targets);
  if (config_exit != kExitSuccess) {
    return config_exit;
  }

  core::logging::Logger logger(flags.log_level());
  core::InstallInterruptHandlers();
  fleet::DockerCliPlatform platform({"docker", flags.Get("--project")});
  live::CurlProbeClient probe_client;
  experiment::ExperimentRunner runner(platform, probe_client, targets, config, logger);

  experiment::ExperimentResult result;
  if (!runner.Run(result, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (std::size_t i = 0; i < result.live_windows.size(); ++i) {
    const live::LiveWindow& window = result.live_windows[i];
    std::cout << "window " << window.window_id << ": killed=" << window.killed
              << " anomalous=" << (window.anomalous ? "true" : "false")
              << " probes=" << window.TotalAttempted() << " ok=" << window.TotalSucceeded()
              << " -> " << result.live_window_paths[i].string() << '\n';
  }
  std::cout << "run_id: " << result.run_id << '\n'
            << "window_log: " << result.window_log_path.string() << '\n'
            << "events: " << result.events_path.string() << '\n';
  if (result.interrupted) {
    std::cout << "interrupted: true\n";
  }
  return kExitSuccess;
}

int CommandValidateChaos(const std::vector<std::string_view>& args) {
  std::set<std::string> value_flags = kExperimentFlags;
  value_flags.insert("--min-kills");
  value_flags.insert("--max-live");
  FlagReader flags("validate-chaos", value_flags);
  std::string error;
  experiment::ChaosValidationThresholds thresholds;
  long long min_kills = static_cast<long long>(thresholds.min_kills);
  if (!flags.Parse(args, error) || !flags.GetInt("--min-kills", 0, min_kills, error) ||
      !flags.GetProbability("--max-live", thresholds.max_live_rate, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (flags.Has("--windows") && flags.Get("--windows") != "1") {
    std::cerr << "error: validate-chaos runs exactly one window\n";
    return kExitUsage;
  }
  thresholds.min_kills = static_cast<std::size_t>(min_kills);

  ExperimentDefaults defaults;
  defaults.p_fail = 1.0;
  defaults.p_required = false;
  defaults.window_s = 30;
  defaults.reveal_s = 5;
  defaults.measure_s = 20;

  experiment::ExperimentConfig config;
  std::vector<model::TargetSpec> targets;
  const int config_exit = BuildExperimentConfig(flags, defaults, config, targets);
  if (config_exit != kExitSuccess) {
    return config_exit;
  }
  config.windows = 1;
  config.command = "validate-chaos";

  core::logging::Logger logger(flags.log_level());
  core::InstallInterruptHandlers();
  fleet::DockerCliPlatform platform({"docker", flags.Get("--project")});
  live::CurlProbeClient probe_client;
  experiment::ExperimentRunner runner(platform, probe_client, targets, config, logger);

  experiment::ExperimentResult result;
  if (!runner.Run(result, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (result.chaos_windows.empty() || result.live_windows.empty()) {
    std::cerr << "error: validation window did not complete\n";
    return kExitFailure;
  }

  const experiment::ChaosValidationOutcome outcome = experiment::EvaluateChaosValidation(
      result.chaos_windows.front(), result.live_windows.front(), thresholds);
  fs::path summary_path;
  if (!experiment::WriteChaosValidationSummary(outcome, thresholds, config.chaos.p_fail,
                                               config.output_dir, summary_path, error)) {
    std::cerr << "error: failed to write validation summary: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "killed: " << outcome.killed << '\n'
            << "R_live: " << core::FormatFixedDouble(outcome.live_rate, 4) << '\n'
            << "summary: " << summary_path.string() << '\n';
  if (!outcome.passed) {
    for (const auto& failure : outcome.failures) {
      logger.Warn("chaos validation failure", {{"detail", failure}});
      std::cerr << "validation failed: " << failure << '\n';
    }
    return kExitValidationFailed;
  }
  std::cout << "validation: pass\n";
  return kExitSuccess;
}

int CommandCompare(const std::vector<std::string_view>& args) {
  FlagReader flags("compare", {"--p", "--dir", "--out", "--bootstrap", "--window-log"});
  std::string error;
  std::string dir;
  double p_fail = 0.0;
  long long bootstrap = 10000;
  if (!flags.Parse(args, error) || !flags.Require("--dir", dir, error) || !flags.Has("--p") ||
      !flags.GetProbability("--p", p_fail, error) ||
      !flags.GetInt("--bootstrap", 1, bootstrap, error)) {
    std::cerr << "error: " << (error.empty() ? "compare requires --p" : error) << '\n';
    return kExitUsage;
  }
  const fs::path artifact_dir(dir);
  const fs::path output_dir(flags.Get("--out", dir));

  core::logging::Logger logger(flags.log_level());

  std::vector<live::LiveWindow> live_windows;
  std::size_t skipped_live = 0;
  if (!artifacts::LoadLiveWindows(artifact_dir, p_fail, kPTolerance, live_windows, skipped_live,
                                  error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (skipped_live > 0U) {
    logger.Warn("skipped unreadable live windows", {{"count", std::to_string(skipped_live)}});
  }
  if (live_windows.empty()) {
    std::cerr << "error: no live windows for p=" << artifacts::FormatPLabel(p_fail) << " in "
              << artifact_dir.string() << '\n';
    return kExitFailure;
  }

  const fs::path window_log_path =
      flags.Get("--window-log", (artifact_dir / artifacts::kWindowLogFileName).string());
  std::error_code ec;
  if (fs::exists(window_log_path, ec)) {
    std::vector<chaos::ChaosWindow> chaos_windows;
    std::size_t skipped_records = 0;
    if (!chaos::ReadWindowLog(window_log_path, chaos_windows, skipped_records, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (skipped_records > 0U) {
      logger.Warn("skipped malformed window log records",
                  {{"count", std::to_string(skipped_records)}});
    }
    stats::ApplyAnomalyFlags(live_windows, chaos_windows, kPTolerance);
  } else if (flags.Has("--window-log")) {
    std::cerr << "error: window log not found: " << window_log_path.string() << '\n';
    return kExitFailure;
  } else {
    logger.Info("no window log; using anomaly flags stored on live windows",
                {{"dir", artifact_dir.string()}});
  }

  std::vector<model::ModelEstimate> estimates;
  std::size_t skipped_models = 0;
  if (!artifacts::LoadModelEstimates(artifact_dir, estimates, skipped_models, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (skipped_models > 0U) {
    logger.Warn("skipped unreadable model estimates",
                {{"count", std::to_string(skipped_models)}});
  }

  stats::CorrelatorOptions options;
  options.bootstrap.resamples = static_cast<std::size_t>(bootstrap);
  options.p_tolerance = kPTolerance;
  std::mt19937_64 rng = chaos::MakeUnseededGenerator();

  artifacts::ComparisonReport report;
  report.p_fail = p_fail;
  report.live_windows = live_windows.size();
  for (const auto& window : live_windows) {
    if (window.anomalous) {
      ++report.anomalous_windows;
    }
  }
  report.bootstrap_resamples = options.bootstrap.resamples;
  report.results = stats::Correlate(live_windows, estimates, p_fail, options, rng);
  if (report.results.empty()) {
    logger.Warn("no endpoint had both a model estimate and live measurements",
                {{"p_fail", core::FormatJsonNumber(p_fail)}});
  }

  fs::path json_path;
  fs::path markdown_path;
  fs::path csv_path;
  if (!artifacts::WriteComparisonJson(report, output_dir, json_path, error) ||
      !artifacts::WriteComparisonMarkdown(report, output_dir, markdown_path, error) ||
      !artifacts::WriteComparisonCsv(report, output_dir, csv_path, error)) {
    std::cerr << "error: failed to write comparison: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "live_windows: " << report.live_windows
            << " (anomalous: " << report.anomalous_windows << ")\n"
            << "results: " << report.results.size() << '\n'
            << "comparison_json: " << json_path.string() << '\n'
            << "comparison_md: " << markdown_path.string() << '\n'
            << "comparison_csv: " << csv_path.string() << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate-targets") {
    return CommandValidateTargets(args);
  }
  if (command == "chaos") {
    return CommandChaos(args);
  }
  if (command == "graph") {
    return CommandGraph(args);
  }
  if (command == "replicas") {
    return CommandReplicas(args);
  }
  if (command == "simulate") {
    return CommandSimulate(args);
  }
  if (command == "experiment") {
    return CommandExperiment(args);
  }
  if (command == "validate-chaos") {
    return CommandValidateChaos(args);
  }
  if (command == "compare") {
    return CommandCompare(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace resilab::cli

#include "live/live_collector.hpp"

#include "core/interrupt.hpp"
#include "core/parallel.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace resilab::live {

bool ValidateCollectorTiming(std::chrono::milliseconds reveal, std::chrono::milliseconds measure,
                             std::chrono::milliseconds window, std::string& error) {
  if (reveal.count() < 0) {
    error = "reveal delay must not be negative";
    return false;
  }
  if (measure.count() <= 0) {
    error = "measurement window must be positive";
    return false;
  }
  if (reveal + measure > window) {
    error = "reveal (" + std::to_string(reveal.count()) + " ms) + measurement (" +
            std::to_string(measure.count()) + " ms) must fit inside the chaos window (" +
            std::to_string(window.count()) + " ms)";
    return false;
  }
  return true;
}

const char* ToString(ReadinessStatus status) {
  switch (status) {
  case ReadinessStatus::kReady:
    return "ready";
  case ReadinessStatus::kTimedOut:
    return "timed_out";
  case ReadinessStatus::kInterrupted:
    return "interrupted";
  }
  return "timed_out";
}

LiveCollector::LiveCollector(IProbeClient& client, const std::vector<model::TargetSpec>& targets,
                             CollectorConfig config, core::logging::Logger& logger)
    : client_(client), config_(std::move(config)), logger_(logger) {
  for (const auto& target : targets) {
    if (!target.probe.empty()) {
      targets_.push_back(target);
    }
  }
}

WorkflowOutcome LiveCollector::RunWorkflow(const model::TargetSpec& target) {
  WorkflowOutcome outcome;
  for (const auto& step : target.probe) {
    ProbeRequest request;
    request.method = step.method;
    request.url = config_.base_url + step.path;
    request.body = step.body;
    request.timeout = config_.probe_timeout;

    const ProbeResponse response = client_.Execute(request);
    if (response.transport_error) {
      outcome.transport_error = true;
      return outcome;
    }
    if (response.status >= 500) {
      outcome.server_error = true;
      return outcome;
    }
  }
  outcome.success = true;
  return outcome;
}

ReadinessStatus LiveCollector::WaitUntilReady(std::string& error) {
  if (config_.ready_timeout.count() <= 0 || targets_.empty()) {
    return ReadinessStatus::kReady;
  }

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + config_.ready_timeout;
  const std::size_t required = std::max<std::size_t>(1U, config_.ready_rounds);
  std::size_t streak = 0;
  std::size_t rounds = 0;
  std::string last_failure;

  for (;;) {
    if (config_.cancel != nullptr && config_.cancel->load()) {
      return ReadinessStatus::kInterrupted;
    }
    ++rounds;
    bool all_green = true;
    for (const auto& target : targets_) {
      const WorkflowOutcome outcome = RunWorkflow(target);
      if (!outcome.success) {
        all_green = false;
        last_failure = target.endpoint +
                       (outcome.transport_error ? " (transport error)" : " (server error)");
        break;
      }
    }
    streak = all_green ? streak + 1U : 0U;
    if (streak >= required) {
      const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      logger_.Info("endpoints ready", {{"rounds", std::to_string(rounds)},
                                       {"waited_ms", std::to_string(waited.count())}});
      return ReadinessStatus::kReady;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    if (!all_green) {
      logger_.Debug("endpoints not ready yet", {{"failing", last_failure}});
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (!core::SleepFor(std::min(config_.ready_interval, remaining), config_.cancel)) {
      return ReadinessStatus::kInterrupted;
    }
  }

  error = "endpoints not ready after " + std::to_string(config_.ready_timeout.count()) +
          " ms (" + std::to_string(rounds) + " rounds)";
  if (!last_failure.empty()) {
    error += "; last failure: " + last_failure;
  }
  return ReadinessStatus::kTimedOut;
}

bool LiveCollector::Collect(int window_id, double p_fail, const std::string& mode_label,
                            LiveWindow& window, std::string& error) {
  if (targets_.empty()) {
    error = "no endpoint declares a probe";
    return false;
  }

  window = LiveWindow{};
  window.window_id = window_id;
  window.p_fail = p_fail;
  window.mode_label = mode_label.empty() ? "any" : mode_label;
  window.reveal_s = static_cast<double>(config_.reveal.count()) / 1000.0;
  window.measure_s = static_cast<double>(config_.measure.count()) / 1000.0;
  for (const auto& target : targets_) {
    window.endpoints[target.endpoint] = EndpointCounts{};
  }

  if (!core::SleepFor(config_.reveal, config_.cancel)) {
    logger_.Warn("reveal delay interrupted; window not measured",
                 {{"window_id", std::to_string(window_id)}});
    window.started_utc = core::FormatUtcTimestamp(std::chrono::system_clock::now());
    window.finished_utc = window.started_utc;
    return true;
  }

  window.started_utc = core::FormatUtcTimestamp(std::chrono::system_clock::now());
  const auto deadline = std::chrono::steady_clock::now() + config_.measure;
  std::atomic<std::size_t> next{0};
  std::mutex counts_mu;

  const std::size_t workers = std::max<std::size_t>(1U, config_.concurrency);
  core::ParallelForEach(workers, workers, [&](std::size_t) {
    while (std::chrono::steady_clock::now() < deadline) {
      if (config_.cancel != nullptr && config_.cancel->load()) {
        return;
      }
      const std::size_t ticket = next.fetch_add(1U);
      if (config_.max_probes != 0U && ticket >= config_.max_probes) {
        return;
      }
      const model::TargetSpec& target = targets_[ticket % targets_.size()];
      const WorkflowOutcome outcome = RunWorkflow(target);

      std::lock_guard<std::mutex> lock(counts_mu);
      EndpointCounts& counts = window.endpoints[target.endpoint];
      ++counts.attempted;
      if (outcome.success) {
        ++counts.succeeded;
      } else if (outcome.transport_error) {
        ++counts.transport_errors;
      } else if (outcome.server_error) {
        ++counts.server_errors;
      }
    }
  });
  window.finished_utc = core::FormatUtcTimestamp(std::chrono::system_clock::now());

  logger_.Info("live window measured", {{"window_id", std::to_string(window_id)},
                                        {"probes", std::to_string(window.TotalAttempted())},
                                        {"succeeded", std::to_string(window.TotalSucceeded())}});
  return ValidateLiveWindow(window, error);
}

} // namespace resilab::live

#include "artifacts/model_estimate_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "model/target_spec.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace resilab::artifacts {

namespace json = core::json;

namespace {

bool ParseScope(const std::string& raw, model::EstimateScope& scope) {
  for (const auto candidate : {model::EstimateScope::kEndpoint, model::EstimateScope::kAllEndpoints,
                               model::EstimateScope::kAggregate}) {
    if (raw == model::ToString(candidate)) {
      scope = candidate;
      return true;
    }
  }
  return false;
}

bool ReadSize(const json::Value& root, std::string_view key, std::size_t& out) {
  const json::Value* field = json::GetField(root, key);
  std::int64_t value = 0;
  if (field == nullptr || !json::TryGetInteger(*field, value) || value < 0) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

} // namespace

std::string ToJson(const model::ModelEstimate& estimate) {
  std::ostringstream out;
  out << "{\n  \"scope\": " << core::QuoteJson(model::ToString(estimate.scope))
      << ",\n  \"endpoint\": " << core::QuoteJson(estimate.endpoint)
      << ",\n  \"mode\": " << core::QuoteJson(model::ToString(estimate.mode))
      << ",\n  \"p_fail\": " << core::FormatJsonNumber(estimate.p_fail)
      << ",\n  \"R_model\": " << core::FormatJsonNumber(estimate.success_rate)
      << ",\n  \"std_dev\": " << core::FormatJsonNumber(estimate.std_dev)
      << ",\n  \"std_error\": " << core::FormatJsonNumber(estimate.std_error)
      << ",\n  \"samples\": " << estimate.samples
      << ",\n  \"successes\": " << estimate.successes
      << ",\n  \"population\": " << estimate.population
      << ",\n  \"kills_per_trial\": " << estimate.kills_per_trial << ",\n  \"generated_utc\": "
      << core::QuoteJson(core::FormatUtcTimestamp(std::chrono::system_clock::now())) << "\n}\n";
  return out.str();
}

bool ParseModelEstimate(const std::string& text, model::ModelEstimate& estimate,
                        std::string& error) {
  json::Value root;
  if (!json::Parse(text, root, error)) {
    error = "invalid model estimate JSON: " + error;
    return false;
  }
  if (root.type != json::Value::Type::kObject) {
    error = "model estimate must be a JSON object";
    return false;
  }

  estimate = model::ModelEstimate{};
  if (!ParseScope(json::GetStringAny(root, {"scope"}), estimate.scope)) {
    error = "model estimate has an unknown 'scope'";
    return false;
  }
  estimate.endpoint = json::GetStringAny(root, {"endpoint"});
  if (estimate.scope == model::EstimateScope::kEndpoint && estimate.endpoint.empty()) {
    error = "endpoint-scoped model estimate is missing 'endpoint'";
    return false;
  }
  if (!model::ParseSemanticsMode(json::GetStringAny(root, {"mode"}), estimate.mode)) {
    error = "model estimate has an unknown 'mode'";
    return false;
  }

  const json::Value* p_fail = json::GetField(root, "p_fail");
  const json::Value* rate = json::GetField(root, "R_model");
  if (!json::IsNumber(p_fail) || !json::IsNumber(rate)) {
    error = "model estimate requires numeric 'p_fail' and 'R_model'";
    return false;
  }
  estimate.p_fail = p_fail->number_value;
  estimate.success_rate = rate->number_value;
  if (estimate.success_rate < 0.0 || estimate.success_rate > 1.0) {
    error = "model estimate 'R_model' must lie in [0, 1]";
    return false;
  }

  const json::Value* std_dev = json::GetField(root, "std_dev");
  estimate.std_dev = json::IsNumber(std_dev) ? std_dev->number_value : 0.0;
  const json::Value* std_error = json::GetField(root, "std_error");
  estimate.std_error = json::IsNumber(std_error) ? std_error->number_value : 0.0;
  (void)ReadSize(root, "samples", estimate.samples);
  (void)ReadSize(root, "successes", estimate.successes);
  (void)ReadSize(root, "population", estimate.population);
  (void)ReadSize(root, "kills_per_trial", estimate.kills_per_trial);
  return true;
}

bool WriteModelEstimate(const model::ModelEstimate& estimate, const fs::path& output_dir,
                        fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }
  const std::string safe_endpoint = estimate.scope == model::EstimateScope::kEndpoint
                                        ? model::SafeEndpointLabel(estimate.endpoint)
                                        : "";
  written_path = output_dir / ModelEstimateFileName(model::ToString(estimate.mode),
                                                    estimate.p_fail, safe_endpoint);
  return WriteModelEstimateFile(estimate, written_path, error);
}

bool WriteModelEstimateFile(const model::ModelEstimate& estimate, const fs::path& output_path,
                            std::string& error) {
  return core::WriteTextFileAtomic(output_path, ToJson(estimate), error);
}

bool LoadModelEstimates(const fs::path& dir, std::vector<model::ModelEstimate>& estimates,
                        std::size_t& skipped, std::string& error) {
  estimates.clear();
  skipped = 0;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    error = "artifact directory not found: " + dir.string();
    return false;
  }

  std::vector<fs::path> paths;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && name.rfind("model_", 0) == 0 &&
        entry.path().extension() == ".json") {
      paths.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed to list '" + dir.string() + "': " + ec.message();
    return false;
  }
  std::sort(paths.begin(), paths.end());

  for (const auto& path : paths) {
    std::string text;
    std::string read_error;
    model::ModelEstimate estimate;
    if (!core::ReadTextFile(path, text, read_error) ||
        !ParseModelEstimate(text, estimate, read_error)) {
      ++skipped;
      continue;
    }
    estimates.push_back(std::move(estimate));
  }
  return true;
}

} // namespace resilab::artifacts

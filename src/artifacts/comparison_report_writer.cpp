#include "artifacts/comparison_report_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <sstream>

namespace fs = std::filesystem;

namespace resilab::artifacts {

namespace {

std::string IntervalJson(const stats::ConfidenceInterval& interval) {
  if (!interval.valid) {
    return "null";
  }
  return "[" + core::FormatJsonNumber(interval.lower) + ", " +
         core::FormatJsonNumber(interval.upper) + "]";
}

std::string IntervalText(const stats::ConfidenceInterval& interval) {
  if (!interval.valid) {
    return "n/a";
  }
  return "[" + core::FormatFixedDouble(interval.lower, 4) + ", " +
         core::FormatFixedDouble(interval.upper, 4) + "]";
}

std::string SignedFixed(double value) {
  return (value >= 0.0 ? "+" : "") + core::FormatFixedDouble(value, 4);
}

std::string PairedJson(const stats::ComparisonResult& result) {
  if (!result.has_paired) {
    return "null";
  }
  const stats::PairedComparison& paired = result.paired;
  std::ostringstream out;
  out << "{\"pairs\": " << paired.pairs
      << ", \"mean_delta_abs_bias\": " << core::FormatJsonNumber(paired.mean_delta_abs_bias)
      << ", \"share_delta_positive\": " << core::FormatJsonNumber(paired.share_delta_positive)
      << ", \"delta_ci95\": " << IntervalJson(paired.delta_ci) << ", \"wilcoxon\": ";
  if (paired.wilcoxon.valid) {
    out << "{\"statistic\": " << core::FormatJsonNumber(paired.wilcoxon.statistic)
        << ", \"z\": " << core::FormatJsonNumber(paired.wilcoxon.z)
        << ", \"p_value\": " << core::FormatJsonNumber(paired.wilcoxon.p_value)
        << ", \"nonzero_pairs\": " << paired.wilcoxon.nonzero_pairs << '}';
  } else {
    out << "null";
  }
  out << ", \"cliffs_delta\": "
      << (paired.cliffs_delta.valid ? core::FormatJsonNumber(paired.cliffs_delta.value) : "null")
      << '}';
  return out.str();
}

std::string BuildJson(const ComparisonReport& report) {
  std::ostringstream out;
  out << "{\n  \"p_fail\": " << core::FormatJsonNumber(report.p_fail)
      << ",\n  \"generated_utc\": "
      << core::QuoteJson(core::FormatUtcTimestamp(std::chrono::system_clock::now()))
      << ",\n  \"live_windows\": " << report.live_windows
      << ",\n  \"anomalous_windows\": " << report.anomalous_windows
      << ",\n  \"bootstrap_resamples\": " << report.bootstrap_resamples
      << ",\n  \"results\": [";
  for (std::size_t i = 0; i < report.results.size(); ++i) {
    const stats::ComparisonResult& result = report.results[i];
    out << (i == 0U ? "\n    " : ",\n    ") << "{\"endpoint\": " << core::QuoteJson(result.endpoint)
        << ", \"variant\": " << core::QuoteJson(stats::ToString(result.variant))
        << ", \"window_ids\": [";
    for (std::size_t w = 0; w < result.window_ids.size(); ++w) {
      out << (w == 0U ? "" : ", ") << result.window_ids[w];
    }
    out << ']';
    if (result.endpoint == stats::kMixEndpoint) {
      out << ", \"endpoints\": " << core::FormatJsonStringArray(result.mix_endpoints);
    }
    out << ", \"modes\": {";
    for (std::size_t m = 0; m < result.modes.size(); ++m) {
      const stats::ModeComparison& mode = result.modes[m];
      out << (m == 0U ? "" : ", ") << core::QuoteJson(model::ToString(mode.mode))
          << ": {\"windows\": " << mode.windows
          << ", \"R_model\": " << core::FormatJsonNumber(mode.model_value)
          << ", \"R_live_mean\": " << core::FormatJsonNumber(mode.mean_live_rate)
          << ", \"mean_bias\": " << core::FormatJsonNumber(mode.mean_bias)
          << ", \"mean_abs_bias\": " << core::FormatJsonNumber(mode.mean_abs_bias)
          << ", \"bias_ci95\": " << IntervalJson(mode.bias_ci) << '}';
    }
    out << "}, \"paired\": " << PairedJson(result) << '}';
  }
  out << (report.results.empty() ? "]\n}\n" : "\n  ]\n}\n");
  return out.str();
}

std::string BuildMarkdown(const ComparisonReport& report) {
  std::ostringstream out;
  out << "# Model vs Live Comparison (p = " << FormatPLabel(report.p_fail) << ")\n\n"
      << "Live windows: " << report.live_windows << " (anomalous: " << report.anomalous_windows
      << ")\n\n";
  if (report.results.empty()) {
    out << "No endpoint had both a model estimate and live measurements.\n";
    return out.str();
  }

  out << "| Endpoint | Variant | Mode | Windows | R_model | R_live | Bias | Abs bias | 95% CI |\n"
      << "| --- | --- | --- | ---: | ---: | ---: | ---: | ---: | --- |\n";
  for (const auto& result : report.results) {
    for (const auto& mode : result.modes) {
      out << "| " << result.endpoint << " | " << stats::ToString(result.variant) << " | "
          << model::ToString(mode.mode) << " | " << mode.windows << " | "
          << core::FormatFixedDouble(mode.model_value, 4) << " | "
          << core::FormatFixedDouble(mode.mean_live_rate, 4) << " | "
          << SignedFixed(mode.mean_bias) << " | " << core::FormatFixedDouble(mode.mean_abs_bias, 4)
          << " | " << IntervalText(mode.bias_ci) << " |\n";
    }
  }

  out << "\n## Blocking vs non-blocking (absolute bias)\n\n"
      << "| Endpoint | Variant | Pairs | Delta | Delta 95% CI | Wilcoxon p | Cliff's delta |\n"
      << "| --- | --- | ---: | ---: | --- | ---: | ---: |\n";
  for (const auto& result : report.results) {
    if (!result.has_paired) {
      continue;
    }
    const stats::PairedComparison& paired = result.paired;
    out << "| " << result.endpoint << " | " << stats::ToString(result.variant) << " | "
        << paired.pairs << " | " << SignedFixed(paired.mean_delta_abs_bias) << " | "
        << IntervalText(paired.delta_ci) << " | "
        << (paired.wilcoxon.valid ? core::FormatFixedDouble(paired.wilcoxon.p_value, 4) : "n/a")
        << " | "
        << (paired.cliffs_delta.valid ? SignedFixed(paired.cliffs_delta.value) : "n/a")
        << " |\n";
  }
  return out.str();
}

std::string BuildCsv(const ComparisonReport& report) {
  std::ostringstream out;
  out << "p_fail,endpoint,variant,mode,windows,R_model,R_live_mean,mean_bias,mean_abs_bias,"
         "bias_ci_low,bias_ci_high,wilcoxon_p,cliffs_delta\n";
  for (const auto& result : report.results) {
    for (const auto& mode : result.modes) {
      out << FormatPLabel(report.p_fail) << ',' << result.endpoint << ','
          << stats::ToString(result.variant) << ',' << model::ToString(mode.mode) << ','
          << mode.windows << ',' << core::FormatJsonNumber(mode.model_value) << ','
          << core::FormatJsonNumber(mode.mean_live_rate) << ','
          << core::FormatJsonNumber(mode.mean_bias) << ','
          << core::FormatJsonNumber(mode.mean_abs_bias) << ','
          << (mode.bias_ci.valid ? core::FormatJsonNumber(mode.bias_ci.lower) : "") << ','
          << (mode.bias_ci.valid ? core::FormatJsonNumber(mode.bias_ci.upper) : "") << ','
          << (result.has_paired && result.paired.wilcoxon.valid
                  ? core::FormatJsonNumber(result.paired.wilcoxon.p_value)
                  : "")
          << ','
          << (result.has_paired && result.paired.cliffs_delta.valid
                  ? core::FormatJsonNumber(result.paired.cliffs_delta.value)
                  : "")
          << '\n';
    }
  }
  return out.str();
}

bool WriteReport(const fs::path& output_dir, const std::string& file_name,
                 const std::string& text, fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }
  written_path = output_dir / file_name;
  return core::WriteTextFileAtomic(written_path, text, error);
}

} // namespace

bool WriteComparisonJson(const ComparisonReport& report, const fs::path& output_dir,
                         fs::path& written_path, std::string& error) {
  return WriteReport(output_dir, ComparisonBaseName(report.p_fail) + ".json", BuildJson(report),
                     written_path, error);
}

bool WriteComparisonMarkdown(const ComparisonReport& report, const fs::path& output_dir,
                             fs::path& written_path, std::string& error) {
  return WriteReport(output_dir, ComparisonBaseName(report.p_fail) + ".md",
                     BuildMarkdown(report), written_path, error);
}

bool WriteComparisonCsv(const ComparisonReport& report, const fs::path& output_dir,
                        fs::path& written_path, std::string& error) {
  return WriteReport(output_dir, ComparisonBaseName(report.p_fail) + ".csv", BuildCsv(report),
                     written_path, error);
}

} // namespace resilab::artifacts

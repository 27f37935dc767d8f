#ifndef RESILAB_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define RESILAB_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace resilab::artifacts {

// Centralized output-dir creation guard used by artifact writers.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Shortest decimal form of a failure fraction for file names (`0.3`, `0.05`).
inline std::string FormatPLabel(double p_fail) {
  std::ostringstream out;
  out << p_fail;
  return out.str();
}

// `model_<mode>_p<p>[_<endpoint>].json`
inline std::string ModelEstimateFileName(std::string_view mode, double p_fail,
                                         std::string_view safe_endpoint) {
  std::string name = "model_" + std::string(mode) + "_p" + FormatPLabel(p_fail);
  if (!safe_endpoint.empty()) {
    name += "_" + std::string(safe_endpoint);
  }
  return name + ".json";
}

// `live_p<p>_w<window>.json`
inline std::string LiveWindowFileName(double p_fail, int window_id) {
  return "live_p" + FormatPLabel(p_fail) + "_w" + std::to_string(window_id) + ".json";
}

// `comparison_p<p>` (extension added per format).
inline std::string ComparisonBaseName(double p_fail) {
  return "comparison_p" + FormatPLabel(p_fail);
}

inline constexpr const char* kWindowLogFileName = "window_log.jsonl";

} // namespace resilab::artifacts

#endif // RESILAB_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

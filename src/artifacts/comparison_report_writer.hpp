#pragma once

#include "stats/correlator.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace resilab::artifacts {

// Comparison payload shared by the JSON/Markdown/CSV writers.
struct ComparisonReport {
  double p_fail = 0.0;
  std::size_t live_windows = 0;
  std::size_t anomalous_windows = 0;
  std::size_t bootstrap_resamples = 0;
  std::vector<stats::ComparisonResult> results;
};

// Emits `comparison_p<p>.json` for machine parsing.
//
// Contract:
// - creates `output_dir` when missing.
// - statistics that could not be computed serialize as null.
bool WriteComparisonJson(const ComparisonReport& report, const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

// Emits `comparison_p<p>.md` for human review.
bool WriteComparisonMarkdown(const ComparisonReport& report,
                             const std::filesystem::path& output_dir,
                             std::filesystem::path& written_path, std::string& error);

// Emits `comparison_p<p>.csv`, one row per (endpoint, variant, mode).
bool WriteComparisonCsv(const ComparisonReport& report, const std::filesystem::path& output_dir,
                        std::filesystem::path& written_path, std::string& error);

} // namespace resilab::artifacts

#pragma once

#include "model/reliability_estimator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace resilab::artifacts {

std::string ToJson(const model::ModelEstimate& estimate);
bool ParseModelEstimate(const std::string& text, model::ModelEstimate& estimate,
                        std::string& error);

// Writes `<output_dir>/model_<mode>_p<p>[_<endpoint>].json` atomically.
bool WriteModelEstimate(const model::ModelEstimate& estimate,
                        const std::filesystem::path& output_dir,
                        std::filesystem::path& written_path, std::string& error);

// Writes a model estimate to an explicit path (CLI `simulate --out`).
bool WriteModelEstimateFile(const model::ModelEstimate& estimate,
                            const std::filesystem::path& output_path, std::string& error);

// Loads every `model_*.json` in `dir`. Files that fail to parse are counted
// in `skipped`.
bool LoadModelEstimates(const std::filesystem::path& dir,
                        std::vector<model::ModelEstimate>& estimates, std::size_t& skipped,
                        std::string& error);

} // namespace resilab::artifacts

#pragma once

#include "live/live_window.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace resilab::artifacts {

// Writes `<output_dir>/live_p<p>_w<window>.json` atomically.
bool WriteLiveWindow(const live::LiveWindow& window, const std::filesystem::path& output_dir,
                     std::filesystem::path& written_path, std::string& error);

// Loads every `live_*.json` in `dir` whose p matches `p_fail` within
// `tolerance`. Files that fail to parse or validate are counted in `skipped`.
bool LoadLiveWindows(const std::filesystem::path& dir, double p_fail, double tolerance,
                     std::vector<live::LiveWindow>& windows, std::size_t& skipped,
                     std::string& error);

} // namespace resilab::artifacts

#include "artifacts/live_window_store.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace fs = std::filesystem;

namespace resilab::artifacts {

bool WriteLiveWindow(const live::LiveWindow& window, const fs::path& output_dir,
                     fs::path& written_path, std::string& error) {
  if (!live::ValidateLiveWindow(window, error)) {
    return false;
  }
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }
  written_path = output_dir / LiveWindowFileName(window.p_fail, window.window_id);
  return core::WriteTextFileAtomic(written_path, live::ToJson(window), error);
}

bool LoadLiveWindows(const fs::path& dir, double p_fail, double tolerance,
                     std::vector<live::LiveWindow>& windows, std::size_t& skipped,
                     std::string& error) {
  windows.clear();
  skipped = 0;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    error = "artifact directory not found: " + dir.string();
    return false;
  }

  std::vector<fs::path> paths;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && name.rfind("live_", 0) == 0 &&
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
    live::LiveWindow window;
    if (!core::ReadTextFile(path, text, read_error) ||
        !live::ParseLiveWindow(text, window, read_error)) {
      ++skipped;
      continue;
    }
    if (std::fabs(window.p_fail - p_fail) > tolerance) {
      continue;
    }
    windows.push_back(std::move(window));
  }
  std::sort(windows.begin(), windows.end(),
            [](const live::LiveWindow& a, const live::LiveWindow& b) {
              return a.window_id < b.window_id;
            });
  return true;
}

} // namespace resilab::artifacts

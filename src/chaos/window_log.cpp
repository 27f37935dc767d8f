#include "chaos/window_log.hpp"

#include "core/fs_utils.hpp"

#include <sstream>
#include <utility>

namespace resilab::chaos {

WindowLogWriter::WindowLogWriter(std::filesystem::path path) : path_(std::move(path)) {}

bool WindowLogWriter::Append(const ChaosWindow& window, std::string& error) {
  const std::string line = ToJson(window);
  std::lock_guard<std::mutex> lock(mu_);
  return core::AppendLine(path_, line, error);
}

bool ReadWindowLog(const std::filesystem::path& path, std::vector<ChaosWindow>& windows,
                   std::size_t& skipped, std::string& error) {
  windows.clear();
  skipped = 0;

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    ChaosWindow window;
    std::string parse_error;
    if (!ParseChaosWindow(line, window, parse_error)) {
      ++skipped;
      continue;
    }
    windows.push_back(std::move(window));
  }
  return true;
}

} // namespace resilab::chaos

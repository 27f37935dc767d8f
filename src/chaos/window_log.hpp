#pragma once

#include "chaos/chaos_window.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace resilab::chaos {

// Append-only writer for `window_log.jsonl`. One instance per run; appends are
// serialized so a window finalizer and a concurrent reader-side flush never
// interleave partial lines.
class WindowLogWriter {
public:
  explicit WindowLogWriter(std::filesystem::path path);

  WindowLogWriter(const WindowLogWriter&) = delete;
  WindowLogWriter& operator=(const WindowLogWriter&) = delete;

  bool Append(const ChaosWindow& window, std::string& error);

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::mutex mu_;
};

// Reads every well-formed record. Malformed lines are counted in `skipped`
// and otherwise ignored; a missing file is an error.
bool ReadWindowLog(const std::filesystem::path& path, std::vector<ChaosWindow>& windows,
                   std::size_t& skipped, std::string& error);

} // namespace resilab::chaos

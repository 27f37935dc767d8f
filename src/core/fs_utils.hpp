#ifndef RESILAB_CORE_FS_UTILS_HPP_
#define RESILAB_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace resilab::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

inline std::string TrimCopy(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& text,
                         std::string& error) {
  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

// Reads a one-entry-per-line list file (disallowlists, entrypoints).
// Blank lines and lines starting with '#' are skipped; entries are trimmed.
inline bool ReadListFile(const std::filesystem::path& input_path, std::vector<std::string>& entries,
                         std::string& error) {
  std::string text;
  if (!ReadTextFile(input_path, text, error)) {
    return false;
  }

  entries.clear();
  std::size_t begin = 0;
  while (begin <= text.size()) {
    std::size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    const std::string line = detail::TrimCopy(std::string_view(text).substr(begin, end - begin));
    if (!line.empty() && line.front() != '#') {
      entries.push_back(line);
    }
    begin = end + 1;
  }
  return true;
}

// Appends exactly one line. Callers that share a file across threads must
// serialize calls themselves.
inline bool AppendLine(const std::filesystem::path& output_path, std::string_view line,
                       std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  std::ofstream out_file(output_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open '" + output_path.string() + "' for append";
    return false;
  }
  out_file << line << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while appending to '" + output_path.string() + "'";
    return false;
  }
  return true;
}

// Writes the full document to a temporary sibling, then renames it into place
// so readers never observe a half-written artifact.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace resilab::core

#endif // RESILAB_CORE_FS_UTILS_HPP_

#pragma once

#include "core/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace resilab::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

namespace detail {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

// Accepted spellings for --log-level. The first entry per level is canonical.
inline constexpr std::array<LevelName, 5> kLevelNames{{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
    const auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
    if (a != b) {
      return false;
    }
  }
  return true;
}

// Values are always double-quoted so service names with spaces or '=' stay
// parseable by `grep`/`awk` pipelines.
inline void AppendQuoted(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    if (c == '\\' || c == '"') {
      line.push_back('\\');
      line.push_back(c);
    } else if (c == '\n') {
      line += "\\n";
    } else if (c == '\r') {
      line += "\\r";
    } else if (c == '\t') {
      line += "\\t";
    } else {
      line.push_back(c);
    }
  }
  line.push_back('"');
}

inline void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key.data(), key.size());
  line.push_back('=');
  AppendQuoted(line, value);
}

} // namespace detail

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  case LogLevel::kInfo:
    break;
  }
  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }
  for (const auto& entry : detail::kLevelNames) {
    if (detail::EqualsIgnoreCase(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }
  error = "invalid --log-level '" + std::string(raw) + "' (expected " +
          ExpectedLogLevelList() + ")";
  return false;
}

// Line-oriented key=value logger shared by the CLI and the experiment
// machinery:
//
//   ts_utc=... level=INFO run_id="..." window="3" msg="service killed" service="cart"
//
// Context fields (see ScopedContext) sit between run_id and msg on every line
// until they are popped. Lines are formatted outside the lock and written
// whole under it, so fan-out workers never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  void SetRunId(std::string run_id) {
    std::lock_guard<std::mutex> lock(mu_);
    run_id_ = std::move(run_id);
  }

  std::string RunId() const {
    std::lock_guard<std::mutex> lock(mu_);
    return run_id_;
  }

  void PushContext(std::string key, std::string value) {
    std::lock_guard<std::mutex> lock(mu_);
    context_.emplace_back(std::move(key), std::move(value));
  }

  void PopContext() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!context_.empty()) {
      context_.pop_back();
    }
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return Enabled(level);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::string tail;
    detail::AppendField(tail, "msg", message);
    for (const auto& field : fields) {
      detail::AppendField(tail, field.key, field.value);
    }
    tail.push_back('\n');

    std::lock_guard<std::mutex> lock(mu_);
    if (!Enabled(level)) {
      return;
    }
    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now()) +
                       " level=" + ToString(level);
    detail::AppendField(line, "run_id", run_id_);
    for (const auto& [key, value] : context_) {
      detail::AppendField(line, key, value);
    }
    line += tail;
    (*out_) << line << std::flush;
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  bool Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string run_id_ = "-";
  std::vector<std::pair<std::string, std::string>> context_;
};

// Tags every line logged while in scope, e.g. with the chaos window number.
class ScopedContext {
public:
  ScopedContext(Logger& logger, std::string key, std::string value) : logger_(logger) {
    logger_.PushContext(std::move(key), std::move(value));
  }
  ~ScopedContext() { logger_.PopContext(); }

  ScopedContext(const ScopedContext&) = delete;
  ScopedContext& operator=(const ScopedContext&) = delete;

private:
  Logger& logger_;
};

} // namespace resilab::core::logging

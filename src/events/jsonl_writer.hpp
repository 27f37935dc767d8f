#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace resilab::events {

inline constexpr const char* kEventsFileName = "events.jsonl";

// Owns the timeline file of one run. Each Append adds exactly one JSON line;
// the parent directory is created on first use. Not thread-safe on its own,
// Emitter serializes callers.
class EventLogWriter {
public:
  explicit EventLogWriter(std::filesystem::path events_path);

  bool Append(const Event& event, std::string& error);

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace resilab::events

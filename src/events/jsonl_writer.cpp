#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace resilab::events {

EventLogWriter::EventLogWriter(std::filesystem::path events_path)
    : path_(std::move(events_path)) {}

bool EventLogWriter::Append(const Event& event, std::string& error) {
  if (path_.empty() || !path_.has_filename()) {
    error = "event log: no timeline path configured";
    return false;
  }
  std::string append_error;
  if (!core::AppendLine(path_, ToJson(event), append_error)) {
    error = "event log " + path_.string() + ": " + append_error;
    return false;
  }
  return true;
}

} // namespace resilab::events

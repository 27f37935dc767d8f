#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace resilab::core {

// Captured result of one shell command. `exit_code` is the decoded process
// exit status (-1 when the process did not exit normally).
struct CommandResult {
  std::string output;
  int exit_code = -1;
};

// Runs `command` through the platform shell with stderr folded into stdout.
//
// Contract:
// - returns false only when the command could not be launched at all.
// - a launched command that exits non-zero still returns true; callers inspect
//   `result.exit_code`.
bool RunShellCommand(const std::string& command, CommandResult& result, std::string& error);

// Single-quotes one argument for a POSIX shell command line.
std::string ShellQuote(std::string_view raw);

// Joins already-quoted tokens with single spaces.
std::string JoinCommand(const std::vector<std::string>& tokens);

} // namespace resilab::core


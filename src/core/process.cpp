#include "core/process.hpp"

#include <cstdio>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace resilab::core {

bool RunShellCommand(const std::string& command, CommandResult& result, std::string& error) {
  result = CommandResult{};
  error.clear();

  const std::string wrapped = command + " 2>&1";
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    result.output.append(buffer);
  }

#if defined(_WIN32)
  result.exit_code = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else {
    result.exit_code = -1;
  }
#endif

  return true;
}

std::string ShellQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string JoinCommand(const std::vector<std::string>& tokens) {
  std::string command;
  for (const auto& token : tokens) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += token;
  }
  return command;
}

} // namespace resilab::core

#include "core/process/command_runner.hpp"

#include <cstdlib>

#include <sys/wait.h>

namespace distrun::core::process {

std::string ShellQuote(std::string_view arg) {
  std::string quoted;
  quoted.reserve(arg.size() + 2U);
  quoted.push_back('\'');
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string BuildCommandLine(const std::vector<std::string>& argv,
                             const std::filesystem::path& working_dir) {
  std::string command;
  if (!working_dir.empty()) {
    command = "cd " + ShellQuote(working_dir.string()) + " && ";
  }
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0U) {
      command.push_back(' ');
    }
    command += ShellQuote(argv[i]);
  }
  return command;
}

bool RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& working_dir,
                int& exit_code, std::string& error) {
  error.clear();
  exit_code = -1;
  if (argv.empty() || argv.front().empty()) {
    error = "command line cannot be empty";
    return false;
  }

  const std::string command = BuildCommandLine(argv, working_dir);
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command: " + command;
    return false;
  }

  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
  return true;
}

} // namespace distrun::core::process

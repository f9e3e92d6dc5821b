#include "collaborators/installer.hpp"

#include "core/process/command_runner.hpp"

#include <utility>

namespace distrun::collaborators {

CommandInstaller::CommandInstaller(std::vector<std::string> command)
    : command_(std::move(command)) {}

bool CommandInstaller::Install(const std::filesystem::path& work_dir, std::string& error) {
  int exit_code = -1;
  if (!core::process::RunCommand(command_, work_dir, exit_code, error)) {
    return false;
  }
  if (exit_code != 0) {
    error = "install command exited with status " + std::to_string(exit_code) + ": " +
            core::process::BuildCommandLine(command_, {});
    return false;
  }
  return true;
}

std::unique_ptr<Installer> MakeCommandInstaller(std::vector<std::string> command) {
  return std::make_unique<CommandInstaller>(std::move(command));
}

} // namespace distrun::collaborators

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace distrun::core::process {

// Quotes one argument for POSIX `sh` using single quotes.
std::string ShellQuote(std::string_view arg);

// Renders `argv` as a shell command line, prefixed with a `cd` into
// `working_dir` when it is non-empty.
std::string BuildCommandLine(const std::vector<std::string>& argv,
                             const std::filesystem::path& working_dir);

// Runs `argv` through the shell with inherited stdio and waits for it.
//
// Contract:
// - Returns false only when the command could not be launched; `error` is set.
// - Otherwise returns true and `exit_code` holds the child's exit status
//   (or the raw wait status when the child did not exit normally).
bool RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& working_dir,
                int& exit_code, std::string& error);

} // namespace distrun::core::process

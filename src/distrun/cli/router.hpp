#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>

namespace distrun::cli {

// Options for one task invocation, shared by `distrun <task>` and in-process
// callers.
struct RunOptions {
  std::string task;
  std::filesystem::path work_dir = ".";
  // Empty means `<work_dir>/distrun.json` when present, else defaults.
  std::filesystem::path project_path;
  bool dry_run = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Resolves the project descriptor, wires the collaborators it names and runs
// `options.task` through the standard task registry. Returns a process exit
// code.
int ExecuteTask(const RunOptions& options);

// Routes `distrun` arguments and returns process exit codes with a stable
// contract for scripts:
//   0       => success
//   1       => filesystem failure during a task
//   2       => usage error (missing/unknown task, invalid flag)
//   10..40  => project descriptor, missing artifact, install, packaging
int Dispatch(int argc, char** argv);

} // namespace distrun::cli

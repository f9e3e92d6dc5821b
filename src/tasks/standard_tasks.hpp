#pragma once

#include "tasks/registry.hpp"
#include "tasks/task.hpp"

#include <string>
#include <string_view>

namespace distrun::tasks {

inline constexpr std::string_view kTaskClean = "clean";
inline constexpr std::string_view kTaskInstall = "install";
inline constexpr std::string_view kTaskDistclean = "distclean";
inline constexpr std::string_view kTaskDist = "dist";

// clean: removes editor/backup files matching the project's clean patterns
// from the top of the working directory.
bool CleanAction(TaskContext& context, TaskError& error);

// install: hands the project to the installer collaborator.
bool InstallAction(TaskContext& context, TaskError& error);

// distclean: removes build-output directories and cache files. A pristine
// tree is a no-op.
bool DistcleanAction(TaskContext& context, TaskError& error);

// dist: stages the manifest into `<project>/`, rotates `<project>.zip` to
// `<project>-old.zip`, archives the staging directory as `<project>.zip` and
// always removes the staging directory afterwards.
bool DistAction(TaskContext& context, TaskError& error);

// Registers the four standard tasks:
//   clean
//   install   <- clean
//   distclean <- clean
//   dist      <- distclean
bool BuildStandardTaskRegistry(TaskRegistry& registry, std::string& error);

} // namespace distrun::tasks

#pragma once

#include "collaborators/archiver.hpp"
#include "collaborators/installer.hpp"
#include "core/logging/logger.hpp"
#include "project/descriptor.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace distrun::tasks {

enum class TaskErrorCode {
  kNone,
  kUnknownTask,
  kFilesystem,
  kInstall,
  kMissingArtifact,
  kPackaging,
};

const char* ToString(TaskErrorCode code);

struct TaskError {
  TaskErrorCode code = TaskErrorCode::kNone;
  // Task whose prerequisite resolution or action failed.
  std::string task;
  std::string message;

  // "task '<task>' failed: <message>"
  std::string Describe() const;
};

enum class TaskState {
  kNotStarted,
  kPrerequisitesRunning,
  kActionRunning,
  kDone,
  kFailed,
};

const char* ToString(TaskState state);

// Everything an action may touch. The runner never inspects it; it only
// hands it through.
struct TaskContext {
  std::filesystem::path work_dir;
  project::ProjectDescriptor project;
  collaborators::Installer* installer = nullptr;
  collaborators::Archiver* archiver = nullptr;
  core::logging::Logger* logger = nullptr;
};

// An action reports failure by returning false with `error.code` and
// `error.message` set. The runner fills in `error.task`.
using TaskAction = std::function<bool(TaskContext& context, TaskError& error)>;

struct TaskDescriptor {
  std::string name;
  std::vector<std::string> prerequisites;
  TaskAction action;
};

} // namespace distrun::tasks

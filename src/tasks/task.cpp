#include "tasks/task.hpp"

namespace distrun::tasks {

const char* ToString(TaskErrorCode code) {
  switch (code) {
  case TaskErrorCode::kNone:
    return "none";
  case TaskErrorCode::kUnknownTask:
    return "unknown_task";
  case TaskErrorCode::kFilesystem:
    return "filesystem";
  case TaskErrorCode::kInstall:
    return "install";
  case TaskErrorCode::kMissingArtifact:
    return "missing_artifact";
  case TaskErrorCode::kPackaging:
    return "packaging";
  }
  return "none";
}

const char* ToString(TaskState state) {
  switch (state) {
  case TaskState::kNotStarted:
    return "not_started";
  case TaskState::kPrerequisitesRunning:
    return "prerequisites_running";
  case TaskState::kActionRunning:
    return "action_running";
  case TaskState::kDone:
    return "done";
  case TaskState::kFailed:
    return "failed";
  }
  return "not_started";
}

std::string TaskError::Describe() const {
  return "task '" + task + "' failed: " + message;
}

} // namespace distrun::tasks

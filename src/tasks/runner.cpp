#include "tasks/runner.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace distrun::tasks {

TaskState RunResult::StateOf(std::string_view task) const {
  const auto it = states.find(std::string(task));
  if (it == states.end()) {
    return TaskState::kNotStarted;
  }
  return it->second;
}

TaskRunner::TaskRunner(const TaskRegistry& registry, TaskContext& context)
    : registry_(registry), context_(context) {}

bool TaskRunner::LookUp(std::string_view task_name, const TaskDescriptor*& task,
                        TaskError& error) const {
  task = registry_.Find(task_name);
  if (task != nullptr) {
    return true;
  }

  std::string expected;
  for (const auto& name : registry_.Names()) {
    if (!expected.empty()) {
      expected += "|";
    }
    expected += name;
  }
  error.code = TaskErrorCode::kUnknownTask;
  error.task = std::string(task_name);
  error.message = "unknown task (expected " + expected + ")";
  return false;
}

bool TaskRunner::Plan(std::string_view task_name, std::vector<std::string>& order,
                      TaskError& error) const {
  order.clear();
  const TaskDescriptor* task = nullptr;
  if (!LookUp(task_name, task, error)) {
    return false;
  }
  AppendPlan(*task, order);
  return true;
}

void TaskRunner::AppendPlan(const TaskDescriptor& task, std::vector<std::string>& order) const {
  if (std::find(order.begin(), order.end(), task.name) != order.end()) {
    return;
  }
  for (const auto& prerequisite : task.prerequisites) {
    // Registry construction guarantees every prerequisite resolves.
    AppendPlan(*registry_.Find(prerequisite), order);
  }
  order.push_back(task.name);
}

bool TaskRunner::Run(std::string_view task_name, RunResult& result, TaskError& error) {
  result = RunResult{};
  error = TaskError{};

  const TaskDescriptor* task = nullptr;
  if (!LookUp(task_name, task, error)) {
    if (context_.logger != nullptr) {
      context_.logger->Error("unknown task", {{"requested", task_name}});
    }
    return false;
  }
  return Resolve(*task, result, error);
}

bool TaskRunner::Resolve(const TaskDescriptor& task, RunResult& result, TaskError& error) {
  if (result.StateOf(task.name) == TaskState::kDone) {
    return true;
  }

  core::logging::ScopedTaskContext log_scope(context_.logger, task.name);
  core::logging::Logger* logger = context_.logger;

  result.states[task.name] = TaskState::kPrerequisitesRunning;
  for (const auto& prerequisite : task.prerequisites) {
    if (!Resolve(*registry_.Find(prerequisite), result, error)) {
      result.states[task.name] = TaskState::kFailed;
      if (logger != nullptr) {
        logger->Error("prerequisite failed", {{"prerequisite", prerequisite}});
      }
      return false;
    }
  }

  result.states[task.name] = TaskState::kActionRunning;
  if (logger != nullptr) {
    logger->Info("task started");
  }

  const auto started_at = std::chrono::steady_clock::now();
  TaskError action_error;
  if (!task.action(context_, action_error)) {
    result.states[task.name] = TaskState::kFailed;
    error = std::move(action_error);
    error.task = task.name;
    if (logger != nullptr) {
      logger->Error("task failed",
                    {{"error_code", ToString(error.code)}, {"error", error.message}});
    }
    return false;
  }

  result.states[task.name] = TaskState::kDone;
  result.executed.push_back(task.name);
  if (logger != nullptr) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    logger->Info("task finished", {{"elapsed_ms", std::to_string(elapsed.count())}});
  }
  return true;
}

} // namespace distrun::tasks

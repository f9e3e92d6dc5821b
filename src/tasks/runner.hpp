#pragma once

#include "tasks/registry.hpp"
#include "tasks/task.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace distrun::tasks {

struct RunResult {
  // Tasks whose action ran, in execution order.
  std::vector<std::string> executed;
  // Final state of every task the run touched.
  std::map<std::string, TaskState> states;

  TaskState StateOf(std::string_view task) const;
};

// Resolves a target task against a registry and runs it.
//
// Resolution is depth-first: prerequisites run in declaration order before
// the task's own action, and each task runs at most once per Run() call even
// when several tasks depend on it. The first failure stops the run; no
// sibling or dependent task executes afterwards.
class TaskRunner {
public:
  TaskRunner(const TaskRegistry& registry, TaskContext& context);

  // Execution order Run() would use, without running anything.
  bool Plan(std::string_view task_name, std::vector<std::string>& order,
            TaskError& error) const;

  // Unknown names fail with kUnknownTask before any action runs.
  bool Run(std::string_view task_name, RunResult& result, TaskError& error);

private:
  bool Resolve(const TaskDescriptor& task, RunResult& result, TaskError& error);
  void AppendPlan(const TaskDescriptor& task, std::vector<std::string>& order) const;
  bool LookUp(std::string_view task_name, const TaskDescriptor*& task, TaskError& error) const;

  const TaskRegistry& registry_;
  TaskContext& context_;
};

} // namespace distrun::tasks

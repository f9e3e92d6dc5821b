#pragma once

#include "tasks/task.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace distrun::tasks {

// Ordered, immutable set of task descriptors.
//
// The prerequisite graph is acyclic by construction: Create() only accepts a
// prerequisite that names a task registered earlier in the list.
class TaskRegistry {
public:
  TaskRegistry() = default;

  // Validates and takes ownership of `descriptors`.
  // Rejects empty or duplicate names, missing actions, and prerequisites that
  // are unknown or not yet registered.
  static bool Create(std::vector<TaskDescriptor> descriptors, TaskRegistry& registry,
                     std::string& error);

  const TaskDescriptor* Find(std::string_view name) const;

  bool Contains(std::string_view name) const {
    return Find(name) != nullptr;
  }

  std::vector<std::string> Names() const;

  const std::vector<TaskDescriptor>& Descriptors() const {
    return descriptors_;
  }

private:
  explicit TaskRegistry(std::vector<TaskDescriptor> descriptors)
      : descriptors_(std::move(descriptors)) {}

  std::vector<TaskDescriptor> descriptors_;
};

} // namespace distrun::tasks
